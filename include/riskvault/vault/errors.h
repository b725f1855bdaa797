// RISKVAULT - Vault Error Codes
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Every rejected transaction surfaces exactly one VaultError. A rejected
// transaction has no observable effect.

#ifndef RISKVAULT_VAULT_ERRORS_H
#define RISKVAULT_VAULT_ERRORS_H

#include <cstdint>
#include <ostream>

namespace riskvault {
namespace vault {

// ============================================================================
// Error Codes
// ============================================================================

enum class VaultError : uint8_t {
    None = 0,
    
    // Authorization
    NotAuthorized,
    UnauthorizedAccount,
    OnlyVault,
    NotTokenOwner,
    NotApproved,
    
    // Lifecycle / availability
    ContractPaused,
    PassportNFTNotSet,
    InvalidVaultAddress,
    InvalidVerifierAddress,
    
    // Input validity
    ZeroAddress,
    InvalidBlockHeight,
    ScoreExceedsMaximum,
    InvalidPeriod,
    IntervalTooLong,
    InvalidLimit,
    
    // Replay / uniqueness
    NullifierAlreadyUsed,
    InvalidCommitment,
    PassportAlreadyExists,
    
    // Throttling
    RateLimited,
    DailyLimitExceeded,
    
    // Freshness
    RiskScoreExpired,
    PassportExpired,
    PassportRevoked,
    
    // Cryptographic
    InvalidProof,
    CommitmentNotInVault,
    
    // Not found
    CommitmentNotFound,
    PassportNotFound,
};

/// Coarse classification of rejections
enum class VaultErrorCategory : uint8_t {
    None = 0,
    Authorization,
    Lifecycle,
    InputValidity,
    Replay,
    Throttling,
    Freshness,
    Cryptographic,
    NotFound,
};

/// Machine-matchable identifier (e.g. "NullifierAlreadyUsed")
const char* VaultErrorToString(VaultError error);

/// Human-readable message (e.g. "Passport does not exist")
const char* VaultErrorMessage(VaultError error);

VaultErrorCategory GetErrorCategory(VaultError error);

const char* VaultErrorCategoryToString(VaultErrorCategory category);

inline std::ostream& operator<<(std::ostream& os, VaultError error) {
    return os << VaultErrorToString(error);
}

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_ERRORS_H
