// RISKVAULT - Cross-Contract Interfaces
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// The vault and the passport registry know each other only through these
// interfaces and each other's address. Each side checks the caller on
// every privileged entry and re-validates referenced state.

#ifndef RISKVAULT_VAULT_INTERFACES_H
#define RISKVAULT_VAULT_INTERFACES_H

#include "riskvault/core/types.h"
#include "riskvault/vault/context.h"
#include "riskvault/vault/errors.h"
#include "riskvault/vault/riskband.h"

namespace riskvault {
namespace vault {

// ============================================================================
// Results
// ============================================================================

/// Outcome of SubmitRiskAnalysis
struct SubmitResult {
    VaultError error{VaultError::None};
    RiskBand band{RiskBand::Unknown};
    TokenId tokenId{0};
    
    bool ok() const { return error == VaultError::None; }
    
    static SubmitResult Success(RiskBand b, TokenId id) {
        SubmitResult r;
        r.band = b;
        r.tokenId = id;
        return r;
    }
    
    static SubmitResult Failure(VaultError e) {
        SubmitResult r;
        r.error = e;
        return r;
    }
};

/// Outcome of a threshold verification
struct VerifyResult {
    VaultError error{VaultError::None};
    bool below{false};
    
    bool ok() const { return error == VaultError::None; }
    
    static VerifyResult Success(bool b) {
        VerifyResult r;
        r.below = b;
        return r;
    }
    
    static VerifyResult Failure(VaultError e) {
        VerifyResult r;
        r.error = e;
        return r;
    }
};

/// Outcome of MintFromVault
struct MintResult {
    VaultError error{VaultError::None};
    TokenId tokenId{0};
    Timestamp expiry{0};
    
    bool ok() const { return error == VaultError::None; }
    
    static MintResult Success(TokenId id, Timestamp exp) {
        MintResult r;
        r.tokenId = id;
        r.expiry = exp;
        return r;
    }
    
    static MintResult Failure(VaultError e) {
        MintResult r;
        r.error = e;
        return r;
    }
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * What the passport registry needs from the score vault.
 */
class IScoreVault {
public:
    virtual ~IScoreVault() = default;
    
    virtual const Address& GetAddress() const = 0;
    virtual bool IsPaused() const = 0;
    virtual bool CommitmentExists(const CommitmentHash& commitment) const = 0;
    virtual RiskBand GetCommitmentRiskBand(const CommitmentHash& commitment) const = 0;
    
    /// ctx.sender is the registry; the daily cap is charged to ctx.origin
    virtual VerifyResult VerifyRiskThreshold(const CallContext& ctx,
                                             const CommitmentHash& commitment,
                                             uint32_t threshold,
                                             const Bytes& proof) = 0;
};

/**
 * What the score vault needs from the passport registry.
 */
class IPassportMinter {
public:
    virtual ~IPassportMinter() = default;
    
    virtual const Address& GetAddress() const = 0;
    
    /// ctx.sender must be the vault
    virtual MintResult MintFromVault(const CallContext& ctx,
                                     const CommitmentHash& commitment,
                                     const Address& recipient) = 0;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_INTERFACES_H
