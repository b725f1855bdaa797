// RISKVAULT - Vault Error Codes
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/errors.h"

namespace riskvault {
namespace vault {

const char* VaultErrorToString(VaultError error) {
    switch (error) {
        case VaultError::None:                   return "None";
        case VaultError::NotAuthorized:          return "NotAuthorized";
        case VaultError::UnauthorizedAccount:    return "UnauthorizedAccount";
        case VaultError::OnlyVault:              return "OnlyVault";
        case VaultError::NotTokenOwner:          return "NotTokenOwner";
        case VaultError::NotApproved:            return "NotApproved";
        case VaultError::ContractPaused:         return "ContractPaused";
        case VaultError::PassportNFTNotSet:      return "PassportNFTNotSet";
        case VaultError::InvalidVaultAddress:    return "InvalidVaultAddress";
        case VaultError::InvalidVerifierAddress: return "InvalidVerifierAddress";
        case VaultError::ZeroAddress:            return "ZeroAddress";
        case VaultError::InvalidBlockHeight:     return "InvalidBlockHeight";
        case VaultError::ScoreExceedsMaximum:    return "ScoreExceedsMaximum";
        case VaultError::InvalidPeriod:          return "InvalidPeriod";
        case VaultError::IntervalTooLong:        return "IntervalTooLong";
        case VaultError::InvalidLimit:           return "InvalidLimit";
        case VaultError::NullifierAlreadyUsed:   return "NullifierAlreadyUsed";
        case VaultError::InvalidCommitment:      return "InvalidCommitment";
        case VaultError::PassportAlreadyExists:  return "PassportAlreadyExists";
        case VaultError::RateLimited:            return "RateLimited";
        case VaultError::DailyLimitExceeded:     return "DailyLimitExceeded";
        case VaultError::RiskScoreExpired:       return "RiskScoreExpired";
        case VaultError::PassportExpired:        return "PassportExpired";
        case VaultError::PassportRevoked:        return "PassportRevoked";
        case VaultError::InvalidProof:           return "InvalidProof";
        case VaultError::CommitmentNotInVault:   return "CommitmentNotInVault";
        case VaultError::CommitmentNotFound:     return "CommitmentNotFound";
        case VaultError::PassportNotFound:       return "PassportNotFound";
    }
    return "Unknown";
}

const char* VaultErrorMessage(VaultError error) {
    switch (error) {
        case VaultError::None:                   return "Success";
        case VaultError::NotAuthorized:          return "Caller is not authorized";
        case VaultError::UnauthorizedAccount:    return "Caller is not the owner";
        case VaultError::OnlyVault:              return "Only the vault may call this";
        case VaultError::NotTokenOwner:          return "From address does not own the token";
        case VaultError::NotApproved:            return "Caller is not owner nor approved";
        case VaultError::ContractPaused:         return "Contract is paused";
        case VaultError::PassportNFTNotSet:      return "Passport registry not set";
        case VaultError::InvalidVaultAddress:    return "Invalid vault address";
        case VaultError::InvalidVerifierAddress: return "Verifier not set";
        case VaultError::ZeroAddress:            return "Zero address";
        case VaultError::InvalidBlockHeight:     return "Invalid block height";
        case VaultError::ScoreExceedsMaximum:    return "Score exceeds maximum";
        case VaultError::InvalidPeriod:          return "Invalid period";
        case VaultError::IntervalTooLong:        return "Interval too long";
        case VaultError::InvalidLimit:           return "Invalid limit";
        case VaultError::NullifierAlreadyUsed:   return "Nullifier already used";
        case VaultError::InvalidCommitment:      return "Invalid or duplicate commitment";
        case VaultError::PassportAlreadyExists:  return "Passport already exists for commitment";
        case VaultError::RateLimited:            return "Rate limited";
        case VaultError::DailyLimitExceeded:     return "Daily verification limit exceeded";
        case VaultError::RiskScoreExpired:       return "Risk score expired";
        case VaultError::PassportExpired:        return "Passport expired";
        case VaultError::PassportRevoked:        return "Passport revoked";
        case VaultError::InvalidProof:           return "Invalid proof";
        case VaultError::CommitmentNotInVault:   return "Commitment not in vault";
        case VaultError::CommitmentNotFound:     return "Commitment does not exist";
        case VaultError::PassportNotFound:       return "Passport does not exist";
    }
    return "Unknown error";
}

VaultErrorCategory GetErrorCategory(VaultError error) {
    switch (error) {
        case VaultError::None:
            return VaultErrorCategory::None;
        case VaultError::NotAuthorized:
        case VaultError::UnauthorizedAccount:
        case VaultError::OnlyVault:
        case VaultError::NotTokenOwner:
        case VaultError::NotApproved:
            return VaultErrorCategory::Authorization;
        case VaultError::ContractPaused:
        case VaultError::PassportNFTNotSet:
        case VaultError::InvalidVaultAddress:
        case VaultError::InvalidVerifierAddress:
            return VaultErrorCategory::Lifecycle;
        case VaultError::ZeroAddress:
        case VaultError::InvalidBlockHeight:
        case VaultError::ScoreExceedsMaximum:
        case VaultError::InvalidPeriod:
        case VaultError::IntervalTooLong:
        case VaultError::InvalidLimit:
            return VaultErrorCategory::InputValidity;
        case VaultError::NullifierAlreadyUsed:
        case VaultError::InvalidCommitment:
        case VaultError::PassportAlreadyExists:
            return VaultErrorCategory::Replay;
        case VaultError::RateLimited:
        case VaultError::DailyLimitExceeded:
            return VaultErrorCategory::Throttling;
        case VaultError::RiskScoreExpired:
        case VaultError::PassportExpired:
        case VaultError::PassportRevoked:
            return VaultErrorCategory::Freshness;
        case VaultError::InvalidProof:
        case VaultError::CommitmentNotInVault:
            return VaultErrorCategory::Cryptographic;
        case VaultError::CommitmentNotFound:
        case VaultError::PassportNotFound:
            return VaultErrorCategory::NotFound;
    }
    return VaultErrorCategory::None;
}

const char* VaultErrorCategoryToString(VaultErrorCategory category) {
    switch (category) {
        case VaultErrorCategory::None:          return "None";
        case VaultErrorCategory::Authorization: return "Authorization";
        case VaultErrorCategory::Lifecycle:     return "Lifecycle";
        case VaultErrorCategory::InputValidity: return "InputValidity";
        case VaultErrorCategory::Replay:        return "Replay";
        case VaultErrorCategory::Throttling:    return "Throttling";
        case VaultErrorCategory::Freshness:     return "Freshness";
        case VaultErrorCategory::Cryptographic: return "Cryptographic";
        case VaultErrorCategory::NotFound:      return "NotFound";
    }
    return "Unknown";
}

} // namespace vault
} // namespace riskvault
