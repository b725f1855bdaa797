// RISKVAULT - Passport Registry
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Non-fungible passport tokens, one per recorded commitment. Tokens are
// minted only by the vault, expire after a fixed lifetime and can be
// revoked by the registry owner without being burned.

#ifndef RISKVAULT_VAULT_PASSPORT_H
#define RISKVAULT_VAULT_PASSPORT_H

#include "riskvault/core/serialize.h"
#include "riskvault/core/types.h"
#include "riskvault/vault/context.h"
#include "riskvault/vault/errors.h"
#include "riskvault/vault/events.h"
#include "riskvault/vault/interfaces.h"
#include "riskvault/vault/riskband.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace riskvault {
namespace vault {

// ============================================================================
// Passport
// ============================================================================

struct Passport {
    Address owner;
    
    /// Fixed at mint, survives transfers
    CommitmentHash commitment;
    
    Timestamp mintTime{0};
    Timestamp expiry{0};
    
    bool revoked{false};
    std::string revokeReason;
    
    /// now < expiry && !revoked
    bool IsValidAt(Timestamp now) const { return now < expiry && !revoked; }
};

template<typename Stream>
void Serialize(Stream& s, const Passport& p) {
    Serialize(s, p.owner);
    Serialize(s, p.commitment);
    Serialize(s, p.mintTime);
    Serialize(s, p.expiry);
    Serialize(s, p.revoked);
    Serialize(s, p.revokeReason);
}

template<typename Stream>
void Unserialize(Stream& s, Passport& p) {
    Unserialize(s, p.owner);
    Unserialize(s, p.commitment);
    Unserialize(s, p.mintTime);
    Unserialize(s, p.expiry);
    Unserialize(s, p.revoked);
    Unserialize(s, p.revokeReason);
}

/// Result of IsPassportValid
struct PassportValidity {
    bool valid{false};
    Timestamp expiry{0};
};

/// Mutable registry configuration, as persisted
struct RegistryConfigState {
    Address owner;
    Duration validityPeriod{0};
    TokenId nextTokenId{0};
};

template<typename Stream>
void Serialize(Stream& s, const RegistryConfigState& cfg) {
    Serialize(s, cfg.owner);
    Serialize(s, cfg.validityPeriod);
    Serialize(s, cfg.nextTokenId);
}

template<typename Stream>
void Unserialize(Stream& s, RegistryConfigState& cfg) {
    Unserialize(s, cfg.owner);
    Unserialize(s, cfg.validityPeriod);
    Unserialize(s, cfg.nextTokenId);
}

// ============================================================================
// Passport Registry
// ============================================================================

class PassportRegistry : public IPassportMinter {
public:
    /**
     * Deploy a registry bound to a vault.
     * @param vault Vault trusted to mint; must outlive the registry
     * @param validityPeriod Passport lifetime (1 to 365 days)
     * @return InvalidVaultAddress for a missing vault, InvalidPeriod for a
     *         bad lifetime, else the registry
     */
    static std::pair<VaultError, std::unique_ptr<PassportRegistry>> Deploy(
        const Address& address, const Address& owner, IScoreVault* vault,
        Duration validityPeriod, EventLog& events);
    
    // ========================================================================
    // Minting and Verification
    // ========================================================================
    
    /// Vault-only. Mints the next token id to recipient.
    MintResult MintFromVault(const CallContext& ctx, const CommitmentHash& commitment,
                             const Address& recipient) override;
    
    /// Threshold query by token. The vault charges ctx.origin.
    VerifyResult VerifyRiskThreshold(const CallContext& ctx, TokenId tokenId,
                                     uint32_t threshold, const Bytes& proof);
    
    // ========================================================================
    // Administration (owner only, UnauthorizedAccount otherwise; ContractPaused
    // while the vault is paused)
    // ========================================================================
    
    VaultError RevokePassport(const CallContext& ctx, TokenId tokenId, const std::string& reason);
    VaultError SetValidityPeriod(const CallContext& ctx, Duration period);
    VaultError TransferOwnership(const CallContext& ctx, const Address& newOwner);
    
    // ========================================================================
    // Token Transfers
    // ========================================================================
    
    VaultError TransferFrom(const CallContext& ctx, const Address& from, const Address& to,
                            TokenId tokenId);
    VaultError Approve(const CallContext& ctx, const Address& approved, TokenId tokenId);
    VaultError SetApprovalForAll(const CallContext& ctx, const Address& operatorAddr, bool approved);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    const Address& GetAddress() const override { return address_; }
    const Address& GetOwner() const { return owner_; }
    const Address& GetVaultAddress() const { return vault_->GetAddress(); }
    Duration GetValidityPeriod() const { return validityPeriod_; }
    
    /// Pause state of the vault
    bool IsPaused() const { return vault_->IsPaused(); }
    
    PassportValidity IsPassportValid(TokenId tokenId, Timestamp now) const;
    std::optional<Passport> GetPassport(TokenId tokenId) const;
    std::optional<CommitmentHash> GetPassportCommitment(TokenId tokenId) const;
    std::optional<Address> GetPassportHolder(TokenId tokenId) const;
    
    /// Band held by the vault for the token's commitment; UNKNOWN if absent
    RiskBand GetPassportRiskBand(TokenId tokenId) const;
    
    std::optional<TokenId> GetTokenByCommitment(const CommitmentHash& commitment) const;
    bool HasPassport(const CommitmentHash& commitment) const {
        return commitmentToToken_.count(commitment) > 0;
    }
    
    std::optional<Address> OwnerOf(TokenId tokenId) const { return GetPassportHolder(tokenId); }
    uint64_t BalanceOf(const Address& account) const;
    uint64_t TotalSupply() const { return passports_.size(); }
    TokenId NextTokenId() const { return nextTokenId_; }
    
    /// Null address when no single-token approval is set
    Address GetApproved(TokenId tokenId) const;
    bool IsApprovedForAll(const Address& owner, const Address& operatorAddr) const;
    
    // ========================================================================
    // State Access for Persistence
    // ========================================================================
    
    RegistryConfigState GetConfigState() const;
    
    /// Drop passports and approvals before a reload
    void ClearState();
    
    void RestoreConfigState(const RegistryConfigState& cfg);
    void RestorePassport(TokenId tokenId, const Passport& passport);
    void RestoreApproval(TokenId tokenId, const Address& approved);
    void RestoreOperatorApproval(const Address& owner, const Address& operatorAddr);
    
    const std::map<Address, std::set<Address>>& GetOperatorApprovals() const {
        return operatorApprovals_;
    }

private:
    PassportRegistry(const Address& address, const Address& owner, IScoreVault* vault,
                     Duration validityPeriod, EventLog& events);
    
    VaultError RequireOwner(const CallContext& ctx) const {
        return ctx.sender == owner_ ? VaultError::None : VaultError::UnauthorizedAccount;
    }
    
    /// ContractPaused while the vault is paused, then RequireOwner
    VaultError RequireActiveOwner(const CallContext& ctx) const {
        return IsPaused() ? VaultError::ContractPaused : RequireOwner(ctx);
    }
    
    /// Owner, single-token approval or operator of the token's owner
    bool IsApprovedOrOwner(const Address& spender, TokenId tokenId, const Passport& p) const;
    
    void Emit(const CallContext& ctx, EventData data) { events_.Emit(address_, ctx, std::move(data)); }
    
    VaultError Reject(const char* op, VaultError error) const;
    
    Address address_;
    Address owner_;
    IScoreVault* vault_;
    Duration validityPeriod_;
    
    std::map<TokenId, Passport> passports_;
    std::map<CommitmentHash, TokenId> commitmentToToken_;
    std::map<TokenId, Address> tokenApprovals_;
    std::map<Address, std::set<Address>> operatorApprovals_;
    std::map<Address, uint64_t> balances_;
    TokenId nextTokenId_{0};
    
    EventLog& events_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_PASSPORT_H
