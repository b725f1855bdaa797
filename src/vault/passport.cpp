// RISKVAULT - Passport Registry Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/passport.h"

#include "riskvault/util/logging.h"
#include "riskvault/vault/params.h"

namespace riskvault {
namespace vault {

// ============================================================================
// Deployment
// ============================================================================

PassportRegistry::PassportRegistry(const Address& address, const Address& owner,
                                   IScoreVault* vault, Duration validityPeriod,
                                   EventLog& events)
    : address_(address)
    , owner_(owner)
    , vault_(vault)
    , validityPeriod_(validityPeriod)
    , events_(events) {}

std::pair<VaultError, std::unique_ptr<PassportRegistry>> PassportRegistry::Deploy(
    const Address& address, const Address& owner, IScoreVault* vault,
    Duration validityPeriod, EventLog& events) {
    if (vault == nullptr || vault->GetAddress().IsNull()) {
        return {VaultError::InvalidVaultAddress, nullptr};
    }
    if (owner.IsNull()) {
        return {VaultError::ZeroAddress, nullptr};
    }
    if (!IsValidPeriod(validityPeriod)) {
        return {VaultError::InvalidPeriod, nullptr};
    }
    std::unique_ptr<PassportRegistry> registry(
        new PassportRegistry(address, owner, vault, validityPeriod, events));
    return {VaultError::None, std::move(registry)};
}

VaultError PassportRegistry::Reject(const char* op, VaultError error) const {
    LOG_DEBUG(util::LogCategory::PASSPORT) << op << " rejected: " << error;
    return error;
}

// ============================================================================
// Minting
// ============================================================================

MintResult PassportRegistry::MintFromVault(const CallContext& ctx, const CommitmentHash& commitment,
                                           const Address& recipient) {
    static const char* OP = "MintFromVault";
    
    if (ctx.sender != vault_->GetAddress()) {
        return MintResult::Failure(Reject(OP, VaultError::OnlyVault));
    }
    if (vault_->IsPaused()) {
        return MintResult::Failure(Reject(OP, VaultError::ContractPaused));
    }
    if (recipient.IsNull()) {
        return MintResult::Failure(Reject(OP, VaultError::ZeroAddress));
    }
    if (!vault_->CommitmentExists(commitment)) {
        return MintResult::Failure(Reject(OP, VaultError::CommitmentNotInVault));
    }
    if (commitmentToToken_.count(commitment) > 0) {
        return MintResult::Failure(Reject(OP, VaultError::PassportAlreadyExists));
    }
    
    TokenId tokenId = nextTokenId_++;
    
    Passport& p = passports_[tokenId];
    p.owner = recipient;
    p.commitment = commitment;
    p.mintTime = ctx.timestamp;
    p.expiry = ctx.timestamp + validityPeriod_;
    
    commitmentToToken_[commitment] = tokenId;
    ++balances_[recipient];
    
    Transfer transfer;
    transfer.to = recipient;
    transfer.tokenId = tokenId;
    Emit(ctx, transfer);
    
    PassportMinted minted;
    minted.tokenId = tokenId;
    minted.recipient = recipient;
    minted.commitment = commitment;
    minted.expiry = p.expiry;
    Emit(ctx, minted);
    
    LOG_INFO(util::LogCategory::PASSPORT) << "Minted passport " << tokenId
                                          << " to " << recipient.ToString();
    return MintResult::Success(tokenId, p.expiry);
}

// ============================================================================
// Verification
// ============================================================================

VerifyResult PassportRegistry::VerifyRiskThreshold(const CallContext& ctx, TokenId tokenId,
                                                   uint32_t threshold, const Bytes& proof) {
    static const char* OP = "VerifyRiskThreshold";
    
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return VerifyResult::Failure(Reject(OP, VaultError::PassportNotFound));
    }
    const Passport& p = it->second;
    if (ctx.timestamp >= p.expiry) {
        return VerifyResult::Failure(Reject(OP, VaultError::PassportExpired));
    }
    if (p.revoked) {
        return VerifyResult::Failure(Reject(OP, VaultError::PassportRevoked));
    }
    
    return vault_->VerifyRiskThreshold(ctx.ForwardedBy(address_), p.commitment, threshold, proof);
}

// ============================================================================
// Administration
// ============================================================================

VaultError PassportRegistry::RevokePassport(const CallContext& ctx, TokenId tokenId,
                                            const std::string& reason) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("RevokePassport", err);
    }
    
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return Reject("RevokePassport", VaultError::PassportNotFound);
    }
    Passport& p = it->second;
    if (p.revoked) {
        return Reject("RevokePassport", VaultError::PassportRevoked);
    }
    
    p.revoked = true;
    p.revokeReason = reason;
    
    PassportRevoked ev;
    ev.tokenId = tokenId;
    ev.owner = p.owner;
    ev.reason = reason;
    Emit(ctx, ev);
    
    LOG_INFO(util::LogCategory::PASSPORT) << "Revoked passport " << tokenId << ": " << reason;
    return VaultError::None;
}

VaultError PassportRegistry::SetValidityPeriod(const CallContext& ctx, Duration period) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("SetValidityPeriod", err);
    }
    if (!IsValidPeriod(period)) {
        return Reject("SetValidityPeriod", VaultError::InvalidPeriod);
    }
    
    validityPeriod_ = period;
    Emit(ctx, ValidityPeriodUpdated{period});
    return VaultError::None;
}

VaultError PassportRegistry::TransferOwnership(const CallContext& ctx, const Address& newOwner) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("TransferOwnership", err);
    }
    if (newOwner.IsNull()) {
        return Reject("TransferOwnership", VaultError::ZeroAddress);
    }
    
    OwnershipTransferred ev;
    ev.previousOwner = owner_;
    ev.newOwner = newOwner;
    owner_ = newOwner;
    Emit(ctx, ev);
    return VaultError::None;
}

// ============================================================================
// Token Transfers
// ============================================================================

bool PassportRegistry::IsApprovedOrOwner(const Address& spender, TokenId tokenId,
                                         const Passport& p) const {
    if (spender == p.owner) {
        return true;
    }
    auto approval = tokenApprovals_.find(tokenId);
    if (approval != tokenApprovals_.end() && approval->second == spender) {
        return true;
    }
    return IsApprovedForAll(p.owner, spender);
}

VaultError PassportRegistry::TransferFrom(const CallContext& ctx, const Address& from,
                                          const Address& to, TokenId tokenId) {
    static const char* OP = "TransferFrom";
    
    if (vault_->IsPaused()) {
        return Reject(OP, VaultError::ContractPaused);
    }
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return Reject(OP, VaultError::PassportNotFound);
    }
    if (to.IsNull()) {
        return Reject(OP, VaultError::ZeroAddress);
    }
    Passport& p = it->second;
    if (p.owner != from) {
        return Reject(OP, VaultError::NotTokenOwner);
    }
    if (!IsApprovedOrOwner(ctx.sender, tokenId, p)) {
        return Reject(OP, VaultError::NotApproved);
    }
    
    tokenApprovals_.erase(tokenId);
    if (--balances_[from] == 0) {
        balances_.erase(from);
    }
    ++balances_[to];
    p.owner = to;
    
    Transfer ev;
    ev.from = from;
    ev.to = to;
    ev.tokenId = tokenId;
    Emit(ctx, ev);
    return VaultError::None;
}

VaultError PassportRegistry::Approve(const CallContext& ctx, const Address& approved,
                                     TokenId tokenId) {
    static const char* OP = "Approve";
    
    if (vault_->IsPaused()) {
        return Reject(OP, VaultError::ContractPaused);
    }
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return Reject(OP, VaultError::PassportNotFound);
    }
    const Passport& p = it->second;
    if (ctx.sender != p.owner && !IsApprovedForAll(p.owner, ctx.sender)) {
        return Reject(OP, VaultError::NotApproved);
    }
    
    if (approved.IsNull()) {
        tokenApprovals_.erase(tokenId);
    } else {
        tokenApprovals_[tokenId] = approved;
    }
    
    Approval ev;
    ev.owner = p.owner;
    ev.approved = approved;
    ev.tokenId = tokenId;
    Emit(ctx, ev);
    return VaultError::None;
}

VaultError PassportRegistry::SetApprovalForAll(const CallContext& ctx, const Address& operatorAddr,
                                               bool approved) {
    static const char* OP = "SetApprovalForAll";
    
    if (vault_->IsPaused()) {
        return Reject(OP, VaultError::ContractPaused);
    }
    if (operatorAddr.IsNull()) {
        return Reject(OP, VaultError::ZeroAddress);
    }
    
    if (approved) {
        operatorApprovals_[ctx.sender].insert(operatorAddr);
    } else {
        auto it = operatorApprovals_.find(ctx.sender);
        if (it != operatorApprovals_.end()) {
            it->second.erase(operatorAddr);
            if (it->second.empty()) {
                operatorApprovals_.erase(it);
            }
        }
    }
    
    ApprovalForAll ev;
    ev.owner = ctx.sender;
    ev.operatorAddr = operatorAddr;
    ev.approved = approved;
    Emit(ctx, ev);
    return VaultError::None;
}

// ============================================================================
// Queries
// ============================================================================

PassportValidity PassportRegistry::IsPassportValid(TokenId tokenId, Timestamp now) const {
    PassportValidity result;
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return result;
    }
    result.valid = it->second.IsValidAt(now);
    result.expiry = it->second.expiry;
    return result;
}

std::optional<Passport> PassportRegistry::GetPassport(TokenId tokenId) const {
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CommitmentHash> PassportRegistry::GetPassportCommitment(TokenId tokenId) const {
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return std::nullopt;
    }
    return it->second.commitment;
}

std::optional<Address> PassportRegistry::GetPassportHolder(TokenId tokenId) const {
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return std::nullopt;
    }
    return it->second.owner;
}

RiskBand PassportRegistry::GetPassportRiskBand(TokenId tokenId) const {
    auto it = passports_.find(tokenId);
    if (it == passports_.end()) {
        return RiskBand::Unknown;
    }
    return vault_->GetCommitmentRiskBand(it->second.commitment);
}

std::optional<TokenId> PassportRegistry::GetTokenByCommitment(const CommitmentHash& commitment) const {
    auto it = commitmentToToken_.find(commitment);
    if (it == commitmentToToken_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint64_t PassportRegistry::BalanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Address PassportRegistry::GetApproved(TokenId tokenId) const {
    auto it = tokenApprovals_.find(tokenId);
    return it == tokenApprovals_.end() ? Address() : it->second;
}

bool PassportRegistry::IsApprovedForAll(const Address& owner, const Address& operatorAddr) const {
    auto it = operatorApprovals_.find(owner);
    return it != operatorApprovals_.end() && it->second.count(operatorAddr) > 0;
}

// ============================================================================
// Persistence Support
// ============================================================================

RegistryConfigState PassportRegistry::GetConfigState() const {
    RegistryConfigState cfg;
    cfg.owner = owner_;
    cfg.validityPeriod = validityPeriod_;
    cfg.nextTokenId = nextTokenId_;
    return cfg;
}

void PassportRegistry::ClearState() {
    passports_.clear();
    commitmentToToken_.clear();
    tokenApprovals_.clear();
    operatorApprovals_.clear();
    balances_.clear();
}

void PassportRegistry::RestoreConfigState(const RegistryConfigState& cfg) {
    owner_ = cfg.owner;
    validityPeriod_ = cfg.validityPeriod;
    nextTokenId_ = cfg.nextTokenId;
}

void PassportRegistry::RestorePassport(TokenId tokenId, const Passport& passport) {
    auto it = passports_.find(tokenId);
    if (it != passports_.end()) {
        if (--balances_[it->second.owner] == 0) {
            balances_.erase(it->second.owner);
        }
    }
    passports_[tokenId] = passport;
    commitmentToToken_[passport.commitment] = tokenId;
    ++balances_[passport.owner];
    if (tokenId >= nextTokenId_) {
        nextTokenId_ = tokenId + 1;
    }
}

void PassportRegistry::RestoreApproval(TokenId tokenId, const Address& approved) {
    tokenApprovals_[tokenId] = approved;
}

void PassportRegistry::RestoreOperatorApproval(const Address& owner, const Address& operatorAddr) {
    operatorApprovals_[owner].insert(operatorAddr);
}

} // namespace vault
} // namespace riskvault
