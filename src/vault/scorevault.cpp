// RISKVAULT - Risk Score Vault Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/scorevault.h"

#include "riskvault/util/logging.h"

namespace riskvault {
namespace vault {

// ============================================================================
// Construction
// ============================================================================

RiskScoreVault::RiskScoreVault(const Address& address, const Address& owner,
                               const VaultParams& params, EventLog& events)
    : address_(address)
    , access_(owner)
    , limiter_(params.minUpdateInterval, params.maxDailyDecryptions)
    , bands_(params.bands)
    , scoreValidityPeriod_(params.scoreValidityPeriod)
    , events_(events) {}

VaultError RiskScoreVault::RequireOwner(const CallContext& ctx) const {
    return access_.IsOwner(ctx.sender) ? VaultError::None : VaultError::NotAuthorized;
}

VaultError RiskScoreVault::RequireActiveOwner(const CallContext& ctx) const {
    if (stop_.IsPaused()) {
        return VaultError::ContractPaused;
    }
    return RequireOwner(ctx);
}

VaultError RiskScoreVault::Reject(const char* op, VaultError error) const {
    LOG_DEBUG(util::LogCategory::VAULT) << op << " rejected: " << error;
    return error;
}

// ============================================================================
// Submission
// ============================================================================

SubmitResult RiskScoreVault::SubmitRiskAnalysis(const CallContext& ctx,
                                                const RiskAnalysis& analysis) {
    static const char* OP = "SubmitRiskAnalysis";
    
    if (stop_.IsPaused()) {
        return SubmitResult::Failure(Reject(OP, VaultError::ContractPaused));
    }
    if (!access_.IsAuthorizedUpdater(ctx.sender)) {
        return SubmitResult::Failure(Reject(OP, VaultError::NotAuthorized));
    }
    if (registry_ == nullptr) {
        return SubmitResult::Failure(Reject(OP, VaultError::PassportNFTNotSet));
    }
    if (analysis.recipient.IsNull()) {
        return SubmitResult::Failure(Reject(OP, VaultError::ZeroAddress));
    }
    if (analysis.blockHeight == 0) {
        return SubmitResult::Failure(Reject(OP, VaultError::InvalidBlockHeight));
    }
    
    std::optional<UpdaterState> priorState = access_.GetState(ctx.sender);
    VaultError err = limiter_.CheckSubmission(priorState ? &*priorState : nullptr, ctx.timestamp);
    if (err != VaultError::None) {
        return SubmitResult::Failure(Reject(OP, err));
    }
    
    if (nullifiers_.count(analysis.nullifier) > 0) {
        return SubmitResult::Failure(Reject(OP, VaultError::NullifierAlreadyUsed));
    }
    
    if (!verifier_) {
        return SubmitResult::Failure(Reject(OP, VaultError::InvalidVerifierAddress));
    }
    err = verifier_->VerifySubmission(analysis.commitment, analysis.encryptedScore,
                                      analysis.scoreProof, analysis.blockHeight,
                                      analysis.nullifier, analysis.addressProof,
                                      analysis.recipient);
    if (err != VaultError::None) {
        return SubmitResult::Failure(Reject(OP, err));
    }
    
    RiskBand band = RiskBand::Unknown;
    err = verifier_->ClassifyBand(analysis.encryptedScore, bands_, band);
    if (err != VaultError::None) {
        return SubmitResult::Failure(Reject(OP, err));
    }
    
    if (commitments_.count(analysis.commitment) > 0) {
        return SubmitResult::Failure(Reject(OP, VaultError::InvalidCommitment));
    }
    
    // Effects
    size_t mark = events_.Mark();
    
    CommitmentRecord& rec = commitments_[analysis.commitment];
    rec.exists = true;
    rec.timestamp = ctx.timestamp;
    rec.blockHeight = analysis.blockHeight;
    rec.band = band;
    rec.analyzer = ctx.sender;
    rec.encryptedScore = analysis.encryptedScore;
    
    nullifiers_.insert(analysis.nullifier);
    limiter_.RecordSubmission(access_.MutableState(ctx.sender), ctx.timestamp);
    ++totalScoredAddresses_;
    ++bandCounts_[static_cast<size_t>(band)];
    
    MintResult minted = registry_->MintFromVault(ctx.ForwardedBy(address_),
                                                 analysis.commitment, analysis.recipient);
    if (!minted.ok()) {
        commitments_.erase(analysis.commitment);
        nullifiers_.erase(analysis.nullifier);
        if (priorState) {
            access_.PutState(ctx.sender, *priorState);
        } else {
            access_.EraseState(ctx.sender);
        }
        --totalScoredAddresses_;
        --bandCounts_[static_cast<size_t>(band)];
        events_.Rollback(mark);
        return SubmitResult::Failure(Reject(OP, minted.error));
    }
    
    RiskAnalysisSubmitted ev;
    ev.commitment = analysis.commitment;
    ev.band = band;
    ev.analyzer = ctx.sender;
    ev.timestamp = ctx.timestamp;
    ev.tokenId = minted.tokenId;
    ev.nullifier = analysis.nullifier;
    Emit(ctx, ev);
    
    LOG_INFO(util::LogCategory::VAULT) << "Recorded commitment " << analysis.commitment.ToHex()
                                       << " band=" << RiskBandToString(band)
                                       << " passport=" << minted.tokenId;
    return SubmitResult::Success(band, minted.tokenId);
}

// ============================================================================
// Threshold Verification
// ============================================================================

VerifyResult RiskScoreVault::VerifyRiskThreshold(const CallContext& ctx,
                                                 const CommitmentHash& commitment,
                                                 uint32_t threshold,
                                                 const Bytes& proof) {
    static const char* OP = "VerifyRiskThreshold";
    
    auto it = commitments_.find(commitment);
    if (it == commitments_.end()) {
        return VerifyResult::Failure(Reject(OP, VaultError::CommitmentNotFound));
    }
    const CommitmentRecord& rec = it->second;
    
    if (ctx.timestamp >= rec.timestamp + GetValidityPeriod(commitment)) {
        return VerifyResult::Failure(Reject(OP, VaultError::RiskScoreExpired));
    }
    if (!verifier_) {
        return VerifyResult::Failure(Reject(OP, VaultError::InvalidVerifierAddress));
    }
    
    std::optional<UpdaterState> callerState = access_.GetState(ctx.origin);
    VaultError err = limiter_.CheckDecryption(callerState ? &*callerState : nullptr, ctx.timestamp);
    if (err != VaultError::None) {
        return VerifyResult::Failure(Reject(OP, err));
    }
    
    bool below = false;
    err = verifier_->VerifyBelow(commitment, rec.encryptedScore, threshold, proof, below);
    if (err != VaultError::None) {
        return VerifyResult::Failure(Reject(OP, err));
    }
    
    limiter_.RecordDecryption(access_.MutableState(ctx.origin), ctx.timestamp);
    ++totalDecryptionRequests_;
    
    DAOVerificationPerformed ev;
    ev.commitment = commitment;
    ev.threshold = threshold;
    ev.result = below;
    ev.requester = ctx.origin;
    Emit(ctx, ev);
    
    LOG_INFO(util::LogCategory::VAULT) << "Threshold check on " << commitment.ToHex()
                                       << " by " << ctx.origin.ToString();
    return VerifyResult::Success(below);
}

// ============================================================================
// Administration
// ============================================================================

VaultError RiskScoreVault::SetAuthorizedUpdater(const CallContext& ctx, const Address& updater,
                                                bool authorized) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("SetAuthorizedUpdater", err);
    }
    if (updater.IsNull()) {
        return Reject("SetAuthorizedUpdater", VaultError::ZeroAddress);
    }
    
    access_.SetAuthorized(updater, authorized);
    
    UpdaterAuthorized ev;
    ev.updater = updater;
    ev.authorized = authorized;
    ev.timestamp = ctx.timestamp;
    Emit(ctx, ev);
    
    LOG_INFO(util::LogCategory::ACCESS) << (authorized ? "Authorized " : "Deauthorized ")
                                        << "updater " << updater.ToString();
    return VaultError::None;
}

VaultError RiskScoreVault::SetPassportNFT(const CallContext& ctx, IPassportMinter* registry) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("SetPassportNFT", err);
    }
    if (registry == nullptr || registry->GetAddress().IsNull()) {
        return Reject("SetPassportNFT", VaultError::ZeroAddress);
    }
    
    registry_ = registry;
    Emit(ctx, PassportNFTUpdated{registry->GetAddress()});
    return VaultError::None;
}

VaultError RiskScoreVault::SetVerifier(const CallContext& ctx,
                                       std::shared_ptr<const ThresholdVerifier> verifier) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("SetVerifier", err);
    }
    if (!verifier) {
        return Reject("SetVerifier", VaultError::InvalidVerifierAddress);
    }
    
    verifier_ = std::move(verifier);
    Emit(ctx, VerifierUpdated{verifier_->GetName()});
    LOG_INFO(util::LogCategory::VAULT) << "Verifier set to " << verifier_->GetName();
    return VaultError::None;
}

VaultError RiskScoreVault::SetMinUpdateInterval(const CallContext& ctx, Duration interval) {
    VaultError err = RequireActiveOwner(ctx);
    if (err == VaultError::None) {
        err = limiter_.SetMinUpdateInterval(interval);
    }
    if (err != VaultError::None) {
        return Reject("SetMinUpdateInterval", err);
    }
    Emit(ctx, MinUpdateIntervalUpdated{interval});
    return VaultError::None;
}

VaultError RiskScoreVault::SetMaxDailyDecryptions(const CallContext& ctx, uint32_t limit) {
    VaultError err = RequireActiveOwner(ctx);
    if (err == VaultError::None) {
        err = limiter_.SetMaxDailyDecryptions(limit);
    }
    if (err != VaultError::None) {
        return Reject("SetMaxDailyDecryptions", err);
    }
    Emit(ctx, MaxDailyDecryptionsUpdated{limit});
    return VaultError::None;
}

VaultError RiskScoreVault::SetCustomValidityPeriod(const CallContext& ctx,
                                                   const CommitmentHash& commitment,
                                                   Duration period) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("SetCustomValidityPeriod", err);
    }
    
    if (period == 0) {
        customValidity_.erase(commitment);
    } else if (IsValidPeriod(period)) {
        customValidity_[commitment] = period;
    } else {
        return Reject("SetCustomValidityPeriod", VaultError::InvalidPeriod);
    }
    
    CustomValidityPeriodSet ev;
    ev.commitment = commitment;
    ev.period = period;
    Emit(ctx, ev);
    return VaultError::None;
}

VaultError RiskScoreVault::Pause(const CallContext& ctx) {
    VaultError err = RequireOwner(ctx);
    if (err != VaultError::None) {
        return Reject("Pause", err);
    }
    if (stop_.Pause()) {
        Emit(ctx, Paused{ctx.sender});
        LOG_INFO(util::LogCategory::VAULT) << "Vault paused by " << ctx.sender.ToString();
    }
    return VaultError::None;
}

VaultError RiskScoreVault::Unpause(const CallContext& ctx) {
    VaultError err = RequireOwner(ctx);
    if (err != VaultError::None) {
        return Reject("Unpause", err);
    }
    if (stop_.Unpause()) {
        Emit(ctx, Unpaused{ctx.sender});
        LOG_INFO(util::LogCategory::VAULT) << "Vault unpaused by " << ctx.sender.ToString();
    }
    return VaultError::None;
}

VaultError RiskScoreVault::TransferOwnership(const CallContext& ctx, const Address& newOwner) {
    VaultError err = RequireActiveOwner(ctx);
    if (err != VaultError::None) {
        return Reject("TransferOwnership", err);
    }
    
    Address previous = access_.GetOwner();
    err = access_.SetOwner(newOwner);
    if (err != VaultError::None) {
        return Reject("TransferOwnership", err);
    }
    
    OwnershipTransferred ev;
    ev.previousOwner = previous;
    ev.newOwner = newOwner;
    Emit(ctx, ev);
    return VaultError::None;
}

// ============================================================================
// Queries
// ============================================================================

bool RiskScoreVault::CommitmentExists(const CommitmentHash& commitment) const {
    return commitments_.count(commitment) > 0;
}

RiskBand RiskScoreVault::GetRiskBand(const CommitmentHash& commitment) const {
    auto it = commitments_.find(commitment);
    return it == commitments_.end() ? RiskBand::Unknown : it->second.band;
}

ScoreValidity RiskScoreVault::HasValidScore(const CommitmentHash& commitment, Timestamp now) const {
    ScoreValidity result;
    auto it = commitments_.find(commitment);
    if (it == commitments_.end()) {
        return result;
    }
    result.exists = true;
    result.valid = now < it->second.timestamp + GetValidityPeriod(commitment);
    return result;
}

BatchValidity RiskScoreVault::BatchCheckValidScores(const std::vector<CommitmentHash>& commitments,
                                                    Timestamp now) const {
    BatchValidity result;
    result.commitments = commitments;
    result.valid.reserve(commitments.size());
    result.bands.reserve(commitments.size());
    
    for (const auto& commitment : commitments) {
        result.valid.push_back(HasValidScore(commitment, now).valid);
        result.bands.push_back(GetRiskBand(commitment));
    }
    return result;
}

CommitmentMetadata RiskScoreVault::GetCommitmentMetadata(const CommitmentHash& commitment) const {
    CommitmentMetadata meta;
    auto it = commitments_.find(commitment);
    if (it == commitments_.end()) {
        return meta;
    }
    meta.timestamp = it->second.timestamp;
    meta.blockHeight = it->second.blockHeight;
    meta.band = it->second.band;
    meta.analyzer = it->second.analyzer;
    meta.exists = true;
    return meta;
}

std::optional<CommitmentRecord> RiskScoreVault::GetRecord(const CommitmentHash& commitment) const {
    auto it = commitments_.find(commitment);
    if (it == commitments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RiskScoreVault::IsNullifierUsed(const NullifierHash& nullifier) const {
    return nullifiers_.count(nullifier) > 0;
}

Duration RiskScoreVault::GetValidityPeriod(const CommitmentHash& commitment) const {
    auto it = customValidity_.find(commitment);
    return it != customValidity_.end() ? it->second : scoreValidityPeriod_;
}

std::optional<Duration> RiskScoreVault::GetCustomValidityPeriod(const CommitmentHash& commitment) const {
    auto it = customValidity_.find(commitment);
    if (it == customValidity_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint32_t RiskScoreVault::GetRemainingDecryptions(const Address& account, Timestamp now) const {
    std::optional<UpdaterState> state = access_.GetState(account);
    return limiter_.RemainingDecryptions(state ? &*state : nullptr, now);
}

Address RiskScoreVault::GetPassportNFT() const {
    return registry_ ? registry_->GetAddress() : Address();
}

ContractInfo RiskScoreVault::GetContractInfo() const {
    ContractInfo info;
    info.scoreValidityPeriod = scoreValidityPeriod_;
    info.owner = access_.GetOwner();
    info.totalScoredAddresses = totalScoredAddresses_;
    info.totalDecryptionRequests = totalDecryptionRequests_;
    return info;
}

ScoreStatistics RiskScoreVault::GetScoreStatistics() const {
    ScoreStatistics stats;
    stats.bandCounts = bandCounts_;
    stats.total = totalScoredAddresses_;
    return stats;
}

// ============================================================================
// Persistence Support
// ============================================================================

VaultConfigState RiskScoreVault::GetConfigState() const {
    VaultConfigState cfg;
    cfg.owner = access_.GetOwner();
    cfg.paused = stop_.IsPaused();
    cfg.registry = GetPassportNFT();
    cfg.minUpdateInterval = limiter_.GetMinUpdateInterval();
    cfg.maxDailyDecryptions = limiter_.GetMaxDailyDecryptions();
    cfg.scoreValidityPeriod = scoreValidityPeriod_;
    cfg.bandCuts = bands_.GetCutPoints();
    cfg.totalScoredAddresses = totalScoredAddresses_;
    cfg.totalDecryptionRequests = totalDecryptionRequests_;
    cfg.bandCounts = bandCounts_;
    return cfg;
}

void RiskScoreVault::ClearState() {
    commitments_.clear();
    nullifiers_.clear();
    customValidity_.clear();
    access_.ClearStates();
}

bool RiskScoreVault::RestoreConfigState(const VaultConfigState& cfg, IPassportMinter* registry) {
    if (cfg.bandCuts != bands_.GetCutPoints()) {
        LOG_ERROR(util::LogCategory::VAULT) << "Stored band table does not match this deployment";
        return false;
    }
    if (access_.SetOwner(cfg.owner) != VaultError::None) {
        LOG_ERROR(util::LogCategory::VAULT) << "Stored owner is the null address";
        return false;
    }
    stop_.Restore(cfg.paused);
    if (limiter_.SetMinUpdateInterval(cfg.minUpdateInterval) != VaultError::None ||
        limiter_.SetMaxDailyDecryptions(cfg.maxDailyDecryptions) != VaultError::None) {
        LOG_ERROR(util::LogCategory::VAULT) << "Stored rate limits are out of range";
        return false;
    }
    scoreValidityPeriod_ = cfg.scoreValidityPeriod;
    registry_ = cfg.registry.IsNull() ? nullptr : registry;
    totalScoredAddresses_ = cfg.totalScoredAddresses;
    totalDecryptionRequests_ = cfg.totalDecryptionRequests;
    bandCounts_ = cfg.bandCounts;
    return true;
}

void RiskScoreVault::RestoreRecord(const CommitmentHash& commitment, const CommitmentRecord& rec) {
    commitments_[commitment] = rec;
}

} // namespace vault
} // namespace riskvault
