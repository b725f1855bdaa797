// RISKVAULT - Risk Score Vault
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Commitment ledger: records one attestation per commitment, consumes one
// nullifier per submission and mints the matching passport in the same
// transaction. Scores are never stored in plaintext; only the band and the
// opaque ciphertext are kept.

#ifndef RISKVAULT_VAULT_SCOREVAULT_H
#define RISKVAULT_VAULT_SCOREVAULT_H

#include "riskvault/core/serialize.h"
#include "riskvault/core/types.h"
#include "riskvault/vault/access.h"
#include "riskvault/vault/context.h"
#include "riskvault/vault/emergency.h"
#include "riskvault/vault/errors.h"
#include "riskvault/vault/events.h"
#include "riskvault/vault/interfaces.h"
#include "riskvault/vault/params.h"
#include "riskvault/vault/ratelimit.h"
#include "riskvault/vault/riskband.h"
#include "riskvault/vault/verifier.h"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace riskvault {
namespace vault {

// ============================================================================
// Commitment Record
// ============================================================================

/**
 * Attestation stored for a commitment. Immutable once written; validity
 * is derived from timestamp and the applicable period.
 */
struct CommitmentRecord {
    bool exists{false};
    
    /// Ledger time of submission
    Timestamp timestamp{0};
    
    /// External chain height referenced by the proof (> 0)
    BlockHeight blockHeight{0};
    
    RiskBand band{RiskBand::Unknown};
    
    /// Updater who submitted it
    Address analyzer;
    
    /// Opaque score ciphertext, evaluated only through IScoreComparator
    Bytes encryptedScore;
};

template<typename Stream>
void Serialize(Stream& s, const CommitmentRecord& rec) {
    Serialize(s, rec.exists);
    Serialize(s, rec.timestamp);
    Serialize(s, static_cast<uint64_t>(rec.blockHeight));
    Serialize(s, static_cast<uint8_t>(rec.band));
    Serialize(s, rec.analyzer);
    Serialize(s, rec.encryptedScore);
}

template<typename Stream>
void Unserialize(Stream& s, CommitmentRecord& rec) {
    uint64_t height;
    uint8_t band;
    Unserialize(s, rec.exists);
    Unserialize(s, rec.timestamp);
    Unserialize(s, height);
    Unserialize(s, band);
    Unserialize(s, rec.analyzer);
    Unserialize(s, rec.encryptedScore);
    if (band >= NUM_RISK_BANDS) {
        throw std::ios_base::failure("CommitmentRecord: invalid band");
    }
    rec.blockHeight = height;
    rec.band = static_cast<RiskBand>(band);
}

// ============================================================================
// Submission
// ============================================================================

/// Tuple supplied by the updater pipeline
struct RiskAnalysis {
    CommitmentHash commitment;
    Bytes encryptedScore;
    Bytes scoreProof;
    BlockHeight blockHeight{0};
    NullifierHash nullifier;
    Bytes addressProof;
    Address recipient;
};

// ============================================================================
// Query Results
// ============================================================================

struct ScoreValidity {
    bool exists{false};
    bool valid{false};
};

struct BatchValidity {
    std::vector<CommitmentHash> commitments;
    std::vector<bool> valid;
    std::vector<RiskBand> bands;
};

struct CommitmentMetadata {
    Timestamp timestamp{0};
    BlockHeight blockHeight{0};
    RiskBand band{RiskBand::Unknown};
    Address analyzer;
    bool exists{false};
};

struct ContractInfo {
    uint32_t scorePrecision{SCORE_PRECISION};
    uint32_t maxRiskScore{MAX_RISK_SCORE};
    Duration scoreValidityPeriod{0};
    Address owner;
    uint64_t totalScoredAddresses{0};
    uint64_t totalDecryptionRequests{0};
};

struct ScoreStatistics {
    /// Indexed by RiskBand
    std::array<uint64_t, NUM_RISK_BANDS> bandCounts{};
    uint64_t total{0};
    
    uint64_t Count(RiskBand band) const { return bandCounts[static_cast<size_t>(band)]; }
};

// ============================================================================
// Persistent Configuration Snapshot
// ============================================================================

/// Mutable vault configuration and counters, as persisted
struct VaultConfigState {
    Address owner;
    bool paused{false};
    Address registry;
    Duration minUpdateInterval{0};
    uint32_t maxDailyDecryptions{0};
    Duration scoreValidityPeriod{0};
    std::vector<uint32_t> bandCuts;
    uint64_t totalScoredAddresses{0};
    uint64_t totalDecryptionRequests{0};
    std::array<uint64_t, NUM_RISK_BANDS> bandCounts{};
};

template<typename Stream>
void Serialize(Stream& s, const VaultConfigState& cfg) {
    Serialize(s, cfg.owner);
    Serialize(s, cfg.paused);
    Serialize(s, cfg.registry);
    Serialize(s, cfg.minUpdateInterval);
    Serialize(s, cfg.maxDailyDecryptions);
    Serialize(s, cfg.scoreValidityPeriod);
    WriteCompactSize(s, cfg.bandCuts.size());
    for (uint32_t cut : cfg.bandCuts) {
        Serialize(s, cut);
    }
    Serialize(s, cfg.totalScoredAddresses);
    Serialize(s, cfg.totalDecryptionRequests);
    for (uint64_t count : cfg.bandCounts) {
        Serialize(s, count);
    }
}

template<typename Stream>
void Unserialize(Stream& s, VaultConfigState& cfg) {
    Unserialize(s, cfg.owner);
    Unserialize(s, cfg.paused);
    Unserialize(s, cfg.registry);
    Unserialize(s, cfg.minUpdateInterval);
    Unserialize(s, cfg.maxDailyDecryptions);
    Unserialize(s, cfg.scoreValidityPeriod);
    uint64_t n = ReadCompactSize(s);
    if (n > NUM_RISK_BANDS) {
        throw std::ios_base::failure("VaultConfigState: too many band cuts");
    }
    cfg.bandCuts.resize(n);
    for (auto& cut : cfg.bandCuts) {
        Unserialize(s, cut);
    }
    Unserialize(s, cfg.totalScoredAddresses);
    Unserialize(s, cfg.totalDecryptionRequests);
    for (auto& count : cfg.bandCounts) {
        Unserialize(s, count);
    }
}

// ============================================================================
// Risk Score Vault
// ============================================================================

class RiskScoreVault : public IScoreVault {
public:
    /**
     * Deploy a vault.
     * @param address Contract address of the vault
     * @param owner Initial owner (also an implicit updater)
     * @param params Initial configuration and band table
     * @param events Log receiving this contract's events; must outlive it
     */
    RiskScoreVault(const Address& address, const Address& owner,
                   const VaultParams& params, EventLog& events);
    
    // ========================================================================
    // Submission and Verification
    // ========================================================================
    
    /**
     * Record an attestation and mint its passport to analysis.recipient.
     * Either every effect happens or none does.
     */
    SubmitResult SubmitRiskAnalysis(const CallContext& ctx, const RiskAnalysis& analysis);
    
    /**
     * Ask whether the stored score of commitment is below threshold.
     * Counts against ctx.origin's daily allowance.
     */
    VerifyResult VerifyRiskThreshold(const CallContext& ctx,
                                     const CommitmentHash& commitment,
                                     uint32_t threshold,
                                     const Bytes& proof) override;
    
    // ========================================================================
    // Administration (owner only, NotAuthorized otherwise). Everything but
    // Pause and Unpause fails ContractPaused while paused.
    // ========================================================================
    
    /// ZeroAddress for the null address
    VaultError SetAuthorizedUpdater(const CallContext& ctx, const Address& updater, bool authorized);
    
    /// ZeroAddress for a null registry. registry must outlive the vault.
    VaultError SetPassportNFT(const CallContext& ctx, IPassportMinter* registry);
    
    /// InvalidVerifierAddress for null
    VaultError SetVerifier(const CallContext& ctx, std::shared_ptr<const ThresholdVerifier> verifier);
    
    VaultError SetMinUpdateInterval(const CallContext& ctx, Duration interval);
    VaultError SetMaxDailyDecryptions(const CallContext& ctx, uint32_t limit);
    
    /// Period 0 removes the override; otherwise 1 to 365 days
    VaultError SetCustomValidityPeriod(const CallContext& ctx, const CommitmentHash& commitment,
                                       Duration period);
    
    VaultError Pause(const CallContext& ctx);
    VaultError Unpause(const CallContext& ctx);
    VaultError TransferOwnership(const CallContext& ctx, const Address& newOwner);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    const Address& GetAddress() const override { return address_; }
    const Address& GetOwner() const { return access_.GetOwner(); }
    bool IsPaused() const override { return stop_.IsPaused(); }
    bool IsAuthorizedUpdater(const Address& account) const { return access_.IsAuthorizedUpdater(account); }
    
    bool CommitmentExists(const CommitmentHash& commitment) const override;
    
    /// UNKNOWN for absent commitments; the stored band even after expiry
    RiskBand GetRiskBand(const CommitmentHash& commitment) const;
    RiskBand GetCommitmentRiskBand(const CommitmentHash& commitment) const override {
        return GetRiskBand(commitment);
    }
    
    ScoreValidity HasValidScore(const CommitmentHash& commitment, Timestamp now) const;
    BatchValidity BatchCheckValidScores(const std::vector<CommitmentHash>& commitments,
                                        Timestamp now) const;
    CommitmentMetadata GetCommitmentMetadata(const CommitmentHash& commitment) const;
    std::optional<CommitmentRecord> GetRecord(const CommitmentHash& commitment) const;
    
    bool IsNullifierUsed(const NullifierHash& nullifier) const;
    
    /// Custom override if set, else the default
    Duration GetValidityPeriod(const CommitmentHash& commitment) const;
    std::optional<Duration> GetCustomValidityPeriod(const CommitmentHash& commitment) const;
    
    std::optional<UpdaterState> GetUpdaterState(const Address& account) const {
        return access_.GetState(account);
    }
    
    uint32_t GetRemainingDecryptions(const Address& account, Timestamp now) const;
    
    Duration GetMinUpdateInterval() const { return limiter_.GetMinUpdateInterval(); }
    uint32_t GetMaxDailyDecryptions() const { return limiter_.GetMaxDailyDecryptions(); }
    const BandThresholds& GetBandThresholds() const { return bands_; }
    
    /// Address of the configured registry (null if unset)
    Address GetPassportNFT() const;
    bool HasVerifier() const { return verifier_ != nullptr; }
    const std::shared_ptr<const ThresholdVerifier>& GetVerifier() const { return verifier_; }
    
    ContractInfo GetContractInfo() const;
    ScoreStatistics GetScoreStatistics() const;
    
    // ========================================================================
    // State Access for Persistence
    // ========================================================================
    
    VaultConfigState GetConfigState() const;
    
    /// Drop records, nullifiers, updater states and overrides before a reload
    void ClearState();
    
    /**
     * Restore configuration and counters. The registry pointer must be
     * supplied separately when cfg.registry is set.
     * @return false if cfg.bandCuts does not match this deployment
     */
    bool RestoreConfigState(const VaultConfigState& cfg, IPassportMinter* registry);
    
    void RestoreRecord(const CommitmentHash& commitment, const CommitmentRecord& rec);
    void RestoreNullifier(const NullifierHash& nullifier) { nullifiers_.insert(nullifier); }
    void RestoreUpdaterState(const Address& account, const UpdaterState& state) {
        access_.PutState(account, state);
    }
    void RestoreCustomValidityPeriod(const CommitmentHash& commitment, Duration period) {
        customValidity_[commitment] = period;
    }
    
    /// Install the verifier of a reopened deployment; not a persisted setting
    void RestoreVerifier(std::shared_ptr<const ThresholdVerifier> verifier) {
        verifier_ = std::move(verifier);
    }
    
    size_t NullifierCount() const { return nullifiers_.size(); }
    size_t CommitmentCount() const { return commitments_.size(); }

private:
    /// NotAuthorized unless ctx.sender is the owner
    VaultError RequireOwner(const CallContext& ctx) const;
    
    /// ContractPaused while paused, then RequireOwner
    VaultError RequireActiveOwner(const CallContext& ctx) const;
    
    void Emit(const CallContext& ctx, EventData data) { events_.Emit(address_, ctx, std::move(data)); }
    
    VaultError Reject(const char* op, VaultError error) const;
    
    Address address_;
    AccessControl access_;
    EmergencyStop stop_;
    RateLimiter limiter_;
    BandThresholds bands_;
    Duration scoreValidityPeriod_;
    
    /// Commitment and nullifier tables are independent
    std::map<CommitmentHash, CommitmentRecord> commitments_;
    std::set<NullifierHash> nullifiers_;
    std::map<CommitmentHash, Duration> customValidity_;
    
    IPassportMinter* registry_{nullptr};
    std::shared_ptr<const ThresholdVerifier> verifier_;
    
    uint64_t totalScoredAddresses_{0};
    uint64_t totalDecryptionRequests_{0};
    std::array<uint64_t, NUM_RISK_BANDS> bandCounts_{};
    
    EventLog& events_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_SCOREVAULT_H
