// RISKVAULT - Rate Limiting
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Two independent throttles over UpdaterState rows:
// - minUpdateInterval between submissions of the same updater
// - maxDailyDecryptions threshold verifications per caller per day bucket

#ifndef RISKVAULT_VAULT_RATELIMIT_H
#define RISKVAULT_VAULT_RATELIMIT_H

#include "riskvault/core/types.h"
#include "riskvault/vault/access.h"
#include "riskvault/vault/errors.h"

#include <cstdint>

namespace riskvault {
namespace vault {

class RateLimiter {
public:
    RateLimiter(Duration minUpdateInterval, uint32_t maxDailyDecryptions);
    
    /// Calendar-day bucket of a timestamp
    static int64_t DayBucket(Timestamp now) { return now / ONE_DAY_SECONDS; }
    
    // ========================================================================
    // Submission Interval
    // ========================================================================
    
    /// RateLimited if state's last submission is within the interval
    VaultError CheckSubmission(const UpdaterState* state, Timestamp now) const;
    
    void RecordSubmission(UpdaterState& state, Timestamp now) const {
        state.lastSubmissionTime = now;
    }
    
    // ========================================================================
    // Daily Verification Cap
    // ========================================================================
    
    /// DailyLimitExceeded if the caller used up today's allowance
    VaultError CheckDecryption(const UpdaterState* state, Timestamp now) const;
    
    /// Count one verification, resetting the counter on day rollover
    void RecordDecryption(UpdaterState& state, Timestamp now) const;
    
    /// Verifications left today for state
    uint32_t RemainingDecryptions(const UpdaterState* state, Timestamp now) const;
    
    // ========================================================================
    // Configuration
    // ========================================================================
    
    Duration GetMinUpdateInterval() const { return minUpdateInterval_; }
    uint32_t GetMaxDailyDecryptions() const { return maxDailyDecryptions_; }
    
    /// IntervalTooLong above 24 hours
    VaultError SetMinUpdateInterval(Duration interval);
    
    /// InvalidLimit for 0
    VaultError SetMaxDailyDecryptions(uint32_t limit);

private:
    static constexpr int64_t ONE_DAY_SECONDS = 86400;
    
    Duration minUpdateInterval_;
    uint32_t maxDailyDecryptions_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_RATELIMIT_H
