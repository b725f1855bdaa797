// RISKVAULT - Rate Limiting
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/ratelimit.h"
#include "riskvault/vault/params.h"

namespace riskvault {
namespace vault {

RateLimiter::RateLimiter(Duration minUpdateInterval, uint32_t maxDailyDecryptions)
    : minUpdateInterval_(minUpdateInterval)
    , maxDailyDecryptions_(maxDailyDecryptions) {}

VaultError RateLimiter::CheckSubmission(const UpdaterState* state, Timestamp now) const {
    // First submission is never throttled
    if (!state || state->lastSubmissionTime == 0) {
        return VaultError::None;
    }
    if (now < state->lastSubmissionTime + minUpdateInterval_) {
        return VaultError::RateLimited;
    }
    return VaultError::None;
}

VaultError RateLimiter::CheckDecryption(const UpdaterState* state, Timestamp now) const {
    return RemainingDecryptions(state, now) == 0 ? VaultError::DailyLimitExceeded
                                                  : VaultError::None;
}

void RateLimiter::RecordDecryption(UpdaterState& state, Timestamp now) const {
    int64_t bucket = DayBucket(now);
    if (state.dayBucket != bucket) {
        state.dayBucket = bucket;
        state.decryptionsToday = 0;
    }
    ++state.decryptionsToday;
}

uint32_t RateLimiter::RemainingDecryptions(const UpdaterState* state, Timestamp now) const {
    if (!state || state->dayBucket != DayBucket(now)) {
        return maxDailyDecryptions_;
    }
    if (state->decryptionsToday >= maxDailyDecryptions_) {
        return 0;
    }
    return maxDailyDecryptions_ - state->decryptionsToday;
}

VaultError RateLimiter::SetMinUpdateInterval(Duration interval) {
    if (interval < 0) {
        return VaultError::InvalidPeriod;
    }
    if (interval > MAX_UPDATE_INTERVAL) {
        return VaultError::IntervalTooLong;
    }
    minUpdateInterval_ = interval;
    return VaultError::None;
}

VaultError RateLimiter::SetMaxDailyDecryptions(uint32_t limit) {
    if (limit == 0) {
        return VaultError::InvalidLimit;
    }
    maxDailyDecryptions_ = limit;
    return VaultError::None;
}

} // namespace vault
} // namespace riskvault
