// RISKVAULT - Rate Limiter Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "riskvault/vault/params.h"
#include "riskvault/vault/ratelimit.h"

using namespace riskvault;
using namespace riskvault::vault;

namespace {
// Midnight UTC
constexpr Timestamp DAY_START = 19675 * ONE_DAY;
}

// ============================================================================
// Submission Interval
// ============================================================================

TEST(RateLimiterTest, FirstSubmissionNeverThrottled) {
    RateLimiter limiter(3600, 10);
    EXPECT_EQ(limiter.CheckSubmission(nullptr, DAY_START), VaultError::None);

    UpdaterState fresh;
    fresh.authorized = true;
    EXPECT_EQ(limiter.CheckSubmission(&fresh, DAY_START), VaultError::None);
}

TEST(RateLimiterTest, IntervalBoundary) {
    RateLimiter limiter(3600, 10);
    UpdaterState state;
    limiter.RecordSubmission(state, DAY_START);
    EXPECT_EQ(state.lastSubmissionTime, DAY_START);

    EXPECT_EQ(limiter.CheckSubmission(&state, DAY_START), VaultError::RateLimited);
    EXPECT_EQ(limiter.CheckSubmission(&state, DAY_START + 3599), VaultError::RateLimited);
    EXPECT_EQ(limiter.CheckSubmission(&state, DAY_START + 3600), VaultError::None);
}

TEST(RateLimiterTest, ZeroIntervalDisablesThrottle) {
    RateLimiter limiter(0, 10);
    UpdaterState state;
    limiter.RecordSubmission(state, DAY_START);
    EXPECT_EQ(limiter.CheckSubmission(&state, DAY_START), VaultError::None);
}

// ============================================================================
// Daily Decryptions
// ============================================================================

TEST(RateLimiterTest, DayBucket) {
    EXPECT_EQ(RateLimiter::DayBucket(DAY_START), 19675);
    EXPECT_EQ(RateLimiter::DayBucket(DAY_START + ONE_DAY - 1), 19675);
    EXPECT_EQ(RateLimiter::DayBucket(DAY_START + ONE_DAY), 19676);
}

TEST(RateLimiterTest, DailyCap) {
    RateLimiter limiter(3600, 3);
    UpdaterState state;
    EXPECT_EQ(limiter.RemainingDecryptions(nullptr, DAY_START), 3u);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(limiter.CheckDecryption(&state, DAY_START + i), VaultError::None);
        limiter.RecordDecryption(state, DAY_START + i);
    }
    EXPECT_EQ(state.decryptionsToday, 3u);
    EXPECT_EQ(limiter.RemainingDecryptions(&state, DAY_START + 10), 0u);
    EXPECT_EQ(limiter.CheckDecryption(&state, DAY_START + 10), VaultError::DailyLimitExceeded);
}

TEST(RateLimiterTest, CounterResetsAtDayBoundary) {
    RateLimiter limiter(3600, 2);
    UpdaterState state;
    limiter.RecordDecryption(state, DAY_START + ONE_DAY - 2);
    limiter.RecordDecryption(state, DAY_START + ONE_DAY - 1);
    EXPECT_EQ(limiter.CheckDecryption(&state, DAY_START + ONE_DAY - 1), VaultError::DailyLimitExceeded);

    EXPECT_EQ(limiter.RemainingDecryptions(&state, DAY_START + ONE_DAY), 2u);
    limiter.RecordDecryption(state, DAY_START + ONE_DAY);
    EXPECT_EQ(state.dayBucket, RateLimiter::DayBucket(DAY_START + ONE_DAY));
    EXPECT_EQ(state.decryptionsToday, 1u);
    EXPECT_EQ(limiter.RemainingDecryptions(&state, DAY_START + ONE_DAY), 1u);
}

TEST(RateLimiterTest, LoweredCapAppliesImmediately) {
    RateLimiter limiter(3600, 10);
    UpdaterState state;
    for (int i = 0; i < 5; ++i) {
        limiter.RecordDecryption(state, DAY_START);
    }
    ASSERT_EQ(limiter.SetMaxDailyDecryptions(4), VaultError::None);
    EXPECT_EQ(limiter.RemainingDecryptions(&state, DAY_START), 0u);
    EXPECT_EQ(limiter.CheckDecryption(&state, DAY_START), VaultError::DailyLimitExceeded);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(RateLimiterTest, Setters) {
    RateLimiter limiter(3600, 10);

    EXPECT_EQ(limiter.SetMinUpdateInterval(-1), VaultError::InvalidPeriod);
    EXPECT_EQ(limiter.SetMinUpdateInterval(ONE_DAY + 1), VaultError::IntervalTooLong);
    EXPECT_EQ(limiter.GetMinUpdateInterval(), 3600);
    EXPECT_EQ(limiter.SetMinUpdateInterval(ONE_DAY), VaultError::None);
    EXPECT_EQ(limiter.GetMinUpdateInterval(), ONE_DAY);
    EXPECT_EQ(limiter.SetMinUpdateInterval(0), VaultError::None);

    EXPECT_EQ(limiter.SetMaxDailyDecryptions(0), VaultError::InvalidLimit);
    EXPECT_EQ(limiter.GetMaxDailyDecryptions(), 10u);
    EXPECT_EQ(limiter.SetMaxDailyDecryptions(1), VaultError::None);
    EXPECT_EQ(limiter.GetMaxDailyDecryptions(), 1u);
}
