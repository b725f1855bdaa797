// RISKVAULT - Ledger Clock
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// The ledger reads Unix seconds through GetTime(). Tests freeze and step
// that clock with the mock time functions.

#ifndef RISKVAULT_UTIL_TIME_H
#define RISKVAULT_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace riskvault {
namespace util {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

using Seconds = std::chrono::seconds;

/// Unix time in seconds; the mock value while mock time is enabled
int64_t GetTime();

/// UTC rendering, e.g. "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// Largest units first, e.g. "30d" or "1h 5m"
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time
// ============================================================================

/// Freeze GetTime(). Starts from the wall clock if no mock time was set.
void EnableMockTime();
void DisableMockTime();

void SetMockTime(int64_t timestamp);
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace riskvault

#endif // RISKVAULT_UTIL_TIME_H
