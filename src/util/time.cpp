// RISKVAULT - Ledger Clock
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/util/time.h"

#include <atomic>
#include <ctime>
#include <sstream>

namespace riskvault {
namespace util {

namespace {

std::atomic<bool> g_mockEnabled{false};
std::atomic<int64_t> g_mockNow{0};

int64_t WallClock() {
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

int64_t GetTime() {
    return g_mockEnabled.load() ? g_mockNow.load() : WallClock();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    if (gmtime_r(&t, &utc) == nullptr) {
        return std::to_string(timestamp);
    }
    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, len);
}

std::string FormatDuration(Seconds duration) {
    int64_t remaining = duration.count();
    if (remaining == 0) {
        return "0s";
    }
    
    std::ostringstream oss;
    if (remaining < 0) {
        oss << '-';
        remaining = -remaining;
    }
    
    static const struct { int64_t size; char suffix; } units[] = {
        {SECONDS_PER_DAY, 'd'},
        {SECONDS_PER_HOUR, 'h'},
        {SECONDS_PER_MINUTE, 'm'},
        {1, 's'},
    };
    
    bool first = true;
    for (const auto& unit : units) {
        int64_t count = remaining / unit.size;
        remaining %= unit.size;
        if (count == 0) {
            continue;
        }
        if (!first) {
            oss << ' ';
        }
        oss << count << unit.suffix;
        first = false;
    }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    int64_t unset = 0;
    g_mockNow.compare_exchange_strong(unset, WallClock());
    g_mockEnabled.store(true);
}

void DisableMockTime() {
    g_mockEnabled.store(false);
}

void SetMockTime(int64_t timestamp) {
    g_mockNow.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockNow.fetch_add(duration.count());
}

} // namespace util
} // namespace riskvault
