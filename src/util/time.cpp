// TCR - Protocol Clock Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/util/time.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tcr {
namespace util {

namespace {

std::atomic<bool> g_mockEnabled{false};
std::atomic<int64_t> g_mockNow{0};

int64_t WallClock() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

// ============================================================================
// Clock
// ============================================================================

int64_t GetTime() {
    return g_mockEnabled.load() ? g_mockNow.load() : WallClock();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }

    const int64_t parts[] = {seconds / 86400, seconds / 3600 % 24, seconds / 60 % 60};
    const char units[] = {'d', 'h', 'm'};

    std::ostringstream out;
    bool leading = true;
    for (size_t i = 0; i < 3; ++i) {
        if (leading && parts[i] == 0) {
            continue;
        }
        leading = false;
        out << parts[i] << units[i] << ' ';
    }
    out << seconds % 60 << 's';
    return out.str();
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

bool IsMockTimeEnabled() {
    return g_mockEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockNow.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockNow.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockNow.load();
}

} // namespace util
} // namespace tcr
