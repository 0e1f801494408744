// TCR - Protocol Clock
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Every stage boundary in the library (application expiry, commit and
// reveal end dates, processBy) is an absolute Unix timestamp compared
// against util::GetTime(). Tests pin and advance that clock with the
// mock-time functions instead of sleeping.

#ifndef TCR_UTIL_TIME_H
#define TCR_UTIL_TIME_H

#include <cstdint>
#include <string>

namespace tcr {
namespace util {

// ============================================================================
// Clock
// ============================================================================

/// Unix seconds; the mock value while mock time is enabled
int64_t GetTime();

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// Stage lengths for logs, e.g. "1d 2h 3m 4s", "10m 0s"
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time
// ============================================================================

/// Pin the clock. Starts from the wall clock if no mock value was set.
void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);
void AdvanceMockTime(int64_t seconds);

/// 0 if never set
int64_t GetMockTime();

} // namespace util
} // namespace tcr

#endif // TCR_UTIL_TIME_H
