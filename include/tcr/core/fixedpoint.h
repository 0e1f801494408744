// TCR - Fixed-point Reward Arithmetic
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Integer "wei" scaling used for every proportional split in settlement:
//   DivideAndGetWei(n, d)      = n * WEI_SCALE / d
//   MultiplyFromWei(x, w)      = x * w / WEI_SCALE
//   MultiplyByPercentage(x, y) = MultiplyFromWei(x, DivideAndGetWei(y, 100))
// Products are formed in 128 bits before the division.

#ifndef TCR_CORE_FIXEDPOINT_H
#define TCR_CORE_FIXEDPOINT_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <cstdint>

namespace tcr {
namespace fixedpoint {

/// Scale factor of a wei-scaled ratio (1 gwei)
constexpr uint64_t WEI_SCALE = 1000000000ULL;

/// Percentage denominator
constexpr uint64_t PERCENT = 100;

/// numerator * WEI_SCALE / denominator
Status DivideAndGetWei(uint64_t numerator, uint64_t denominator, uint64_t* weiQuotient);

/// x * weiQuotient / WEI_SCALE
Status MultiplyFromWei(Amount x, uint64_t weiQuotient, Amount* result);

/// x * (y / z), computed through a wei-scaled ratio
Status MultiplyByPercentage(Amount x, uint64_t y, uint64_t z, Amount* result);

/// x * (y / 100)
inline Status MultiplyByPercentage(Amount x, uint64_t y, Amount* result) {
    return MultiplyByPercentage(x, y, PERCENT, result);
}

/**
 * Share of a reward pool owed to a voter.
 *
 * Never exceeds rewardPool * voterTokens / totalTokens, so the sum of all
 * shares of one pool never exceeds the pool.
 */
Status ProportionalShare(Amount rewardPool, Amount voterTokens, Amount totalTokens,
                         Amount* share);

/// a + b, failing instead of wrapping
Status CheckedAdd(Amount a, Amount b, Amount* result);

/// start + length seconds; Overflow if the deadline does not fit a Timestamp
Status CheckedDeadline(Timestamp start, uint64_t length, Timestamp* deadline);

} // namespace fixedpoint
} // namespace tcr

#endif // TCR_CORE_FIXEDPOINT_H
