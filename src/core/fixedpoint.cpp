// TCR - Fixed-point Reward Arithmetic Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/core/fixedpoint.h"

#include <limits>

namespace tcr {
namespace fixedpoint {

namespace {

Status Narrow(__uint128_t value, uint64_t* out) {
    if (value > static_cast<__uint128_t>(UINT64_MAX)) {
        return Status::Overflow("result exceeds 64 bits");
    }
    *out = static_cast<uint64_t>(value);
    return Status::Ok();
}

} // anonymous namespace

Status DivideAndGetWei(uint64_t numerator, uint64_t denominator, uint64_t* weiQuotient) {
    if (denominator == 0) {
        return Status::DivisionByZero("wei ratio with zero denominator");
    }
    __uint128_t scaled = static_cast<__uint128_t>(numerator) * WEI_SCALE;
    return Narrow(scaled / denominator, weiQuotient);
}

Status MultiplyFromWei(Amount x, uint64_t weiQuotient, Amount* result) {
    __uint128_t product = static_cast<__uint128_t>(x) * weiQuotient;
    return Narrow(product / WEI_SCALE, result);
}

Status MultiplyByPercentage(Amount x, uint64_t y, uint64_t z, Amount* result) {
    uint64_t ratio = 0;
    Status s = DivideAndGetWei(y, z, &ratio);
    if (!s.ok()) return s;
    return MultiplyFromWei(x, ratio, result);
}

Status ProportionalShare(Amount rewardPool, Amount voterTokens, Amount totalTokens,
                         Amount* share) {
    if (totalTokens == 0) {
        return Status::DivisionByZero("no winning tokens to share the pool");
    }
    if (voterTokens > totalTokens) {
        return Status::InvalidArgument("voter tokens exceed winning total");
    }
    uint64_t ratio = 0;
    Status s = DivideAndGetWei(voterTokens, totalTokens, &ratio);
    if (!s.ok()) return s;
    return MultiplyFromWei(rewardPool, ratio, share);
}

Status CheckedAdd(Amount a, Amount b, Amount* result) {
    if (a > MAX_AMOUNT - b) {
        return Status::Overflow("amount addition overflows");
    }
    *result = a + b;
    return Status::Ok();
}

Status CheckedDeadline(Timestamp start, uint64_t length, Timestamp* deadline) {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    if (length > static_cast<uint64_t>(kMax) ||
        start > kMax - static_cast<Timestamp>(length)) {
        return Status::Overflow("deadline past the end of time");
    }
    *deadline = start + static_cast<Timestamp>(length);
    return Status::Ok();
}

} // namespace fixedpoint
} // namespace tcr
