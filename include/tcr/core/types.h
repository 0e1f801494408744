// TCR - Core Types Header
// Copyright (c) 2024 TCR Developers
// MIT License
//
// This file defines fundamental types used throughout the TCR library.

#ifndef TCR_CORE_TYPES_H
#define TCR_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace tcr {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in base units (never negative)
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Poll identifier, also used as challenge identifier (0 = none)
using PollId = uint64_t;

/// Challenge identifier (equal to the id of the poll that resolves it)
using ChallengeId = uint64_t;

/// Epoch number in the bank ledger (equal to the challenge id)
using EpochNumber = uint64_t;

/// Vote choice (1 = keep the listing / accept the proposal, anything else = against)
using VoteChoice = uint64_t;

/// Secret salt hashed with the vote choice at commit time
using Salt = uint64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = UINT64_MAX;

// ============================================================================
// Fixed-size Byte Strings
// ============================================================================

/**
 * Fixed-size opaque byte string used for hashes and addresses.
 * Rendered as 0x-prefixed lowercase hex in natural byte order.
 */
template<size_t BYTES>
class FixedBytes {
public:
    static constexpr size_t SIZE = BYTES;

    FixedBytes() noexcept { data_.fill(0); }

    explicit FixedBytes(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded on the right)
    FixedBytes(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const FixedBytes& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const FixedBytes& other) const noexcept { return data_ != other.data_; }
    bool operator<(const FixedBytes& other) const noexcept { return data_ < other.data_; }

    /// Convert to 0x-prefixed hex string
    std::string ToHex() const;

    /// Parse hex (with or without 0x prefix); invalid input yields a null value
    static FixedBytes FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
using Hash256 = FixedBytes<32>;

/// 160-bit account address (20 bytes)
using Address = FixedBytes<20>;

/// Listing identifier (hash of the listing's content)
using ListingHash = Hash256;

/// Build a deterministic address from a label (test accounts, contract addresses)
Address MakeAddress(const std::string& label);

// ============================================================================
// Hex Helpers
// ============================================================================

/// Encode bytes as lowercase hex (no prefix)
std::string HexEncode(const Byte* data, size_t len);

/// Decode hex (optional 0x prefix); returns false on malformed input
bool HexDecode(const std::string& hex, std::vector<Byte>& out);

/// Write a 64-bit value as a 32-byte big-endian word (ABI uint256 layout)
void WriteUint256BE(uint64_t value, Byte out[32]);

} // namespace tcr

#endif // TCR_CORE_TYPES_H
