// TCR - Core Types Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/core/types.h"

namespace tcr {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// ============================================================================
// Hex Helpers
// ============================================================================

std::string HexEncode(const Byte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result += HEX_DIGITS[data[i] >> 4];
        result += HEX_DIGITS[data[i] & 0x0f];
    }
    return result;
}

bool HexDecode(const std::string& hex, std::vector<Byte>& out) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        return false;
    }

    out.clear();
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<Byte>((hi << 4) | lo));
    }
    return true;
}

void WriteUint256BE(uint64_t value, Byte out[32]) {
    std::memset(out, 0, 32);
    for (int i = 0; i < 8; ++i) {
        out[31 - i] = static_cast<Byte>(value >> (8 * i));
    }
}

// ============================================================================
// FixedBytes
// ============================================================================

template<size_t BYTES>
std::string FixedBytes<BYTES>::ToHex() const {
    return "0x" + HexEncode(data_.data(), SIZE);
}

template<size_t BYTES>
FixedBytes<BYTES> FixedBytes<BYTES>::FromHex(const std::string& hex) {
    std::vector<Byte> bytes;
    if (!HexDecode(hex, bytes) || bytes.size() != SIZE) {
        return FixedBytes();
    }
    return FixedBytes(bytes.data(), bytes.size());
}

template class FixedBytes<20>;
template class FixedBytes<32>;

Address MakeAddress(const std::string& label) {
    // Labels are packed into the address verbatim and right-aligned so
    // different labels never collide for labels up to 20 bytes.
    std::array<Byte, Address::SIZE> bytes{};
    size_t len = std::min(label.size(), Address::SIZE);
    std::memcpy(bytes.data() + (Address::SIZE - len), label.data(), len);
    return Address(bytes);
}

} // namespace tcr
