// TCR - Hash Functions
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Pluggable 256-bit hash used for vote commitments, listing identifiers
// and proposal identifiers. Both implementations are backed by OpenSSL EVP.

#ifndef TCR_CRYPTO_HASHER_H
#define TCR_CRYPTO_HASHER_H

#include "tcr/core/types.h"

#include <memory>
#include <string>
#include <vector>

namespace tcr {
namespace crypto {

/// Abstract one-shot 256-bit hash function
class Hasher {
public:
    virtual ~Hasher() = default;

    /// Algorithm name ("sha3-256", "sha256")
    virtual std::string Name() const = 0;

    /// Hash a byte range
    virtual Hash256 Hash(const Byte* data, size_t len) const = 0;

    Hash256 Hash(const std::vector<Byte>& data) const {
        return Hash(data.data(), data.size());
    }

    Hash256 Hash(const std::string& data) const {
        return Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
    }
};

/// SHA3-256 (FIPS 202)
class Sha3Hasher : public Hasher {
public:
    std::string Name() const override { return "sha3-256"; }
    Hash256 Hash(const Byte* data, size_t len) const override;
    using Hasher::Hash;
};

/// SHA-256 (FIPS 180-4)
class Sha256Hasher : public Hasher {
public:
    std::string Name() const override { return "sha256"; }
    Hash256 Hash(const Byte* data, size_t len) const override;
    using Hasher::Hash;
};

/// Create a hasher by name; nullptr for an unknown algorithm
std::shared_ptr<Hasher> CreateHasher(const std::string& name);

/// Default hasher used when none is configured (SHA3-256)
std::shared_ptr<Hasher> DefaultHasher();

// ============================================================================
// Protocol Hashes
// ============================================================================

/// H(choice || salt), both encoded as 32-byte big-endian words
Hash256 ComputeVoteHash(const Hasher& hasher, VoteChoice choice, Salt salt);

/// H(data) of a listing's content
ListingHash ComputeListingHash(const Hasher& hasher, const std::string& data);

/// H(name || value-as-word), identifier of a reparameterization proposal
Hash256 ComputeProposalId(const Hasher& hasher, const std::string& name, uint64_t value);

} // namespace crypto
} // namespace tcr

#endif // TCR_CRYPTO_HASHER_H
