// TCR - Hash Functions Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/crypto/hasher.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace tcr {
namespace crypto {

namespace {

Hash256 EvpDigest(const EVP_MD* md, const Byte* data, size_t len) {
    Hash256 out;
    unsigned int outLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx != nullptr &&
              EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, out.data(), &outLen) == 1;
    if (ctx) {
        EVP_MD_CTX_free(ctx);
    }

    if (!ok || outLen != Hash256::SIZE) {
        throw std::runtime_error("EVP digest failed");
    }
    return out;
}

} // anonymous namespace

Hash256 Sha3Hasher::Hash(const Byte* data, size_t len) const {
    return EvpDigest(EVP_sha3_256(), data, len);
}

Hash256 Sha256Hasher::Hash(const Byte* data, size_t len) const {
    return EvpDigest(EVP_sha256(), data, len);
}

std::shared_ptr<Hasher> CreateHasher(const std::string& name) {
    if (name == "sha3-256" || name == "sha3") {
        return std::make_shared<Sha3Hasher>();
    }
    if (name == "sha256") {
        return std::make_shared<Sha256Hasher>();
    }
    return nullptr;
}

std::shared_ptr<Hasher> DefaultHasher() {
    static std::shared_ptr<Hasher> instance = std::make_shared<Sha3Hasher>();
    return instance;
}

// ============================================================================
// Protocol Hashes
// ============================================================================

Hash256 ComputeVoteHash(const Hasher& hasher, VoteChoice choice, Salt salt) {
    Byte buf[64];
    WriteUint256BE(choice, buf);
    WriteUint256BE(salt, buf + 32);
    return hasher.Hash(buf, sizeof(buf));
}

ListingHash ComputeListingHash(const Hasher& hasher, const std::string& data) {
    return hasher.Hash(data);
}

Hash256 ComputeProposalId(const Hasher& hasher, const std::string& name, uint64_t value) {
    std::vector<Byte> buf(name.begin(), name.end());
    Byte word[32];
    WriteUint256BE(value, word);
    buf.insert(buf.end(), word, word + sizeof(word));
    return hasher.Hash(buf);
}

} // namespace crypto
} // namespace tcr
