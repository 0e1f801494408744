// TCR - Hasher Tests
// Copyright (c) 2024 TCR Developers
// MIT License

#include <gtest/gtest.h>

#include "tcr/crypto/hasher.h"

namespace tcr {
namespace crypto {
namespace test {

// ============================================================================
// Known-answer vectors
// ============================================================================

TEST(HasherTest, Sha3EmptyString) {
    Sha3Hasher hasher;
    EXPECT_EQ(hasher.Hash(std::string()).ToHex(),
              "0xa7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(HasherTest, Sha3Abc) {
    Sha3Hasher hasher;
    EXPECT_EQ(hasher.Hash(std::string("abc")).ToHex(),
              "0x3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(HasherTest, Sha256EmptyString) {
    Sha256Hasher hasher;
    EXPECT_EQ(hasher.Hash(std::string()).ToHex(),
              "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HasherTest, Sha256Abc) {
    Sha256Hasher hasher;
    EXPECT_EQ(hasher.Hash(std::string("abc")).ToHex(),
              "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HasherTest, OverloadsAgree) {
    Sha3Hasher hasher;
    std::string text = "claimthis.net";
    std::vector<Byte> bytes(text.begin(), text.end());
    EXPECT_EQ(hasher.Hash(text), hasher.Hash(bytes));
    EXPECT_EQ(hasher.Hash(text), hasher.Hash(bytes.data(), bytes.size()));
}

// ============================================================================
// Factory
// ============================================================================

TEST(HasherFactoryTest, CreateByName) {
    auto sha3 = CreateHasher("sha3-256");
    ASSERT_NE(sha3, nullptr);
    EXPECT_EQ(sha3->Name(), "sha3-256");

    auto alias = CreateHasher("sha3");
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(alias->Name(), "sha3-256");

    auto sha256 = CreateHasher("sha256");
    ASSERT_NE(sha256, nullptr);
    EXPECT_EQ(sha256->Name(), "sha256");

    EXPECT_EQ(CreateHasher("md5"), nullptr);
}

TEST(HasherFactoryTest, DefaultIsSha3) {
    ASSERT_NE(DefaultHasher(), nullptr);
    EXPECT_EQ(DefaultHasher()->Name(), "sha3-256");
}

// ============================================================================
// Protocol hashes
// ============================================================================

TEST(ProtocolHashTest, VoteHashIsTwoBigEndianWords) {
    Sha3Hasher hasher;
    Byte buf[64];
    WriteUint256BE(1, buf);
    WriteUint256BE(420, buf + 32);
    EXPECT_EQ(ComputeVoteHash(hasher, 1, 420), hasher.Hash(buf, sizeof(buf)));
}

TEST(ProtocolHashTest, VoteHashBindsChoiceAndSalt) {
    Sha3Hasher hasher;
    Hash256 h = ComputeVoteHash(hasher, 0, 420);
    EXPECT_EQ(h, ComputeVoteHash(hasher, 0, 420));
    EXPECT_NE(h, ComputeVoteHash(hasher, 1, 420));
    EXPECT_NE(h, ComputeVoteHash(hasher, 0, 421));
    EXPECT_FALSE(h.IsNull());
}

TEST(ProtocolHashTest, ListingHash) {
    Sha3Hasher hasher;
    EXPECT_EQ(ComputeListingHash(hasher, "claimthis.net"),
              hasher.Hash(std::string("claimthis.net")));
    EXPECT_NE(ComputeListingHash(hasher, "a.net"), ComputeListingHash(hasher, "b.net"));
}

TEST(ProtocolHashTest, ProposalIdDependsOnNameAndValue) {
    Sha3Hasher hasher;
    Hash256 id = ComputeProposalId(hasher, "voteQuorum", 51);
    EXPECT_EQ(id, ComputeProposalId(hasher, "voteQuorum", 51));
    EXPECT_NE(id, ComputeProposalId(hasher, "voteQuorum", 52));
    EXPECT_NE(id, ComputeProposalId(hasher, "pVoteQuorum", 51));
}

TEST(ProtocolHashTest, AlgorithmsDisagree) {
    Sha3Hasher sha3;
    Sha256Hasher sha256;
    EXPECT_NE(ComputeVoteHash(sha3, 1, 7), ComputeVoteHash(sha256, 1, 7));
}

} // namespace test
} // namespace crypto
} // namespace tcr
