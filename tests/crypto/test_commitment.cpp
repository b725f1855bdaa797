// RISKVAULT - Commitment Derivation Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "riskvault/crypto/commitment.h"
#include "riskvault/crypto/sha256.h"

#include <set>
#include <string>

namespace riskvault {
namespace crypto {
namespace {

class CommitmentTest : public ::testing::Test {
protected:
    Address wallet_ = Address::FromHex("0x00000000000000000000000000000000000000aa");
    Bytes secret_ = Bytes(SECRET_SIZE, 0x42);
};

TEST_F(CommitmentTest, CommitmentLayout) {
    SHA256 hasher;
    hasher.Write(std::string(COMMITMENT_TAG)).Write(wallet_).Write(secret_);
    EXPECT_EQ(DeriveCommitment(wallet_, secret_), CommitmentHash(hasher.Finalize()));
}

TEST_F(CommitmentTest, NullifierLayout) {
    CommitmentHash commitment = DeriveCommitment(wallet_, secret_);
    SHA256 hasher;
    hasher.Write(std::string(NULLIFIER_TAG)).Write(secret_).Write(commitment);
    EXPECT_EQ(DeriveNullifier(secret_, commitment), NullifierHash(hasher.Finalize()));
}

TEST_F(CommitmentTest, BindsWalletAndSecret) {
    CommitmentHash base = DeriveCommitment(wallet_, secret_);
    EXPECT_FALSE(base.IsNull());
    EXPECT_EQ(DeriveCommitment(wallet_, secret_), base);

    Bytes otherSecret = secret_;
    otherSecret.back() ^= 0x01;
    EXPECT_NE(DeriveCommitment(wallet_, otherSecret), base);
    EXPECT_NE(DeriveCommitment(Address::FromHex(std::string(40, 'b')), secret_), base);
}

TEST_F(CommitmentTest, NullifierDiffersFromCommitment) {
    CommitmentHash commitment = DeriveCommitment(wallet_, secret_);
    NullifierHash nullifier = DeriveNullifier(secret_, commitment);
    EXPECT_NE(Hash256(nullifier), Hash256(commitment));
    EXPECT_NE(DeriveNullifier(secret_, DeriveCommitment(Address(), secret_)), nullifier);
}

TEST_F(CommitmentTest, ContractAddresses) {
    Address deployer = Address::FromHex(std::string(40, '1'));
    Address vault = DeriveContractAddress(deployer, 0);
    Address registry = DeriveContractAddress(deployer, 1);

    EXPECT_FALSE(vault.IsNull());
    EXPECT_NE(vault, registry);
    EXPECT_EQ(DeriveContractAddress(deployer, 0), vault);
    EXPECT_NE(DeriveContractAddress(Address::FromHex(std::string(40, '2')), 0), vault);
}

TEST(SecretTest, GenerateSecret) {
    std::set<std::string> seen;
    for (int i = 0; i < 8; ++i) {
        Bytes secret = GenerateSecret();
        ASSERT_EQ(secret.size(), SECRET_SIZE);
        EXPECT_TRUE(seen.insert(std::string(secret.begin(), secret.end())).second);
    }
    EXPECT_EQ(GenerateSecret(16).size(), 16u);
    EXPECT_TRUE(GenerateSecret(0).empty());
}

} // namespace
} // namespace crypto
} // namespace riskvault
