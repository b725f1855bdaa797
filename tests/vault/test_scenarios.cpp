// RISKVAULT - End-to-End Ledger Scenarios
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "vault/vault_fixture.h"
#include "riskvault/crypto/commitment.h"
#include "riskvault/util/time.h"
#include "riskvault/vault/ledger.h"

using namespace riskvault;
using namespace riskvault::vault;
using namespace riskvault::vault::testing;

// ============================================================================
// Test Fixture
// ============================================================================

class ScenarioTest : public ::testing::Test {
protected:
    static constexpr Timestamp T0 = 1710000000;
    static constexpr BlockHeight ANALYSIS_HEIGHT = 12345;

    Address owner_ = MakeAddress(0x01);
    Address updater_ = MakeAddress(0x02);
    Address recipient_ = MakeAddress(0x03);
    Address dao_ = MakeAddress(0x04);
    Address attacker_ = MakeAddress(0x0e);

    std::unique_ptr<RiskLedger> ledger_;

    void SetUp() override {
        util::SetMockTime(T0);
        util::EnableMockTime();

        ledger_ = std::make_unique<RiskLedger>(VaultParams::Main(), owner_, MakeFakeVerifier());
        ASSERT_EQ(ledger_->SetAuthorizedUpdater(owner_, updater_, true), VaultError::None);
    }

    void TearDown() override {
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    /// Commitment and nullifier derived from a wallet and its secret
    RiskAnalysis Derived(const Address& wallet, const Bytes& secret, uint32_t score) const {
        RiskAnalysis a;
        a.commitment = crypto::DeriveCommitment(wallet, secret);
        a.nullifier = crypto::DeriveNullifier(secret, a.commitment);
        a.encryptedScore = EncryptScore(score);
        a.scoreProof = ValidProof();
        a.blockHeight = ANALYSIS_HEIGHT;
        a.addressProof = ValidProof();
        a.recipient = recipient_;
        return a;
    }

    static Bytes Secret(Byte tag) {
        Bytes s(32, 0x5e);
        s[31] = tag;
        return s;
    }
};

// ============================================================================
// Submission and Replay
// ============================================================================

TEST_F(ScenarioTest, SubmitMintsPassportAndBlocksNullifierReplay) {
    Address wallet = MakeAddress(0x31);
    RiskAnalysis first = Derived(wallet, Secret(1), 4200);

    auto result = ledger_->SubmitRiskAnalysis(updater_, first);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.tokenId, 0u);
    EXPECT_EQ(result.band, RiskBand::Medium);

    const PassportRegistry& registry = ledger_->GetRegistry();
    EXPECT_EQ(registry.OwnerOf(0), std::optional<Address>(recipient_));
    EXPECT_EQ(registry.GetPassport(0)->expiry, T0 + 30 * ONE_DAY);
    EXPECT_EQ(ledger_->GetVault().GetRiskBand(first.commitment), RiskBand::Medium);
    EXPECT_EQ(registry.GetPassportRiskBand(0), RiskBand::Medium);

    util::AdvanceMockTime(util::Seconds{2 * 3600});

    // A different commitment carrying the spent nullifier
    RiskAnalysis replay = Derived(MakeAddress(0x32), Secret(2), 1000);
    replay.nullifier = first.nullifier;
    EXPECT_EQ(ledger_->SubmitRiskAnalysis(updater_, replay).error, VaultError::NullifierAlreadyUsed);
    EXPECT_FALSE(ledger_->GetVault().CommitmentExists(replay.commitment));
    EXPECT_EQ(registry.TotalSupply(), 1u);
}

TEST_F(ScenarioTest, UpdaterThrottledUntilIntervalElapses) {
    ASSERT_TRUE(ledger_->SubmitRiskAnalysis(updater_, Derived(MakeAddress(0x31), Secret(1), 100)).ok());

    RiskAnalysis second = Derived(MakeAddress(0x32), Secret(2), 100);
    EXPECT_EQ(ledger_->SubmitRiskAnalysis(updater_, second).error, VaultError::RateLimited);

    util::AdvanceMockTime(util::Seconds{ledger_->GetVault().GetMinUpdateInterval()});
    auto result = ledger_->SubmitRiskAnalysis(updater_, second);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.tokenId, 1u);
}

// ============================================================================
// Expiry and Revocation
// ============================================================================

TEST_F(ScenarioTest, VerificationFailsOnceExpired) {
    RiskAnalysis analysis = Derived(MakeAddress(0x31), Secret(1), 2000);
    ASSERT_TRUE(ledger_->SubmitRiskAnalysis(updater_, analysis).ok());

    auto fresh = ledger_->VerifyPassportThreshold(dao_, 0, 3000, ValidProof());
    ASSERT_TRUE(fresh.ok()) << fresh.error;
    EXPECT_TRUE(fresh.below);

    util::AdvanceMockTime(util::Seconds{30 * ONE_DAY + 1});
    EXPECT_EQ(ledger_->VerifyRiskThreshold(dao_, analysis.commitment, 3000, ValidProof()).error,
              VaultError::RiskScoreExpired);
    EXPECT_EQ(ledger_->VerifyPassportThreshold(dao_, 0, 3000, ValidProof()).error,
              VaultError::PassportExpired);

    // The band stays readable
    EXPECT_EQ(ledger_->GetVault().GetRiskBand(analysis.commitment), RiskBand::Low);
}

TEST_F(ScenarioTest, RevokedPassportInvalidBeforeExpiry) {
    ASSERT_TRUE(ledger_->SubmitRiskAnalysis(updater_, Derived(MakeAddress(0x31), Secret(1), 2000)).ok());
    ASSERT_EQ(ledger_->RevokePassport(owner_, 0, "policy violation"), VaultError::None);

    Timestamp now = ledger_->Now();
    auto validity = ledger_->GetRegistry().IsPassportValid(0, now);
    EXPECT_FALSE(validity.valid);
    EXPECT_GT(validity.expiry, now);
    EXPECT_EQ(ledger_->VerifyPassportThreshold(dao_, 0, 3000, ValidProof()).error,
              VaultError::PassportRevoked);
}

// ============================================================================
// Owner-Gated Administration
// ============================================================================

TEST_F(ScenarioTest, AdminCallsDeniedToNonOwnersAndWhilePaused) {
    ASSERT_TRUE(ledger_->SubmitRiskAnalysis(updater_, Derived(MakeAddress(0x31), Secret(1), 2000)).ok());

    // While paused the pause check comes before the owner check
    auto expectDenied = [this](const char* label, bool paused) {
        CommitmentHash c = MakeCommitment(1);
        VaultError vaultErr = paused ? VaultError::ContractPaused : VaultError::NotAuthorized;
        VaultError registryErr = paused ? VaultError::ContractPaused : VaultError::UnauthorizedAccount;

        EXPECT_EQ(ledger_->SetAuthorizedUpdater(attacker_, attacker_, true), vaultErr) << label;
        EXPECT_EQ(ledger_->SetVerifier(attacker_, MakeFakeVerifier()), vaultErr) << label;
        EXPECT_EQ(ledger_->SetMinUpdateInterval(attacker_, 0), vaultErr) << label;
        EXPECT_EQ(ledger_->SetMaxDailyDecryptions(attacker_, 100), vaultErr) << label;
        EXPECT_EQ(ledger_->SetCustomValidityPeriod(attacker_, c, ONE_DAY), vaultErr) << label;
        EXPECT_EQ(ledger_->TransferVaultOwnership(attacker_, attacker_), vaultErr) << label;
        EXPECT_EQ(ledger_->Pause(attacker_), VaultError::NotAuthorized) << label;
        EXPECT_EQ(ledger_->Unpause(attacker_), VaultError::NotAuthorized) << label;

        EXPECT_EQ(ledger_->RevokePassport(attacker_, 0, "x"), registryErr) << label;
        EXPECT_EQ(ledger_->SetPassportValidityPeriod(attacker_, ONE_DAY), registryErr) << label;
        EXPECT_EQ(ledger_->TransferRegistryOwnership(attacker_, attacker_), registryErr) << label;
    };

    expectDenied("running", false);

    // An authorized updater is still not an owner
    EXPECT_EQ(ledger_->Pause(updater_), VaultError::NotAuthorized);

    ASSERT_EQ(ledger_->Pause(owner_), VaultError::None);
    expectDenied("paused", true);

    // Pause also stops the owner
    EXPECT_EQ(ledger_->SetAuthorizedUpdater(owner_, attacker_, true), VaultError::ContractPaused);
    EXPECT_EQ(ledger_->RevokePassport(owner_, 0, "x"), VaultError::ContractPaused);
    EXPECT_EQ(ledger_->SetPassportValidityPeriod(owner_, ONE_DAY), VaultError::ContractPaused);

    BlockHeight before = ledger_->GetBlockNumber();
    size_t events = ledger_->GetEvents().Size();
    expectDenied("again", true);
    EXPECT_EQ(ledger_->GetBlockNumber(), before);
    EXPECT_EQ(ledger_->GetEvents().Size(), events);
    EXPECT_EQ(ledger_->GetVault().GetOwner(), owner_);
    EXPECT_EQ(ledger_->GetRegistry().GetOwner(), owner_);
    EXPECT_FALSE(ledger_->GetRegistry().GetPassport(0)->revoked);
    EXPECT_FALSE(ledger_->GetVault().IsAuthorizedUpdater(attacker_));
}

// ============================================================================
// Passport Transfer
// ============================================================================

TEST_F(ScenarioTest, TransferredPassportServesNewHolder) {
    ASSERT_TRUE(ledger_->SubmitRiskAnalysis(updater_, Derived(MakeAddress(0x31), Secret(1), 8000)).ok());
    Address buyer = MakeAddress(0x41);

    ASSERT_EQ(ledger_->TransferFrom(recipient_, recipient_, buyer, 0), VaultError::None);
    EXPECT_EQ(ledger_->GetRegistry().OwnerOf(0), std::optional<Address>(buyer));

    auto result = ledger_->VerifyPassportThreshold(buyer, 0, 7500, ValidProof());
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_FALSE(result.below);

    ASSERT_EQ(ledger_->Pause(owner_), VaultError::None);
    EXPECT_EQ(ledger_->TransferFrom(buyer, buyer, recipient_, 0), VaultError::ContractPaused);
}
