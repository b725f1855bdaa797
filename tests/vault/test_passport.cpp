// RISKVAULT - Passport Registry Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "vault/vault_fixture.h"

using namespace riskvault;
using namespace riskvault::vault;
using namespace riskvault::vault::testing;

class PassportTest : public VaultFixture {
protected:
    /// Submit analysis `tag` for recipient and return the minted token
    TokenId MintFor(Byte tag, const Address& recipient, uint32_t score = 2000) {
        auto analysis = Analysis(tag, score);
        analysis.recipient = recipient;
        auto result = vault_->SubmitRiskAnalysis(Ctx(owner_), analysis);
        EXPECT_TRUE(result.ok()) << result.error;
        Advance(3600);
        return result.tokenId;
    }
};

// ============================================================================
// Deployment
// ============================================================================

TEST_F(PassportTest, DeployValidation) {
    EventLog log;
    auto noVault = PassportRegistry::Deploy(MakeAddress(0xb1), owner_, nullptr,
                                            DEFAULT_VALIDITY_PERIOD, log);
    EXPECT_EQ(noVault.first, VaultError::InvalidVaultAddress);
    EXPECT_EQ(noVault.second.get(), nullptr);

    RiskScoreVault nullAddressVault(Address(), owner_, VaultParams::Main(), log);
    auto badVault = PassportRegistry::Deploy(MakeAddress(0xb1), owner_, &nullAddressVault,
                                             DEFAULT_VALIDITY_PERIOD, log);
    EXPECT_EQ(badVault.first, VaultError::InvalidVaultAddress);

    auto noOwner = PassportRegistry::Deploy(MakeAddress(0xb1), Address(), vault_.get(),
                                            DEFAULT_VALIDITY_PERIOD, log);
    EXPECT_EQ(noOwner.first, VaultError::ZeroAddress);

    auto badPeriod = PassportRegistry::Deploy(MakeAddress(0xb1), owner_, vault_.get(), 3600, log);
    EXPECT_EQ(badPeriod.first, VaultError::InvalidPeriod);
}

TEST_F(PassportTest, DeployedState) {
    EXPECT_EQ(registry_->GetOwner(), owner_);
    EXPECT_EQ(registry_->GetVaultAddress(), vaultAddr_);
    EXPECT_EQ(registry_->GetValidityPeriod(), DEFAULT_VALIDITY_PERIOD);
    EXPECT_EQ(registry_->TotalSupply(), 0u);
    EXPECT_EQ(registry_->NextTokenId(), 0u);
    EXPECT_EQ(vault_->GetPassportNFT(), registryAddr_);
}

// ============================================================================
// Minting
// ============================================================================

TEST_F(PassportTest, TokenIdsAreSequential) {
    EXPECT_EQ(MintFor(1, user_), 0u);
    EXPECT_EQ(MintFor(2, user_), 1u);
    EXPECT_EQ(MintFor(3, dao_), 2u);

    EXPECT_EQ(registry_->TotalSupply(), 3u);
    EXPECT_EQ(registry_->NextTokenId(), 3u);
    EXPECT_EQ(registry_->BalanceOf(user_), 2u);
    EXPECT_EQ(registry_->BalanceOf(dao_), 1u);
    EXPECT_EQ(registry_->BalanceOf(stranger_), 0u);
    EXPECT_EQ(registry_->GetTokenByCommitment(MakeCommitment(2)), std::optional<TokenId>(1));
}

TEST_F(PassportTest, PassportContents) {
    TokenId id = MintFor(1, user_, 8000);

    auto p = registry_->GetPassport(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->owner, user_);
    EXPECT_EQ(p->commitment, MakeCommitment(1));
    EXPECT_EQ(p->mintTime, T0);
    EXPECT_EQ(p->expiry, T0 + DEFAULT_VALIDITY_PERIOD);
    EXPECT_FALSE(p->revoked);

    EXPECT_EQ(registry_->GetPassportCommitment(id), std::optional<CommitmentHash>(MakeCommitment(1)));
    EXPECT_EQ(registry_->GetPassportHolder(id), std::optional<Address>(user_));
    EXPECT_EQ(registry_->GetPassportRiskBand(id), RiskBand::High);
    EXPECT_EQ(registry_->GetPassportRiskBand(99), RiskBand::Unknown);
    EXPECT_FALSE(registry_->GetPassport(99).has_value());
}

TEST_F(PassportTest, MintOnlyFromVault) {
    auto result = registry_->MintFromVault(Ctx(owner_), MakeCommitment(1), user_);
    EXPECT_EQ(result.error, VaultError::OnlyVault);
    EXPECT_EQ(registry_->TotalSupply(), 0u);
}

TEST_F(PassportTest, MintRevalidatesVaultState) {
    CallContext fromVault = Ctx(owner_).ForwardedBy(vaultAddr_);

    // Commitment the vault has never recorded
    EXPECT_EQ(registry_->MintFromVault(fromVault, MakeCommitment(5), user_).error,
              VaultError::CommitmentNotInVault);

    MintFor(1, user_);
    EXPECT_EQ(registry_->MintFromVault(fromVault, MakeCommitment(1), user_).error,
              VaultError::PassportAlreadyExists);
    EXPECT_EQ(registry_->MintFromVault(fromVault, MakeCommitment(1), Address()).error,
              VaultError::ZeroAddress);

    ASSERT_EQ(vault_->Pause(Ctx(owner_)), VaultError::None);
    EXPECT_EQ(registry_->MintFromVault(fromVault, MakeCommitment(1), user_).error,
              VaultError::ContractPaused);
}

// ============================================================================
// Validity
// ============================================================================

TEST_F(PassportTest, ValidityWindow) {
    TokenId id = MintFor(1, user_);
    Timestamp expiry = T0 + DEFAULT_VALIDITY_PERIOD;

    auto fresh = registry_->IsPassportValid(id, T0);
    EXPECT_TRUE(fresh.valid);
    EXPECT_EQ(fresh.expiry, expiry);

    EXPECT_TRUE(registry_->IsPassportValid(id, expiry - 1).valid);
    EXPECT_FALSE(registry_->IsPassportValid(id, expiry).valid);

    auto missing = registry_->IsPassportValid(42, T0);
    EXPECT_FALSE(missing.valid);
    EXPECT_EQ(missing.expiry, 0);
}

TEST_F(PassportTest, ValidityPeriodChangeAffectsNewPassportsOnly) {
    TokenId first = MintFor(1, user_);
    ASSERT_EQ(registry_->SetValidityPeriod(Ctx(owner_), 7 * ONE_DAY), VaultError::None);
    EXPECT_EQ(events_.Last<ValidityPeriodUpdated>()->period, 7 * ONE_DAY);

    Timestamp secondMint = now_;
    TokenId second = MintFor(2, user_);

    EXPECT_EQ(registry_->GetPassport(first)->expiry, T0 + DEFAULT_VALIDITY_PERIOD);
    EXPECT_EQ(registry_->GetPassport(second)->expiry, secondMint + 7 * ONE_DAY);
}

TEST_F(PassportTest, SetValidityPeriodValidation) {
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(stranger_), 7 * ONE_DAY),
              VaultError::UnauthorizedAccount);
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(owner_), ONE_DAY - 1), VaultError::InvalidPeriod);
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(owner_), MAX_VALIDITY_PERIOD + 1),
              VaultError::InvalidPeriod);
    EXPECT_EQ(registry_->GetValidityPeriod(), DEFAULT_VALIDITY_PERIOD);
}

// ============================================================================
// Revocation
// ============================================================================

TEST_F(PassportTest, Revoke) {
    TokenId id = MintFor(1, user_);

    ASSERT_EQ(registry_->RevokePassport(Ctx(owner_), id, "sanctioned"), VaultError::None);
    EXPECT_FALSE(registry_->IsPassportValid(id, now_).valid);

    auto p = registry_->GetPassport(id);
    EXPECT_TRUE(p->revoked);
    EXPECT_EQ(p->revokeReason, "sanctioned");

    const auto* ev = events_.Last<PassportRevoked>();
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->tokenId, id);
    EXPECT_EQ(ev->owner, user_);
    EXPECT_EQ(ev->reason, "sanctioned");

    // The vault record is untouched
    EXPECT_TRUE(vault_->HasValidScore(MakeCommitment(1), now_).valid);
}

TEST_F(PassportTest, RevokeErrors) {
    TokenId id = MintFor(1, user_);

    EXPECT_EQ(registry_->RevokePassport(Ctx(user_), id, "x"), VaultError::UnauthorizedAccount);
    EXPECT_EQ(registry_->RevokePassport(Ctx(owner_), 77, "x"), VaultError::PassportNotFound);

    ASSERT_EQ(registry_->RevokePassport(Ctx(owner_), id, "first"), VaultError::None);
    EXPECT_EQ(registry_->RevokePassport(Ctx(owner_), id, "second"), VaultError::PassportRevoked);
    EXPECT_EQ(registry_->GetPassport(id)->revokeReason, "first");
}

// ============================================================================
// Verification by Token
// ============================================================================

TEST_F(PassportTest, VerifyThroughPassport) {
    TokenId id = MintFor(1, user_, 2000);

    auto result = registry_->VerifyRiskThreshold(Ctx(dao_), id, 3000, ValidProof());
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_TRUE(result.below);

    // Charged to the DAO, not the registry
    EXPECT_EQ(vault_->GetRemainingDecryptions(dao_, now_), 9u);
    EXPECT_EQ(vault_->GetRemainingDecryptions(registryAddr_, now_), 10u);

    const auto* ev = events_.Last<DAOVerificationPerformed>();
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->requester, dao_);
    EXPECT_EQ(ev->commitment, MakeCommitment(1));
}

TEST_F(PassportTest, VerifyThroughPassportErrors) {
    EXPECT_EQ(registry_->VerifyRiskThreshold(Ctx(dao_), 0, 3000, ValidProof()).error,
              VaultError::PassportNotFound);

    TokenId id = MintFor(1, user_);
    EXPECT_EQ(registry_->VerifyRiskThreshold(Ctx(dao_), id, 3000, BadProof()).error,
              VaultError::InvalidProof);

    ASSERT_EQ(registry_->RevokePassport(Ctx(owner_), id, "fraud"), VaultError::None);
    EXPECT_EQ(registry_->VerifyRiskThreshold(Ctx(dao_), id, 3000, ValidProof()).error,
              VaultError::PassportRevoked);

    // Expiry is checked before revocation
    now_ = T0 + DEFAULT_VALIDITY_PERIOD;
    EXPECT_EQ(registry_->VerifyRiskThreshold(Ctx(dao_), id, 3000, ValidProof()).error,
              VaultError::PassportExpired);
}

TEST_F(PassportTest, PassportOutlivesShorterScoreValidity) {
    TokenId id = MintFor(1, user_);
    ASSERT_EQ(vault_->SetCustomValidityPeriod(Ctx(owner_), MakeCommitment(1), ONE_DAY),
              VaultError::None);

    now_ = T0 + ONE_DAY;
    EXPECT_TRUE(registry_->IsPassportValid(id, now_).valid);
    EXPECT_EQ(registry_->VerifyRiskThreshold(Ctx(dao_), id, 3000, ValidProof()).error,
              VaultError::RiskScoreExpired);
}

// ============================================================================
// Transfers and Approvals
// ============================================================================

TEST_F(PassportTest, OwnerTransfers) {
    TokenId id = MintFor(1, user_);

    ASSERT_EQ(registry_->TransferFrom(Ctx(user_), user_, dao_, id), VaultError::None);
    EXPECT_EQ(registry_->OwnerOf(id), std::optional<Address>(dao_));
    EXPECT_EQ(registry_->BalanceOf(user_), 0u);
    EXPECT_EQ(registry_->BalanceOf(dao_), 1u);

    const auto* ev = events_.Last<Transfer>();
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->from, user_);
    EXPECT_EQ(ev->to, dao_);
    EXPECT_EQ(ev->tokenId, id);
}

TEST_F(PassportTest, TransferErrors) {
    TokenId id = MintFor(1, user_);

    EXPECT_EQ(registry_->TransferFrom(Ctx(user_), user_, dao_, 9), VaultError::PassportNotFound);
    EXPECT_EQ(registry_->TransferFrom(Ctx(user_), user_, Address(), id), VaultError::ZeroAddress);
    EXPECT_EQ(registry_->TransferFrom(Ctx(user_), dao_, stranger_, id), VaultError::NotTokenOwner);
    EXPECT_EQ(registry_->TransferFrom(Ctx(stranger_), user_, stranger_, id), VaultError::NotApproved);

    ASSERT_EQ(vault_->Pause(Ctx(owner_)), VaultError::None);
    EXPECT_EQ(registry_->TransferFrom(Ctx(user_), user_, dao_, id), VaultError::ContractPaused);
    EXPECT_EQ(registry_->OwnerOf(id), std::optional<Address>(user_));
}

TEST_F(PassportTest, PauseBlocksRegistryAdministration) {
    TokenId id = MintFor(1, user_);
    ASSERT_EQ(vault_->Pause(Ctx(owner_)), VaultError::None);

    EXPECT_EQ(registry_->RevokePassport(Ctx(owner_), id, "x"), VaultError::ContractPaused);
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(owner_), ONE_DAY), VaultError::ContractPaused);
    EXPECT_EQ(registry_->TransferOwnership(Ctx(owner_), dao_), VaultError::ContractPaused);
    EXPECT_EQ(registry_->Approve(Ctx(user_), dao_, id), VaultError::ContractPaused);
    EXPECT_EQ(registry_->SetApprovalForAll(Ctx(user_), dao_, true), VaultError::ContractPaused);

    EXPECT_FALSE(registry_->GetPassport(id)->revoked);
    EXPECT_EQ(registry_->GetValidityPeriod(), DEFAULT_VALIDITY_PERIOD);
    EXPECT_EQ(registry_->GetOwner(), owner_);

    // Validity queries stay available
    EXPECT_TRUE(registry_->IsPassportValid(id, T0).valid);

    ASSERT_EQ(vault_->Unpause(Ctx(owner_)), VaultError::None);
    EXPECT_EQ(registry_->RevokePassport(Ctx(owner_), id, "x"), VaultError::None);
}

TEST_F(PassportTest, ApprovedSpenderTransfersOnce) {
    TokenId id = MintFor(1, user_);

    ASSERT_EQ(registry_->Approve(Ctx(user_), stranger_, id), VaultError::None);
    EXPECT_EQ(registry_->GetApproved(id), stranger_);
    const auto* ev = events_.Last<Approval>();
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->owner, user_);
    EXPECT_EQ(ev->approved, stranger_);

    ASSERT_EQ(registry_->TransferFrom(Ctx(stranger_), user_, dao_, id), VaultError::None);
    EXPECT_TRUE(registry_->GetApproved(id).IsNull());

    // Approval does not survive the transfer
    EXPECT_EQ(registry_->TransferFrom(Ctx(stranger_), dao_, stranger_, id), VaultError::NotApproved);
}

TEST_F(PassportTest, ApproveErrors) {
    TokenId id = MintFor(1, user_);

    EXPECT_EQ(registry_->Approve(Ctx(user_), stranger_, 5), VaultError::PassportNotFound);
    EXPECT_EQ(registry_->Approve(Ctx(stranger_), stranger_, id), VaultError::NotApproved);

    ASSERT_EQ(registry_->Approve(Ctx(user_), stranger_, id), VaultError::None);
    ASSERT_EQ(registry_->Approve(Ctx(user_), Address(), id), VaultError::None);
    EXPECT_TRUE(registry_->GetApproved(id).IsNull());
}

TEST_F(PassportTest, OperatorApproval) {
    TokenId first = MintFor(1, user_);
    TokenId second = MintFor(2, user_);

    ASSERT_EQ(registry_->SetApprovalForAll(Ctx(user_), dao_, true), VaultError::None);
    EXPECT_TRUE(registry_->IsApprovedForAll(user_, dao_));
    const auto* ev = events_.Last<ApprovalForAll>();
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->owner, user_);
    EXPECT_EQ(ev->operatorAddr, dao_);
    EXPECT_TRUE(ev->approved);

    // Operators may approve and transfer
    ASSERT_EQ(registry_->Approve(Ctx(dao_), stranger_, first), VaultError::None);
    ASSERT_EQ(registry_->TransferFrom(Ctx(dao_), user_, dao_, second), VaultError::None);

    ASSERT_EQ(registry_->SetApprovalForAll(Ctx(user_), dao_, false), VaultError::None);
    EXPECT_FALSE(registry_->IsApprovedForAll(user_, dao_));
    EXPECT_EQ(registry_->TransferFrom(Ctx(dao_), user_, dao_, first), VaultError::NotApproved);

    EXPECT_EQ(registry_->SetApprovalForAll(Ctx(user_), Address(), true), VaultError::ZeroAddress);
}

TEST_F(PassportTest, TransferredPassportKeepsCommitment) {
    TokenId id = MintFor(1, user_, 5000);
    ASSERT_EQ(registry_->TransferFrom(Ctx(user_), user_, dao_, id), VaultError::None);

    EXPECT_EQ(registry_->GetPassportCommitment(id), std::optional<CommitmentHash>(MakeCommitment(1)));
    EXPECT_EQ(registry_->GetPassportRiskBand(id), RiskBand::Medium);
    EXPECT_TRUE(registry_->IsPassportValid(id, now_).valid);
}

// ============================================================================
// Ownership
// ============================================================================

TEST_F(PassportTest, TransferOwnership) {
    EXPECT_EQ(registry_->TransferOwnership(Ctx(stranger_), stranger_), VaultError::UnauthorizedAccount);
    EXPECT_EQ(registry_->TransferOwnership(Ctx(owner_), Address()), VaultError::ZeroAddress);

    ASSERT_EQ(registry_->TransferOwnership(Ctx(owner_), dao_), VaultError::None);
    EXPECT_EQ(registry_->GetOwner(), dao_);
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(owner_), ONE_DAY), VaultError::UnauthorizedAccount);
    EXPECT_EQ(registry_->SetValidityPeriod(Ctx(dao_), ONE_DAY), VaultError::None);

    // The vault keeps its own owner
    EXPECT_EQ(vault_->GetOwner(), owner_);
}
