// RISKVAULT - Access Control and Emergency Stop Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "vault/vault_fixture.h"
#include "riskvault/core/serialize.h"
#include "riskvault/vault/access.h"
#include "riskvault/vault/emergency.h"

#include <ios>

using namespace riskvault;
using namespace riskvault::vault;
using namespace riskvault::vault::testing;

// ============================================================================
// Access Control
// ============================================================================

class AccessControlTest : public ::testing::Test {
protected:
    Address owner_ = MakeAddress(0x01);
    Address updater_ = MakeAddress(0x02);
    AccessControl access_{owner_};
};

TEST_F(AccessControlTest, OwnerIsImplicitUpdater) {
    EXPECT_TRUE(access_.IsOwner(owner_));
    EXPECT_FALSE(access_.IsOwner(updater_));
    EXPECT_TRUE(access_.IsAuthorizedUpdater(owner_));
    EXPECT_FALSE(access_.IsAuthorizedUpdater(updater_));
    EXPECT_FALSE(access_.IsAuthorizedUpdater(Address()));
    EXPECT_TRUE(access_.GetStates().empty());
}

TEST_F(AccessControlTest, SetAuthorizedReportsChange) {
    EXPECT_TRUE(access_.SetAuthorized(updater_, true));
    EXPECT_TRUE(access_.IsAuthorizedUpdater(updater_));
    EXPECT_FALSE(access_.SetAuthorized(updater_, true));

    EXPECT_TRUE(access_.SetAuthorized(updater_, false));
    EXPECT_FALSE(access_.IsAuthorizedUpdater(updater_));
    EXPECT_FALSE(access_.SetAuthorized(updater_, false));
}

TEST_F(AccessControlTest, DeauthorizationKeepsCounters) {
    access_.SetAuthorized(updater_, true);
    access_.MutableState(updater_).lastSubmissionTime = 1700000000;
    access_.SetAuthorized(updater_, false);

    auto state = access_.GetState(updater_);
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->authorized);
    EXPECT_EQ(state->lastSubmissionTime, 1700000000);
}

TEST_F(AccessControlTest, StateRows) {
    EXPECT_FALSE(access_.GetState(updater_).has_value());

    UpdaterState state;
    state.authorized = true;
    state.decryptionsToday = 3;
    access_.PutState(updater_, state);
    EXPECT_EQ(access_.GetState(updater_), std::optional<UpdaterState>(state));
    EXPECT_EQ(access_.GetStates().size(), 1u);

    access_.EraseState(updater_);
    EXPECT_FALSE(access_.GetState(updater_).has_value());
}

TEST_F(AccessControlTest, SetOwner) {
    EXPECT_EQ(access_.SetOwner(Address()), VaultError::ZeroAddress);
    EXPECT_EQ(access_.GetOwner(), owner_);

    EXPECT_EQ(access_.SetOwner(updater_), VaultError::None);
    EXPECT_EQ(access_.GetOwner(), updater_);
    EXPECT_FALSE(access_.IsOwner(owner_));
    EXPECT_FALSE(access_.IsAuthorizedUpdater(owner_));
}

TEST(UpdaterStateTest, Serialization) {
    UpdaterState state;
    state.authorized = true;
    state.lastSubmissionTime = 1700003600;
    state.decryptionsToday = 7;
    state.dayBucket = 19675;

    DataStream ss;
    ss << state;
    EXPECT_EQ(ss.size(), 1u + 8u + 4u + 8u);

    UpdaterState decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, state);
    EXPECT_TRUE(ss.empty());

    DataStream truncated(ss.Data().data(), 5);
    UpdaterState partial;
    EXPECT_THROW(truncated >> partial, std::ios_base::failure);
}

// ============================================================================
// Emergency Stop
// ============================================================================

TEST(EmergencyStopTest, PauseAndUnpause) {
    EmergencyStop stop;
    EXPECT_FALSE(stop.IsPaused());
    EXPECT_EQ(stop.RequireNotPaused(), VaultError::None);

    EXPECT_TRUE(stop.Pause());
    EXPECT_FALSE(stop.Pause());
    EXPECT_TRUE(stop.IsPaused());
    EXPECT_EQ(stop.RequireNotPaused(), VaultError::ContractPaused);

    EXPECT_TRUE(stop.Unpause());
    EXPECT_FALSE(stop.Unpause());
    EXPECT_EQ(stop.RequireNotPaused(), VaultError::None);
}

TEST(EmergencyStopTest, Restore) {
    EmergencyStop stop;
    stop.Restore(true);
    EXPECT_TRUE(stop.IsPaused());
    stop.Restore(false);
    EXPECT_FALSE(stop.IsPaused());
}
