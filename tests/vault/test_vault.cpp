// LOCKVAULT - Staking Vault Tests
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "vault_fixture.h"

#include <stdexcept>

namespace lockvault {
namespace vault {
namespace test {

class VaultTest : public VaultTestBase {};

// ============================================================================
// Construction
// ============================================================================

TEST_F(VaultTest, FreshVaultIsEmpty) {
    EXPECT_EQ(vault_->GetTotalStaked(), 0);
    EXPECT_EQ(vault_->GetStakerCount(), 0u);
    EXPECT_FALSE(vault_->IsPaused());
    EXPECT_EQ(vault_->GetTreasury(), treasury_);
    EXPECT_EQ(vault_->GetQualityControlCaller(), qa_);
    EXPECT_EQ(vault_->GetAdmin(), admin_);
    EXPECT_EQ(vault_->GetMaximumStake(), 10000 * COIN);
    EXPECT_EQ(vault_->CheckInvariants(), "");
}

TEST_F(VaultTest, ConstructorRejectsBadInputs) {
    VaultRoles noTreasury = roles_;
    noTreasury.treasury = Address();
    EXPECT_THROW(StakingVault(VaultParams(), noTreasury, ledger_, vaultAddress_,
                              std::make_unique<VaultDB>(std::make_unique<db::MemoryDatabase>())),
                 std::invalid_argument);

    EXPECT_THROW(StakingVault(VaultParams(), roles_, ledger_, Address(),
                              std::make_unique<VaultDB>(std::make_unique<db::MemoryDatabase>())),
                 std::invalid_argument);

    VaultParams bad;
    bad.earlyUnstakePenaltyBps = 20000;
    EXPECT_THROW(StakingVault(bad, roles_, ledger_, vaultAddress_,
                              std::make_unique<VaultDB>(std::make_unique<db::MemoryDatabase>())),
                 std::invalid_argument);

    EXPECT_THROW(StakingVault(VaultParams(), roles_, ledger_, vaultAddress_, nullptr),
                 std::invalid_argument);
}

// ============================================================================
// Stake
// ============================================================================

TEST_F(VaultTest, StakeOpensPosition) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);

    EXPECT_EQ(vault_->GetTotalStaked(), 1000 * COIN);
    EXPECT_EQ(vault_->GetTotalStaked(alice_), 1000 * COIN);
    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 11000);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 30 * DAY);
    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 30 * DAY);
    EXPECT_EQ(vault_->GetTotalLocked(alice_), 1000 * COIN);
    EXPECT_EQ(vault_->GetTotalUnlocked(alice_), 0);
    EXPECT_TRUE(vault_->HasActiveStake(alice_));
    EXPECT_EQ(vault_->GetStakerCount(), 1u);

    EXPECT_EQ(ledger_.BalanceOf(alice_), 0);
    EXPECT_EQ(ledger_.Allowance(alice_, vaultAddress_), 0);
    ExpectConsistent();

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, VaultEventType::Staked);
    EXPECT_EQ(events_[0].user, alice_);
    EXPECT_EQ(events_[0].amount, 1000 * COIN);
    EXPECT_EQ(events_[0].lockup, 30 * DAY);
    EXPECT_EQ(events_[0].multiplier, 11000);
    EXPECT_EQ(events_[0].timestamp, T0);
}

TEST_F(VaultTest, StakeValidation) {
    Fund(alice_, 20000 * COIN);

    EXPECT_EQ(vault_->Stake(Address(), COIN, 30 * DAY), VaultError::ZERO_ADDRESS);
    EXPECT_EQ(vault_->Stake(alice_, 0, 30 * DAY), VaultError::ZERO_AMOUNT);
    EXPECT_EQ(vault_->Stake(alice_, COIN / 2, 30 * DAY), VaultError::AMOUNT_BELOW_MINIMUM);
    EXPECT_EQ(vault_->Stake(alice_, 10001 * COIN, 30 * DAY), VaultError::AMOUNT_ABOVE_MAXIMUM);
    EXPECT_EQ(vault_->Stake(alice_, COIN, 60 * DAY), VaultError::INVALID_LOCKUP_PERIOD);
    EXPECT_EQ(vault_->Stake(alice_, COIN, 0), VaultError::INVALID_LOCKUP_PERIOD);

    ASSERT_EQ(vault_->Stake(alice_, COIN, 30 * DAY), VaultError::OK);
    EXPECT_EQ(vault_->Stake(alice_, COIN, 30 * DAY), VaultError::STAKE_ALREADY_EXISTS);

    EXPECT_EQ(vault_->GetTotalStaked(), COIN);
    EXPECT_EQ(events_.size(), 1u);
}

TEST_F(VaultTest, StakeNeedsAllowanceAndBalance) {
    ASSERT_TRUE(ledger_.Mint(alice_, 100 * COIN));
    EXPECT_EQ(vault_->Stake(alice_, 100 * COIN, 30 * DAY), VaultError::TRANSFER_FAILED);

    ASSERT_TRUE(ledger_.Approve(alice_, vaultAddress_, 500 * COIN));
    EXPECT_EQ(vault_->Stake(alice_, 200 * COIN, 30 * DAY), VaultError::TRANSFER_FAILED);

    EXPECT_FALSE(vault_->HasActiveStake(alice_));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 100 * COIN);
    EXPECT_TRUE(events_.empty());
}

TEST_F(VaultTest, ZeroAddressHasEmptySummary) {
    UserStakingSummary summary = vault_->GetUserSummary(Address());
    EXPECT_FALSE(summary.hasActiveStake);
    EXPECT_EQ(summary.userTotalStaked, 0);
    EXPECT_EQ(summary.effectiveMultiplier, 0);
}

// ============================================================================
// Increase
// ============================================================================

TEST_F(VaultTest, IncreaseAmountMidwayWeightsLockup) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(15 * DAY);
    Fund(alice_, 1000 * COIN);

    ASSERT_EQ(vault_->IncreaseAmount(alice_, 1000 * COIN), VaultError::OK);

    Position pos = vault_->GetPosition(alice_);
    EXPECT_EQ(pos.amount, 2000 * COIN);
    EXPECT_EQ(pos.effectiveLockupPeriod, 30 * DAY);
    // (15d * 1000 + 30d * 1000) / 2000
    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 22 * DAY + DAY / 2);
    EXPECT_GE(vault_->GetTimeUntilUnlock(alice_), 15 * DAY);
    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 11000);
    ExpectConsistent();

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[1].type, VaultEventType::AmountIncreased);
    EXPECT_EQ(events_[1].amount, 1000 * COIN);
    EXPECT_EQ(events_[1].secondaryAmount, 2000 * COIN);
}

TEST_F(VaultTest, IncreaseAmountValidation) {
    Fund(alice_, 20000 * COIN);
    EXPECT_EQ(vault_->IncreaseAmount(alice_, COIN), VaultError::NO_STAKE_FOUND);

    ASSERT_EQ(vault_->Stake(alice_, 9000 * COIN, 30 * DAY), VaultError::OK);
    EXPECT_EQ(vault_->IncreaseAmount(alice_, 0), VaultError::ZERO_AMOUNT);
    EXPECT_EQ(vault_->IncreaseAmount(alice_, COIN / 2), VaultError::AMOUNT_BELOW_MINIMUM);
    EXPECT_EQ(vault_->IncreaseAmount(alice_, 2000 * COIN), VaultError::AMOUNT_ABOVE_MAXIMUM);
    EXPECT_EQ(vault_->IncreaseAmount(alice_, 1000 * COIN), VaultError::OK);
    EXPECT_EQ(vault_->GetTotalStaked(alice_), 10000 * COIN);
}

TEST_F(VaultTest, IncreaseLockupExtendsAndReprices) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(10 * DAY);

    EXPECT_EQ(vault_->IncreaseLockup(alice_, 6 * DAY), VaultError::LOCKUP_INCREASE_TOO_SMALL);
    EXPECT_EQ(vault_->IncreaseLockup(alice_, 366 * DAY), VaultError::LOCKUP_INCREASE_TOO_LARGE);
    EXPECT_EQ(vault_->IncreaseLockup(bob_, 90 * DAY), VaultError::NO_STAKE_FOUND);

    ASSERT_EQ(vault_->IncreaseLockup(alice_, 90 * DAY), VaultError::OK);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 90 * DAY);
    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 90 * DAY);
    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 11500);
    EXPECT_EQ(vault_->GetTotalStaked(), 1000 * COIN);
    ExpectConsistent();

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[1].type, VaultEventType::LockupIncreased);
    EXPECT_EQ(events_[1].lockup, 90 * DAY);
    EXPECT_EQ(events_[1].amount, 1000 * COIN);
    EXPECT_EQ(events_[1].secondaryAmount, 90 * DAY);
}

TEST_F(VaultTest, ShortExtensionLeavesLockupAlone) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(10 * DAY);
    ASSERT_EQ(vault_->IncreaseLockup(alice_, 7 * DAY), VaultError::OK);
    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 20 * DAY);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 30 * DAY);
}

TEST_F(VaultTest, IncreaseStakeAppliesBoth) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(10 * DAY);
    Fund(alice_, 1000 * COIN);

    ASSERT_EQ(vault_->IncreaseStake(alice_, 1000 * COIN, 90 * DAY), VaultError::OK);
    EXPECT_EQ(vault_->GetTotalStaked(alice_), 2000 * COIN);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 90 * DAY);
    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 90 * DAY);
    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 11500);
    ExpectConsistent();

    ASSERT_EQ(events_.size(), 3u);
    EXPECT_EQ(events_[1].type, VaultEventType::LockupIncreased);
    EXPECT_EQ(events_[2].type, VaultEventType::AmountIncreased);
}

TEST_F(VaultTest, IncreaseStakeIsAllOrNothing) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(10 * DAY);
    Position before = vault_->GetPosition(alice_);

    // Extension is valid but the pull is not funded
    EXPECT_EQ(vault_->IncreaseStake(alice_, 1000 * COIN, 90 * DAY), VaultError::TRANSFER_FAILED);
    EXPECT_EQ(vault_->GetPosition(alice_), before);

    // Funded now, but the amount leg breaks the maximum after the extension leg
    Fund(alice_, 9500 * COIN);
    EXPECT_EQ(vault_->IncreaseStake(alice_, 9500 * COIN, 90 * DAY),
              VaultError::AMOUNT_ABOVE_MAXIMUM);
    EXPECT_EQ(vault_->GetPosition(alice_), before);
    EXPECT_EQ(events_.size(), 1u);
}

TEST_F(VaultTest, IncreaseStakeExtendsBeforeAdding) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    FundAndStake(bob_, 1000 * COIN, 30 * DAY);
    Warp(10 * DAY);
    Fund(alice_, 2000 * COIN);
    Fund(bob_, 2000 * COIN);

    // Alice combines in one call; bob tops up, then extends
    ASSERT_EQ(vault_->IncreaseStake(alice_, 1000 * COIN, 45 * DAY), VaultError::OK);
    ASSERT_EQ(vault_->IncreaseAmount(bob_, 1000 * COIN), VaultError::OK);
    ASSERT_EQ(vault_->IncreaseLockup(bob_, 45 * DAY), VaultError::OK);

    EXPECT_EQ(vault_->GetTimeUntilUnlock(alice_), 45 * DAY);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 45 * DAY);
    EXPECT_LE(vault_->GetTimeUntilUnlock(alice_), vault_->GetTimeUntilUnlock(bob_));

    // 15d left: 25d beats that but is under her 45d lockup
    Warp(30 * DAY);
    Position before = vault_->GetPosition(alice_);
    EXPECT_EQ(vault_->IncreaseStake(alice_, 1000 * COIN, 25 * DAY),
              VaultError::INVALID_COMBINATION);
    EXPECT_EQ(vault_->IncreaseLockup(alice_, 25 * DAY), VaultError::INVALID_COMBINATION);
    EXPECT_EQ(vault_->GetTotalStaked(alice_), 2000 * COIN);
    EXPECT_EQ(vault_->GetPosition(alice_).weightedStartTime, before.weightedStartTime);
    EXPECT_EQ(vault_->GetUserLockupPeriod(alice_), 45 * DAY);
    ExpectConsistent();
}

TEST_F(VaultTest, IncreaseBlockedDuringCooldown) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(30 * DAY);
    Fund(alice_, 100 * COIN);
    ASSERT_EQ(vault_->InitiateUnstake(alice_, 500 * COIN), VaultError::OK);

    EXPECT_EQ(vault_->IncreaseAmount(alice_, 100 * COIN), VaultError::COOLDOWN_IN_PROGRESS);
    EXPECT_EQ(vault_->IncreaseLockup(alice_, 30 * DAY), VaultError::COOLDOWN_IN_PROGRESS);
    EXPECT_EQ(vault_->IncreaseStake(alice_, 100 * COIN, 30 * DAY),
              VaultError::COOLDOWN_IN_PROGRESS);
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(VaultTest, PauseBlocksUserOperations) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);

    EXPECT_EQ(vault_->Pause(alice_), VaultError::UNAUTHORIZED);
    ASSERT_EQ(vault_->Pause(admin_), VaultError::OK);
    EXPECT_TRUE(vault_->IsPaused());
    EXPECT_EQ(vault_->Pause(admin_), VaultError::PAUSED);

    Fund(bob_, 100 * COIN);
    EXPECT_EQ(vault_->Stake(bob_, 100 * COIN, 30 * DAY), VaultError::PAUSED);
    EXPECT_EQ(vault_->IncreaseLockup(alice_, 30 * DAY), VaultError::PAUSED);
    EXPECT_EQ(vault_->InitiateEarlyUnstake(alice_, 100 * COIN), VaultError::PAUSED);
    EXPECT_EQ(vault_->ProcessQAPenalty(qa_, alice_, COIN).error, VaultError::PAUSED);

    // Queries still work
    EXPECT_EQ(vault_->GetTotalStaked(alice_), 1000 * COIN);

    EXPECT_EQ(vault_->Unpause(bob_), VaultError::UNAUTHORIZED);
    ASSERT_EQ(vault_->Unpause(admin_), VaultError::OK);
    EXPECT_EQ(vault_->Unpause(admin_), VaultError::NOT_PAUSED);
    EXPECT_EQ(vault_->Stake(bob_, 100 * COIN, 30 * DAY), VaultError::OK);
}

TEST_F(VaultTest, RoleUpdates) {
    Address newTreasury = Address::FromLabel("treasury2");
    Address newQa = Address::FromLabel("qa2");

    EXPECT_EQ(vault_->SetTreasury(alice_, newTreasury), VaultError::UNAUTHORIZED);
    EXPECT_EQ(vault_->SetTreasury(admin_, Address()), VaultError::ZERO_ADDRESS);
    ASSERT_EQ(vault_->SetTreasury(admin_, newTreasury), VaultError::OK);
    EXPECT_EQ(vault_->GetTreasury(), newTreasury);

    EXPECT_EQ(vault_->SetQualityControlCaller(qa_, newQa), VaultError::UNAUTHORIZED);
    EXPECT_EQ(vault_->SetQualityControlCaller(admin_, Address()), VaultError::ZERO_ADDRESS);
    ASSERT_EQ(vault_->SetQualityControlCaller(admin_, newQa), VaultError::OK);
    EXPECT_EQ(vault_->GetQualityControlCaller(), newQa);

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0].type, VaultEventType::TreasuryUpdated);
    EXPECT_EQ(events_[0].user, newTreasury);
    EXPECT_EQ(events_[1].type, VaultEventType::QACallerUpdated);
}

TEST_F(VaultTest, MaximumStakeUpdate) {
    EXPECT_EQ(vault_->SetMaximumStake(alice_, 500 * COIN), VaultError::UNAUTHORIZED);
    EXPECT_EQ(vault_->SetMaximumStake(admin_, COIN / 2), VaultError::AMOUNT_BELOW_MINIMUM);
    EXPECT_EQ(vault_->SetMaximumStake(admin_, MAX_MONEY + 1), VaultError::AMOUNT_ABOVE_MAXIMUM);
    ASSERT_EQ(vault_->SetMaximumStake(admin_, 500 * COIN), VaultError::OK);
    EXPECT_EQ(vault_->GetMaximumStake(), 500 * COIN);

    Fund(alice_, 600 * COIN);
    EXPECT_EQ(vault_->Stake(alice_, 600 * COIN, 30 * DAY), VaultError::AMOUNT_ABOVE_MAXIMUM);
    EXPECT_EQ(vault_->Stake(alice_, 500 * COIN, 30 * DAY), VaultError::OK);
}

TEST_F(VaultTest, EmergencyWithdrawOnlyTakesExcess) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, admin_, COIN), VaultError::INSUFFICIENT_EXCESS);

    // Tokens sent straight to the vault are not owed to anyone
    ASSERT_TRUE(ledger_.Mint(vaultAddress_, 100 * COIN));

    EXPECT_EQ(vault_->EmergencyWithdraw(alice_, alice_, COIN), VaultError::UNAUTHORIZED);
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, Address(), COIN), VaultError::ZERO_ADDRESS);
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, admin_, 0), VaultError::ZERO_AMOUNT);
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, admin_, 101 * COIN),
              VaultError::INSUFFICIENT_EXCESS);

    ASSERT_EQ(vault_->EmergencyWithdraw(admin_, admin_, 100 * COIN), VaultError::OK);
    EXPECT_EQ(ledger_.BalanceOf(admin_), 100 * COIN);
    ExpectConsistent();
    EXPECT_EQ(events_.back().type, VaultEventType::EmergencyWithdraw);
}

TEST_F(VaultTest, EmergencyWithdrawCountsCooldownsAgain) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    Warp(30 * DAY);
    ASSERT_EQ(vault_->InitiateUnstake(alice_, 400 * COIN), VaultError::OK);
    ASSERT_TRUE(ledger_.Mint(vaultAddress_, 500 * COIN));

    // Owed 1000 + 400 against custody 1500
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, admin_, 101 * COIN),
              VaultError::INSUFFICIENT_EXCESS);
    EXPECT_EQ(vault_->EmergencyWithdraw(admin_, admin_, 100 * COIN), VaultError::OK);
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(VaultTest, StorageFailureRestoresTokens) {
    Fund(alice_, 1000 * COIN);
    failWrites_ = true;

    EXPECT_EQ(vault_->Stake(alice_, 1000 * COIN, 30 * DAY), VaultError::STORAGE_ERROR);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 1000 * COIN);
    EXPECT_EQ(ledger_.Allowance(alice_, vaultAddress_), 1000 * COIN);
    EXPECT_EQ(ledger_.BalanceOf(vaultAddress_), 0);
    EXPECT_FALSE(vault_->HasActiveStake(alice_));
    EXPECT_EQ(vault_->GetTotalStaked(), 0);
    EXPECT_TRUE(events_.empty());

    failWrites_ = false;
    EXPECT_EQ(vault_->Stake(alice_, 1000 * COIN, 30 * DAY), VaultError::OK);
    ExpectConsistent();
}

TEST_F(VaultTest, StorageFailureKeepsAdminState) {
    failWrites_ = true;
    EXPECT_EQ(vault_->Pause(admin_), VaultError::STORAGE_ERROR);
    EXPECT_FALSE(vault_->IsPaused());
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(VaultTest, ReopenRestoresState) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    FundAndStake(bob_, 3000 * COIN, 90 * DAY);
    Warp(30 * DAY);
    ASSERT_EQ(vault_->InitiateUnstake(alice_, 400 * COIN), VaultError::OK);
    ASSERT_EQ(vault_->Pause(admin_), VaultError::OK);
    Position alicePos = vault_->GetPosition(alice_);

    Open();

    EXPECT_EQ(vault_->GetPosition(alice_), alicePos);
    EXPECT_EQ(vault_->GetTotalStaked(), 4000 * COIN);
    EXPECT_EQ(vault_->GetTotalInCooldown(), 400 * COIN);
    EXPECT_EQ(vault_->GetStakerCount(), 2u);
    EXPECT_TRUE(vault_->IsPaused());
    ExpectConsistent();
}

TEST_F(VaultTest, ReopenKeepsStoredRolesOverConstructorRoles) {
    Address newTreasury = Address::FromLabel("treasury2");
    ASSERT_EQ(vault_->SetTreasury(admin_, newTreasury), VaultError::OK);
    Open();
    EXPECT_EQ(vault_->GetTreasury(), newTreasury);
}

TEST_F(VaultTest, ReopenWithNewTableReprices) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);
    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 11000);

    VaultParams params;
    params.multipliers = MultiplierTable({30 * DAY}, {{0, {10800}}}, 15000);
    Open(params);

    EXPECT_EQ(vault_->GetUserMultiplier(alice_), 10800);
    EXPECT_EQ(vault_->CheckInvariants(), "");
}

TEST_F(VaultTest, ReopenRejectsInconsistentStore) {
    FundAndStake(alice_, 1000 * COIN, 30 * DAY);

    VaultDB raw(std::make_unique<SharedDatabase>(store_, failWrites_));
    auto state = raw.ReadState();
    ASSERT_TRUE(state.has_value());
    state->totalStaked += COIN;
    ASSERT_TRUE(raw.WriteBatch({}, *state).ok());

    EXPECT_THROW(Open(), std::runtime_error);
}

// ============================================================================
// Strings
// ============================================================================

TEST(VaultStringsTest, ErrorAndEventNames) {
    EXPECT_STREQ(VaultErrorToString(VaultError::OK), "ok");
    EXPECT_STREQ(VaultErrorToString(VaultError::STAKE_STILL_LOCKED), "stake still locked");
    EXPECT_STREQ(VaultEventTypeToString(VaultEventType::EarlyUnstaked), "EarlyUnstaked");

    VaultEvent event;
    event.type = VaultEventType::Staked;
    event.user = Address::FromLabel("alice");
    event.amount = 5 * COIN;
    EXPECT_NE(event.ToString().find("Staked"), std::string::npos);
}

} // namespace test
} // namespace vault
} // namespace lockvault
