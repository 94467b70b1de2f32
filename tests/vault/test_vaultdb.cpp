// LOCKVAULT - Position and Vault Storage Tests
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include <gtest/gtest.h>

#include "lockvault/db/leveldb.h"
#include "lockvault/util/time.h"
#include "lockvault/vault/vaultdb.h"

#include <stdexcept>

namespace lockvault {
namespace vault {
namespace test {

constexpr int64_t DAY = util::SECONDS_PER_DAY;
constexpr Timestamp T0 = 1700000000;

namespace {

Position MakePosition(Amount amount) {
    Position pos;
    pos.amount = amount;
    pos.weightedStartTime = T0;
    pos.effectiveLockupPeriod = 30 * DAY;
    pos.effectiveMultiplier = 10500;
    pos.lastUpdateTime = T0;
    return pos;
}

} // namespace

// ============================================================================
// Position
// ============================================================================

TEST(PositionTest, EmptyByDefault) {
    Position pos;
    EXPECT_TRUE(pos.IsEmpty());
    EXPECT_FALSE(pos.HasStake());
    EXPECT_TRUE(pos.IsConsistent());
    EXPECT_EQ(pos.ToString(), "Position(empty)");
}

TEST(PositionTest, LockedAndUnlockedSplitAtMaturity) {
    Position pos = MakePosition(1000 * COIN);
    EXPECT_EQ(pos.UnlockTime(), T0 + 30 * DAY);

    EXPECT_FALSE(pos.IsMatured(T0 + 30 * DAY - 1));
    EXPECT_EQ(pos.Locked(T0), 1000 * COIN);
    EXPECT_EQ(pos.Unlocked(T0), 0);

    EXPECT_TRUE(pos.IsMatured(T0 + 30 * DAY));
    EXPECT_EQ(pos.Locked(T0 + 30 * DAY), 0);
    EXPECT_EQ(pos.Unlocked(T0 + 30 * DAY), 1000 * COIN);
}

TEST(PositionTest, CooldownsReduceAvailable) {
    Position pos = MakePosition(1000 * COIN);
    pos.cooldownAmount = 400 * COIN;
    pos.cooldownStart = T0 + 31 * DAY;
    EXPECT_TRUE(pos.InCooldown());
    EXPECT_EQ(pos.Available(), 600 * COIN);
    EXPECT_EQ(pos.Unlocked(T0 + 40 * DAY), 600 * COIN);
    EXPECT_TRUE(pos.IsConsistent());
    EXPECT_NE(pos.ToString().find("cooldown=400.00000000"), std::string::npos);
}

TEST(PositionTest, ConsistencyRules) {
    Position both = MakePosition(1000 * COIN);
    both.cooldownAmount = COIN;
    both.earlyUnstakeCooldownAmount = COIN;
    EXPECT_FALSE(both.IsConsistent());

    Position over = MakePosition(10 * COIN);
    over.earlyUnstakeCooldownAmount = 11 * COIN;
    EXPECT_FALSE(over.IsConsistent());

    Position negative = MakePosition(-1);
    EXPECT_FALSE(negative.IsConsistent());
}

TEST(PositionTest, SerializationKeepsEveryField) {
    Position pos = MakePosition(1234 * COIN);
    pos.earlyUnstakeCooldownAmount = 34 * COIN;
    pos.earlyUnstakeCooldownStart = T0 + DAY;
    pos.effectiveMultiplier = 11234;

    Position out;
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(pos), out));
    EXPECT_EQ(out, pos);
}

TEST(PositionTest, UnknownVersionRejected) {
    std::string bytes = db::SerializeToString(MakePosition(COIN));
    bytes[0] = 2;
    Position out;
    EXPECT_FALSE(db::DeserializeFromString(bytes, out));
}

TEST(VaultStateTest, SerializationKeepsEveryField) {
    VaultState state;
    state.totalStaked = 5 * COIN;
    state.totalInCooldown = 2 * COIN;
    state.totalInEarlyCooldown = COIN;
    state.maximumStake = 100 * COIN;
    state.treasury = Address::FromLabel("treasury");
    state.qualityControlCaller = Address::FromLabel("qa");
    state.paused = true;

    VaultState out;
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(state), out));
    EXPECT_EQ(out, state);
}

// ============================================================================
// VaultDB
// ============================================================================

class VaultDBTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto memory = std::make_unique<db::MemoryDatabase>();
        raw_ = memory.get();
        vaultDb_ = std::make_unique<VaultDB>(std::move(memory));
    }

    db::MemoryDatabase* raw_{nullptr};
    std::unique_ptr<VaultDB> vaultDb_;
};

TEST_F(VaultDBTest, NullDatabaseRejected) {
    EXPECT_THROW({ VaultDB store{std::unique_ptr<db::Database>()}; }, std::invalid_argument);
}

TEST_F(VaultDBTest, FreshStoreHasNoState) {
    EXPECT_FALSE(vaultDb_->ReadState().has_value());
    EXPECT_FALSE(vaultDb_->ReadPosition(Address::FromLabel("alice")).has_value());
    EXPECT_TRUE(vaultDb_->LoadAllPositions().empty());
}

TEST_F(VaultDBTest, BatchWritesPositionsAndState) {
    Address alice = Address::FromLabel("alice");
    Address bob = Address::FromLabel("bob");
    VaultState state;
    state.totalStaked = 300 * COIN;

    ASSERT_TRUE(vaultDb_->WriteBatch({{alice, MakePosition(100 * COIN)},
                                      {bob, MakePosition(200 * COIN)}}, state).ok());

    auto stored = vaultDb_->ReadState();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->totalStaked, 300 * COIN);

    auto pos = vaultDb_->ReadPosition(bob);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->amount, 200 * COIN);

    auto all = vaultDb_->LoadAllPositions();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at(alice).amount, 100 * COIN);
}

TEST_F(VaultDBTest, EmptyPositionIsDeleted) {
    Address alice = Address::FromLabel("alice");
    VaultState state;
    ASSERT_TRUE(vaultDb_->WriteBatch({{alice, MakePosition(COIN)}}, state).ok());
    ASSERT_TRUE(vaultDb_->ReadPosition(alice).has_value());

    ASSERT_TRUE(vaultDb_->WriteBatch({{alice, Position()}}, state).ok());
    EXPECT_FALSE(vaultDb_->ReadPosition(alice).has_value());
    // Only the state record remains
    EXPECT_EQ(raw_->Size(), 1u);
}

TEST_F(VaultDBTest, ScanSkipsOtherPrefixesAndStopsEarly) {
    VaultState state;
    std::vector<std::pair<Address, Position>> batch;
    for (int i = 0; i < 5; ++i) {
        batch.emplace_back(Address::FromLabel("user" + std::to_string(i)), MakePosition(COIN));
    }
    ASSERT_TRUE(vaultDb_->WriteBatch(batch, state).ok());
    raw_->Put("q-unrelated", "x");

    int seen = 0;
    bool completed = vaultDb_->ForEachPosition([&seen](const Address&, const Position&) {
        return ++seen < 3;
    });
    EXPECT_FALSE(completed);
    EXPECT_EQ(seen, 3);
    EXPECT_EQ(vaultDb_->LoadAllPositions().size(), 5u);
}

TEST_F(VaultDBTest, CorruptRecordsAreReported) {
    Address alice = Address::FromLabel("alice");
    raw_->Put(db::MakeKey(db::prefix::POSITION, alice), "garbage");
    EXPECT_FALSE(vaultDb_->ReadPosition(alice).has_value());
    EXPECT_THROW(vaultDb_->LoadAllPositions(), std::runtime_error);

    raw_->Put(db::MakeKey(db::prefix::VAULT_STATE), "garbage");
    EXPECT_THROW(vaultDb_->ReadState(), std::runtime_error);
}

} // namespace test
} // namespace vault
} // namespace lockvault
