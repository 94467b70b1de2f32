// LOCKVAULT - Database Layer Tests
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include <gtest/gtest.h>

#include "lockvault/core/types.h"
#include "lockvault/db/database.h"
#include "lockvault/db/leveldb.h"

#include <filesystem>
#include <string>
#include <vector>

namespace lockvault {
namespace db {
namespace test {

// ============================================================================
// Status / Slice
// ============================================================================

TEST(StatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
    EXPECT_FALSE(Status::InvalidArgument().ok());
}

TEST(SliceTest, PrefixAndEquality) {
    std::string key = "pabc";
    Slice s(key);
    EXPECT_TRUE(s.starts_with("p"));
    EXPECT_FALSE(s.starts_with("g"));
    EXPECT_FALSE(Slice("p").starts_with(s));
    EXPECT_EQ(Slice("abc"), Slice(key.data() + 1, 3));
    EXPECT_NE(Slice("abc"), Slice("abd"));
}

// ============================================================================
// Memory Database
// ============================================================================

class MemoryDatabaseTest : public ::testing::Test {
protected:
    MemoryDatabase db_;
};

TEST_F(MemoryDatabaseTest, PutGetDelete) {
    std::string value;
    EXPECT_TRUE(db_.Get("k", &value).IsNotFound());

    ASSERT_TRUE(db_.Put("k", "v1").ok());
    ASSERT_TRUE(db_.Get("k", &value).ok());
    EXPECT_EQ(value, "v1");

    ASSERT_TRUE(db_.Delete("k").ok());
    EXPECT_TRUE(db_.Get("k", &value).IsNotFound());
    EXPECT_EQ(db_.Size(), 0u);
}

TEST_F(MemoryDatabaseTest, BatchAppliesInOrder) {
    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("a");
    batch.Put("c", "3");
    EXPECT_EQ(batch.Count(), 4u);

    ASSERT_TRUE(db_.Write(&batch).ok());
    std::string value;
    EXPECT_TRUE(db_.Get("a", &value).IsNotFound());
    ASSERT_TRUE(db_.Get("b", &value).ok());
    EXPECT_EQ(value, "2");
    ASSERT_TRUE(db_.Get("c", &value).ok());
    EXPECT_EQ(value, "3");
}

TEST_F(MemoryDatabaseTest, IteratorSeeksPrefix) {
    db_.Put("a1", "x");
    db_.Put("p1", "one");
    db_.Put("p2", "two");
    db_.Put("q1", "y");

    auto it = db_.NewIterator();
    std::vector<std::string> values;
    for (it->Seek("p"); it->Valid() && it->key().starts_with("p"); it->Next()) {
        values.push_back(it->value().ToString());
    }
    ASSERT_TRUE(it->status().ok());
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "one");
    EXPECT_EQ(values[1], "two");

    it->SeekToFirst();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "a1");
}

// ============================================================================
// Serialization Helpers and Keys
// ============================================================================

TEST(DatabaseSerializeTest, AmountRoundTrip) {
    std::string bytes = SerializeToString(static_cast<int64_t>(1234 * COIN));
    EXPECT_EQ(bytes.size(), 8u);

    int64_t out = 0;
    ASSERT_TRUE(DeserializeFromString(bytes, out));
    EXPECT_EQ(out, 1234 * COIN);
}

TEST(DatabaseSerializeTest, RejectsTruncatedAndTrailing) {
    int64_t out = 0;
    EXPECT_FALSE(DeserializeFromString(std::string(7, '\0'), out));
    EXPECT_FALSE(DeserializeFromString(std::string(9, '\0'), out));
}

TEST(DatabaseKeyTest, PrefixedKeys) {
    Address owner = Address::FromLabel("owner");
    Address spender = Address::FromLabel("spender");

    std::string single = MakeKey(prefix::BALANCE, owner);
    EXPECT_EQ(single.size(), 1 + Address::SIZE);
    EXPECT_EQ(single[0], 'b');

    std::string pair = MakeKey(prefix::ALLOWANCE, owner, spender);
    EXPECT_EQ(pair.size(), 1 + 2 * Address::SIZE);
    EXPECT_NE(pair, MakeKey(prefix::ALLOWANCE, spender, owner));

    EXPECT_EQ(MakeKey(prefix::VAULT_STATE), "g");
}

// ============================================================================
// OpenDatabase
// ============================================================================

class OpenDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("lockvault_db_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(path_);
    }

    void TearDown() override {
        DestroyDatabase(path_);
    }

    std::filesystem::path path_;
};

TEST_F(OpenDatabaseTest, OpensUsableStore) {
    auto [status, db] = OpenDatabase(path_);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_TRUE(db);

    ASSERT_TRUE(db->Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(db->Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_EQ(db->GetName(), HasPersistentBackend() ? "leveldb" : "memory");
}

TEST_F(OpenDatabaseTest, PersistsAcrossReopen) {
    if (!HasPersistentBackend()) {
        GTEST_SKIP() << "built without LevelDB";
    }

    {
        auto [status, db] = OpenDatabase(path_);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put("survives", "yes").ok());
    }

    auto [status, db] = OpenDatabase(path_);
    ASSERT_TRUE(status.ok());
    std::string value;
    ASSERT_TRUE(db->Get("survives", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(OpenDatabaseTest, DestroyRemovesDirectory) {
    {
        auto [status, db] = OpenDatabase(path_);
        ASSERT_TRUE(status.ok());
    }
    EXPECT_TRUE(DestroyDatabase(path_).ok());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

} // namespace test
} // namespace db
} // namespace lockvault
