// LOCKVAULT - Serialization Tests
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include "lockvault/core/serialize.h"
#include "lockvault/core/types.h"

#include <ios>
#include <limits>

namespace lockvault {
namespace test {

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << static_cast<uint32_t>(0x01020304);
    EXPECT_EQ(ss.ToHex(), "04030201");

    DataStream ss64;
    ss64 << static_cast<int64_t>(-1);
    EXPECT_EQ(ss64.ToHex(), "ffffffffffffffff");
}

TEST(SerializeTest, SignedValuesSurvive) {
    DataStream ss;
    int64_t in = std::numeric_limits<int64_t>::min();
    int32_t in32 = -12345;
    ss << in << in32;

    int64_t out = 0;
    int32_t out32 = 0;
    ss >> out >> out32;
    EXPECT_EQ(out, in);
    EXPECT_EQ(out32, in32);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, BoolIsOneByte) {
    EXPECT_EQ(GetSerializeSize(true), 1u);
    DataStream ss;
    ss << true << false;
    EXPECT_EQ(ss.ToHex(), "0100");
}

// ============================================================================
// Compact Size
// ============================================================================

TEST(SerializeTest, CompactSizeBoundaries) {
    struct Case { uint64_t value; size_t bytes; };
    for (const Case& c : {Case{0, 1}, Case{252, 1}, Case{253, 3}, Case{0xFFFF, 3},
                          Case{0x10000, 5}, Case{0xFFFFFFFFULL, 5}}) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.size(), c.bytes) << c.value;
        EXPECT_EQ(ReadCompactSize(ss), c.value);
    }
}

TEST(SerializeTest, NonCanonicalCompactSizeRejected) {
    // 0xFD marker carrying a value that fits in one byte
    const uint8_t bytes[] = {0xFD, 0x10, 0x00};
    DataStream ss(bytes, sizeof(bytes));
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, OversizedLengthRejected) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings, Booleans, Addresses
// ============================================================================

TEST(SerializeTest, StringIsLengthPrefixed) {
    DataStream ss;
    ss << std::string("vault");
    EXPECT_EQ(ss.ToHex(), "057661756c74");

    std::string out;
    ss >> out;
    EXPECT_EQ(out, "vault");
}

TEST(SerializeTest, BoolRejectsOtherBytes) {
    const uint8_t bytes[] = {0x02};
    DataStream ss(bytes, sizeof(bytes));
    bool value = false;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

TEST(SerializeTest, AddressIsRaw20Bytes) {
    Address a = Address::FromLabel("alice");
    EXPECT_EQ(GetSerializeSize(a), Address::SIZE);

    DataStream ss;
    ss << a;
    Address b;
    ss >> b;
    EXPECT_EQ(a, b);
}

TEST(SerializeTest, TruncatedReadThrows) {
    const uint8_t bytes[] = {0x01, 0x02, 0x03};
    DataStream ss(bytes, sizeof(bytes));
    int64_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

} // namespace test
} // namespace lockvault
