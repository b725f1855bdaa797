// RISKVAULT - Serialization Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>
#include "riskvault/core/serialize.h"
#include "riskvault/core/types.h"

#include <ios>
#include <limits>
#include <string>
#include <vector>

namespace riskvault {
namespace test {

// ============================================================================
// Integer Serialization Tests
// ============================================================================

TEST(SerializeTest, Uint32LittleEndian) {
    DataStream ss;
    ss << uint32_t{0x12345678};
    ASSERT_EQ(ss.size(), 4u);
    EXPECT_EQ(ss.Data(), (std::vector<uint8_t>{0x78, 0x56, 0x34, 0x12}));

    uint32_t value = 0;
    ss >> value;
    EXPECT_EQ(value, 0x12345678u);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, Uint64LittleEndian) {
    DataStream ss;
    ss << uint64_t{0x0102030405060708ULL};
    ASSERT_EQ(ss.size(), 8u);
    EXPECT_EQ(ss.data()[0], 0x08);
    EXPECT_EQ(ss.data()[7], 0x01);

    uint64_t value = 0;
    ss >> value;
    EXPECT_EQ(value, 0x0102030405060708ULL);
}

TEST(SerializeTest, SignedTimestamps) {
    DataStream ss;
    Timestamp past = -1;
    Timestamp far = std::numeric_limits<int64_t>::max();
    ss << past << far;

    Timestamp a = 0, b = 0;
    ss >> a >> b;
    EXPECT_EQ(a, -1);
    EXPECT_EQ(b, std::numeric_limits<int64_t>::max());
}

TEST(SerializeTest, Bool) {
    DataStream ss;
    ss << true << false;
    EXPECT_EQ(ss.Data(), (std::vector<uint8_t>{0x01, 0x00}));

    bool a = false, b = true;
    ss >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

// ============================================================================
// CompactSize Tests
// ============================================================================

TEST(CompactSizeTest, EncodingWidths) {
    struct Case { uint64_t value; size_t width; };
    const Case cases[] = {
        {0, 1}, {252, 1}, {253, 3}, {0xFFFF, 3}, {0x10000, 5}, {0xFFFFFFFF, 5},
    };
    for (const auto& c : cases) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.size(), c.width) << c.value;
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    // 0xFD marker followed by a value that fits in one byte
    std::vector<uint8_t> raw = {0xFD, 0x10, 0x00};
    DataStream ss(raw);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Byte Vector and String Tests
// ============================================================================

TEST(SerializeTest, ByteVectorIsLengthPrefixed) {
    Bytes ciphertext = {0xde, 0xad, 0xbe, 0xef};
    DataStream ss;
    ss << ciphertext;
    EXPECT_EQ(ss.Data(), (std::vector<uint8_t>{0x04, 0xde, 0xad, 0xbe, 0xef}));

    Bytes decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, ciphertext);
}

TEST(SerializeTest, EmptyVectorAndString) {
    DataStream ss;
    ss << Bytes{} << std::string();
    EXPECT_EQ(ss.size(), 2u);

    Bytes v = {0x01};
    std::string s = "x";
    ss >> v >> s;
    EXPECT_TRUE(v.empty());
    EXPECT_TRUE(s.empty());
}

TEST(SerializeTest, String) {
    DataStream ss;
    ss << std::string("policy violation");
    std::string decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, "policy violation");
}

TEST(SerializeTest, TruncatedVectorThrows) {
    std::vector<uint8_t> raw = {0x05, 0x01, 0x02};
    DataStream ss(raw);
    Bytes decoded;
    EXPECT_THROW(ss >> decoded, std::ios_base::failure);
}

// ============================================================================
// Hash and Address Tests
// ============================================================================

TEST(SerializeTest, FixedWidthValuesHaveNoPrefix) {
    CommitmentHash commitment = CommitmentHash::FromHex(std::string(64, 'a'));
    Address addr = Address::FromHex(std::string(40, 'b'));

    DataStream ss;
    ss << commitment << addr;
    EXPECT_EQ(ss.size(), 32u + 20u);
    EXPECT_EQ(ss.data()[0], 0xaa);
    EXPECT_EQ(ss.data()[32], 0xbb);

    CommitmentHash c2;
    Address a2;
    ss >> c2 >> a2;
    EXPECT_EQ(c2, commitment);
    EXPECT_EQ(a2, addr);
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    ss << uint32_t{7};
    Hash256 h;
    EXPECT_THROW(ss >> h, std::ios_base::failure);
}

// ============================================================================
// DataStream Tests
// ============================================================================

TEST(DataStreamTest, ReadConsumesFromFront) {
    DataStream ss;
    ss << uint8_t{1} << uint8_t{2} << uint8_t{3};

    uint8_t first = 0;
    ss >> first;
    EXPECT_EQ(first, 1);
    EXPECT_EQ(ss.size(), 2u);
    EXPECT_EQ(ss.Data().size(), 3u);
    EXPECT_EQ(ss.data()[0], 2);
}

TEST(DataStreamTest, ConstructFromBuffer) {
    const uint8_t raw[] = {0x2a, 0x00, 0x00, 0x00};
    DataStream ss(raw, sizeof(raw));
    uint32_t value = 0;
    ss >> value;
    EXPECT_EQ(value, 42u);
    EXPECT_TRUE(ss.empty());
}

} // namespace test
} // namespace riskvault
