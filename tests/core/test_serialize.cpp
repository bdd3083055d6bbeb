// VALORIA - Serialization Tests
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include <gtest/gtest.h>

#include "valoria/core/serialize.h"

#include <limits>
#include <string>

namespace valoria {
namespace {

std::vector<uint8_t> Bytes(const DataStream& ss) {
    return std::vector<uint8_t>(ss.data(), ss.data() + ss.size());
}

// ============================================================================
// Integers
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << uint32_t{0x01020304};
    EXPECT_EQ(Bytes(ss), (std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01}));

    DataStream ss64;
    ss64 << uint64_t{1};
    ASSERT_EQ(ss64.size(), 8u);
    EXPECT_EQ(ss64.data()[0], 1);
    EXPECT_EQ(ss64.data()[7], 0);
}

TEST(SerializeTest, SignedValuesKeepSign) {
    DataStream ss;
    ss << int64_t{-500000} << int32_t{-1} << std::numeric_limits<int64_t>::max();

    int64_t a = 0;
    int32_t b = 0;
    int64_t c = 0;
    ss >> a >> b >> c;
    EXPECT_EQ(a, -500000);
    EXPECT_EQ(b, -1);
    EXPECT_EQ(c, std::numeric_limits<int64_t>::max());
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, NarrowSignedTypes) {
    DataStream ss;
    ss << int16_t{-2} << int8_t{-128};
    EXPECT_EQ(Bytes(ss), (std::vector<uint8_t>{0xFE, 0xFF, 0x80}));

    int16_t a = 0;
    int8_t b = 0;
    ss >> a >> b;
    EXPECT_EQ(a, -2);
    EXPECT_EQ(b, -128);
}

TEST(SerializeTest, StringBackedStream) {
    DataStream out;
    out << uint32_t{7} << std::string("gov");
    const std::string bytes = out.str();
    EXPECT_EQ(bytes.size(), 8u);

    DataStream in(bytes);
    uint32_t n = 0;
    std::string s;
    in >> n >> s;
    EXPECT_EQ(n, 7u);
    EXPECT_EQ(s, "gov");
    EXPECT_TRUE(in.str().empty());
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(SerializeTest, CompactSizeWidths) {
    struct Case {
        uint64_t value;
        size_t width;
    };
    for (const Case& c : {Case{0, 1}, Case{252, 1}, Case{253, 3}, Case{0xFFFF, 3},
                          Case{0x10000, 5}, Case{0xFFFFFFFF, 5}, Case{0x100000000ULL, 9}}) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.size(), c.width) << c.value;
    }
}

TEST(SerializeTest, NonCanonicalCompactSizeRejected) {
    // 0xFD marker followed by a value that fits in one byte
    const uint8_t raw[] = {0xFD, 0x10, 0x00};
    DataStream ss(raw, sizeof(raw));
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, OversizedLengthRejected) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings
// ============================================================================

TEST(SerializeTest, StringsAreLengthPrefixed) {
    DataStream ss;
    ss << std::string("alice");
    ASSERT_EQ(ss.size(), 6u);
    EXPECT_EQ(ss.data()[0], 5);

    std::string out;
    ss >> out;
    EXPECT_EQ(out, "alice");
}

TEST(SerializeTest, EmptyString) {
    DataStream ss;
    ss << std::string();
    EXPECT_EQ(ss.size(), 1u);

    std::string out = "junk";
    ss >> out;
    EXPECT_TRUE(out.empty());
}

TEST(SerializeTest, TruncatedStringThrows) {
    const uint8_t raw[] = {0x05, 'a', 'l'};
    DataStream ss(raw, sizeof(raw));
    std::string out;
    EXPECT_THROW(ss >> out, std::ios_base::failure);
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    ss << uint32_t{7};
    uint64_t out = 0;
    EXPECT_THROW(ss >> out, std::ios_base::failure);
}

} // namespace
} // namespace valoria
