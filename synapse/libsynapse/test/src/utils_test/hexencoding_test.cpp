#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "hexencoding.hpp"
#include "random.hpp"

using namespace ::testing;
using namespace ::synapse::utils;

namespace
{
class HexEncodingTest : public Test
{
};
}  // namespace

TEST_F(HexEncodingTest, ToHex)
{
    std::vector<uint8_t> bytes {0x00, 0x1f, 0xa0, 0xff};
    EXPECT_EQ(to_hex(bytes), "001fa0ff");
    EXPECT_EQ(to_hex(bytes.data(), 0), "");
}

TEST_F(HexEncodingTest, FromHex)
{
    std::vector<uint8_t> bytes;
    EXPECT_TRUE(from_hex("001FA0ff", bytes));
    EXPECT_EQ(bytes, (std::vector<uint8_t> {0x00, 0x1f, 0xa0, 0xff}));
}

TEST_F(HexEncodingTest, FromHex_Invalid)
{
    std::vector<uint8_t> bytes;
    EXPECT_FALSE(from_hex("abc", bytes));
    EXPECT_FALSE(from_hex("zz", bytes));
    EXPECT_TRUE(bytes.empty());
}

TEST_F(HexEncodingTest, IsHexString)
{
    EXPECT_TRUE(is_hex_string("0123456789abcdefABCDEF"));
    EXPECT_FALSE(is_hex_string(""));
    EXPECT_FALSE(is_hex_string("12g4"));
}

TEST_F(HexEncodingTest, ToLowerAscii)
{
    EXPECT_EQ(to_lower_ascii("ABCdef-09"), "abcdef-09");
}

TEST_F(HexEncodingTest, RandomHexStringIsUpperCase)
{
    auto str = Random::hex_string(16);
    EXPECT_EQ(str.size(), 16u);
    EXPECT_TRUE(is_hex_string(str));
    EXPECT_EQ(str.find_first_of("abcdef"), std::string::npos);
}
