#include "unit-tests.hpp"

#include <algorithm>

using namespace ddc;
using namespace ddc::tests;

namespace
{
    std::string sanitize(std::initializer_list<std::uint8_t> bytes)
    {
        const std::vector<std::uint8_t> buffer(bytes);
        return utils::sanitizeUtf8(evmc::bytes_view{buffer.data(), buffer.size()});
    }
}

TEST_F(UnitTest, Utils_SanitizeUtf8_KeepsValidText)
{
    EXPECT_EQ(sanitize({'a', 'b', 'c'}), "abc");
    // "é" and "€"
    EXPECT_EQ(sanitize({0xC3, 0xA9, 0xE2, 0x82, 0xAC}), "\xC3\xA9\xE2\x82\xAC");
}

TEST_F(UnitTest, Utils_SanitizeUtf8_ReplacesInvalidSequences)
{
    EXPECT_EQ(sanitize({'a', 0xFF, 'b'}), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(sanitize({0xE2, 0x82}), "\xEF\xBF\xBD");
    EXPECT_EQ(sanitize({0xC0, 0xAF}), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitize({0xED, 0xA0, 0x80}), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_F(UnitTest, Utils_DecodeHexText)
{
    EXPECT_EQ(utils::decodeHexText("0x7b7d"), "{}");
    EXPECT_EQ(utils::decodeHexText("  202061  "), "a");
    EXPECT_FALSE(utils::decodeHexText("0x7b7").has_value());
    EXPECT_FALSE(utils::decodeHexText("hello").has_value());
}

TEST_F(UnitTest, Utils_IsAddress)
{
    EXPECT_TRUE(utils::isAddress("0xABCdef0000000000000000000000000000000001"));
    EXPECT_FALSE(utils::isAddress("ABCdef0000000000000000000000000000000001"));
    EXPECT_FALSE(utils::isAddress("0xABCdef000000000000000000000000000000001"));
    EXPECT_FALSE(utils::isAddress("0xZZCdef0000000000000000000000000000000001"));
}

TEST_F(UnitTest, Utils_WordToDecimal)
{
    EXPECT_EQ(utils::wordToDecimal(utils::wordFromUint64(0), false), "0");
    EXPECT_EQ(utils::wordToDecimal(utils::wordFromUint64(1234567890123456789ull), false), "1234567890123456789");
    EXPECT_EQ(utils::wordToDecimal(utils::wordFromInt64(-1), true), "-1");
    EXPECT_EQ(utils::wordToDecimal(utils::wordFromInt64(-230400), true), "-230400");

    evmc::bytes32 max{};
    std::fill(max.bytes, max.bytes + 32, std::uint8_t{0xFF});
    EXPECT_EQ(utils::wordToDecimal(max, false),
        "115792089237316195423570985008687907853269984665640564039457584007913129639935");
}
