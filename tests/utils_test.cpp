#include "gtest/gtest.h"
#include "utils/Utils.hpp"
#include <stdexcept>

TEST(UtilsTest, HexStringToUint64) {
    EXPECT_EQ(utils::hexStringToUint64("1A2b"), 0x1a2bu);
    EXPECT_EQ(utils::hexStringToUint64("0x1a2b"), 0x1a2bu);
    EXPECT_EQ(utils::hexStringToUint64("ffffffffffffffff"), UINT64_MAX);

    EXPECT_THROW(utils::hexStringToUint64(""), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64("1g"), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64("-1"), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64(" 12"), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64("12 "), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64("0x"), std::invalid_argument);
    EXPECT_THROW(utils::hexStringToUint64("10000000000000000"), std::invalid_argument);
}

TEST(UtilsTest, DpidFromString) {
    EXPECT_EQ(utils::dpidFromString("00:00:00:00:00:00:00:1a"), 0x1au);
    EXPECT_EQ(utils::dpidFromString("1a"), 0x1au);
    EXPECT_THROW(utils::dpidFromString("00:00:00:00:00:00:00:zz"), std::invalid_argument);
}
