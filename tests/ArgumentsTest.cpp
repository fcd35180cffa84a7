#include <gtest/gtest.h>

#include <stdexcept>
#include "Arguments.h"

TEST(ArgumentsTest, AcceptsPositiveInteger) {
    EXPECT_EQ(parsePositive("1"), 1);
    EXPECT_EQ(parsePositive("16"), 16);
}

TEST(ArgumentsTest, RejectsTrailingCharacters) {
    EXPECT_THROW(parsePositive("2abc"), std::invalid_argument);
    EXPECT_THROW(parsePositive("3.9"), std::invalid_argument);
    EXPECT_THROW(parsePositive("4 "), std::invalid_argument);
}

TEST(ArgumentsTest, RejectsNonNumeric) {
    EXPECT_THROW(parsePositive("abc"), std::invalid_argument);
    EXPECT_THROW(parsePositive(""), std::invalid_argument);
}

TEST(ArgumentsTest, RejectsNonPositiveAndHuge) {
    EXPECT_THROW(parsePositive("0"), std::out_of_range);
    EXPECT_THROW(parsePositive("-3"), std::out_of_range);
    EXPECT_THROW(parsePositive("99999999999999999999"), std::out_of_range);
}
