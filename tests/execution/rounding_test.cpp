/**
 * @file rounding_test.cpp
 * @brief Unit tests for numeric cell rounding
 */

#include <gtest/gtest.h>

#include <cmath>

#include "execution/rounding.hpp"

namespace csvcols {
namespace {

TEST(RoundingTest, IntegerLiterals) {
    EXPECT_TRUE(is_integer_literal("42"));
    EXPECT_TRUE(is_integer_literal("-7"));
    EXPECT_TRUE(is_integer_literal("+7"));
    EXPECT_TRUE(is_integer_literal(" 12 "));
    EXPECT_TRUE(is_integer_literal("1_000"));
    EXPECT_TRUE(is_integer_literal("007"));

    EXPECT_FALSE(is_integer_literal(""));
    EXPECT_FALSE(is_integer_literal("-"));
    EXPECT_FALSE(is_integer_literal("1.0"));
    EXPECT_FALSE(is_integer_literal("1e3"));
    EXPECT_FALSE(is_integer_literal("1__0"));
    EXPECT_FALSE(is_integer_literal("_1"));
    EXPECT_FALSE(is_integer_literal("1_"));
    EXPECT_FALSE(is_integer_literal("abc"));
}

TEST(RoundingTest, FloatLiterals) {
    EXPECT_DOUBLE_EQ(*parse_float_literal("3.5"), 3.5);
    EXPECT_DOUBLE_EQ(*parse_float_literal(" -0.25 "), -0.25);
    EXPECT_DOUBLE_EQ(*parse_float_literal("+1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(*parse_float_literal(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*parse_float_literal("5."), 5.0);
    EXPECT_TRUE(std::isinf(*parse_float_literal("inf")));
    EXPECT_TRUE(std::isinf(*parse_float_literal("-Infinity")));
    EXPECT_TRUE(std::isnan(*parse_float_literal("NaN")));
    EXPECT_TRUE(std::isinf(*parse_float_literal("1e999")));

    EXPECT_FALSE(parse_float_literal("").has_value());
    EXPECT_FALSE(parse_float_literal("abc").has_value());
    EXPECT_FALSE(parse_float_literal("1.2.3").has_value());
    EXPECT_FALSE(parse_float_literal("1e").has_value());
    EXPECT_FALSE(parse_float_literal("+-1").has_value());
    EXPECT_FALSE(parse_float_literal("0x10").has_value());
}

TEST(RoundingTest, FormatDouble) {
    EXPECT_EQ(format_double(3.14), "3.14");
    EXPECT_EQ(format_double(2.0), "2.0");
    EXPECT_EQ(format_double(-0.0), "-0.0");
    EXPECT_EQ(format_double(0.0001), "0.0001");
    EXPECT_EQ(format_double(0.00001), "1e-05");
    EXPECT_EQ(format_double(1e15), "1000000000000000.0");
    EXPECT_EQ(format_double(1e16), "1e+16");
    EXPECT_EQ(format_double(1.5e300), "1.5e+300");
    EXPECT_EQ(format_double(std::nan("")), "nan");
    EXPECT_EQ(format_double(-HUGE_VAL), "-inf");
}

TEST(RoundingTest, RoundToDigitsHalfEvenOnBinaryValue) {
    EXPECT_DOUBLE_EQ(round_to_digits(3.14159, 2), 3.14);
    EXPECT_DOUBLE_EQ(round_to_digits(2.5, 0), 2.0);
    EXPECT_DOUBLE_EQ(round_to_digits(3.5, 0), 4.0);
    // 2.675 is stored as 2.67499999...
    EXPECT_DOUBLE_EQ(round_to_digits(2.675, 2), 2.67);
    EXPECT_DOUBLE_EQ(round_to_digits(1234.5678, 1000), 1234.5678);
}

TEST(RoundingTest, RoundCell) {
    EXPECT_EQ(round_cell("3.14159", 2), "3.14");
    EXPECT_EQ(round_cell("42", 2), "42");
    EXPECT_EQ(round_cell("42", 0), "42");
    EXPECT_EQ(round_cell("abc", 2), "abc");
    EXPECT_EQ(round_cell("", 2), "");
    EXPECT_EQ(round_cell("2.5", 0), "2.0");
    EXPECT_EQ(round_cell("1.0", 3), "1.0");
    EXPECT_EQ(round_cell("-0.004", 2), "-0.0");
    EXPECT_EQ(round_cell("1e-7", 3), "0.0");
    EXPECT_EQ(round_cell("inf", 2), "inf");
}

TEST(RoundingTest, NegativePrecisionDisables) {
    EXPECT_EQ(round_cell("3.14159", -1), "3.14159");

    Row row{"1.23456", "x"};
    round_row(&row, -1);
    EXPECT_EQ(row, (Row{"1.23456", "x"}));
}

TEST(RoundingTest, RoundingIsIdempotent) {
    for (const char* cell : {"3.14159", "-12.3456", "0.000123", "99.995", "1e20"}) {
        const std::string once = round_cell(cell, 2);
        EXPECT_EQ(round_cell(once, 2), once) << cell;
    }
}

TEST(RoundingTest, RoundRow) {
    Row row{"sim1", "1", "0.123456", "7.5e-1"};
    round_row(&row, 3);
    EXPECT_EQ(row, (Row{"sim1", "1", "0.123", "0.75"}));
}

}  // namespace
}  // namespace csvcols
