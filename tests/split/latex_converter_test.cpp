/**
 * @file latex_converter_test.cpp
 * @brief Tests for the csv2latex converter
 */

#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include "split/latex_converter.hpp"

namespace csvcols {
namespace {

TEST(LatexConverterTest, SeparatorCodes) {
    EXPECT_EQ(latex_separator_code(','), 'c');
    EXPECT_EQ(latex_separator_code(';'), 's');
    EXPECT_EQ(latex_separator_code('\t'), 't');
    EXPECT_EQ(latex_separator_code(' '), 'p');
    EXPECT_EQ(latex_separator_code(':'), 'l');
    EXPECT_FALSE(latex_separator_code('|').has_value());
}

TEST(LatexConverterTest, UnsupportedDelimiter) {
    std::unique_ptr<LatexConverter> converter;
    auto status = LatexConverter::create('|', &converter);
    EXPECT_EQ(status.code(), StatusCode::kNotSupported);
    EXPECT_EQ(converter, nullptr);
}

TEST(LatexConverterTest, OnlyCreateBuildsConverters) {
    static_assert(!std::is_constructible_v<LatexConverter, std::string, char>);
    static_assert(!std::is_default_constructible_v<LatexConverter>);

    std::unique_ptr<LatexConverter> converter;
    ASSERT_TRUE(LatexConverter::create('\t', &converter, "my-converter").ok());
    ASSERT_NE(converter, nullptr);
    EXPECT_EQ(converter->program(), "my-converter");
    EXPECT_EQ(converter->arguments("a.csv")[1], "t");
}

TEST(LatexConverterTest, Arguments) {
    std::unique_ptr<LatexConverter> converter;
    ASSERT_TRUE(LatexConverter::create(';', &converter).ok());
    EXPECT_EQ(converter->program(), "csv2latex");

    const std::vector<std::string> expected = {
        "-s", "s", "-n", "-r", "2", "-p", "r", "-e", "-c", "0.75", "split0.csv"};
    EXPECT_EQ(converter->arguments("split0.csv"), expected);
}

TEST(LatexConverterTest, CapturesStandardOutput) {
    std::unique_ptr<LatexConverter> converter;
    ASSERT_TRUE(LatexConverter::create(',', &converter, "echo").ok());

    std::string output;
    ASSERT_TRUE(converter->convert("in0.csv", &output).ok());
    EXPECT_EQ(output, "-s c -n -r 2 -p r -e -c 0.75 in0.csv\n");
}

TEST(LatexConverterTest, NonZeroExitIsAborted) {
    std::unique_ptr<LatexConverter> converter;
    ASSERT_TRUE(LatexConverter::create(',', &converter, "false").ok());

    std::string output;
    auto status = converter->convert("in0.csv", &output);
    EXPECT_EQ(status.code(), StatusCode::kAborted);
}

TEST(LatexConverterTest, MissingProgramIsAborted) {
    std::unique_ptr<LatexConverter> converter;
    ASSERT_TRUE(LatexConverter::create(',', &converter, "csvcols-no-such-program").ok());

    std::string output;
    auto status = converter->convert("in0.csv", &output);
    EXPECT_EQ(status.code(), StatusCode::kAborted);
    EXPECT_NE(std::string(status.message()).find("could not be started"), std::string::npos);
}

}  // namespace
}  // namespace csvcols
