/**
 * @file select_test.cpp
 * @brief Integration tests for the public selection and split API
 */

#include <gtest/gtest.h>

#include <sstream>

#include <csvcols/csvcols.hpp>

#include "test_utils.hpp"

namespace csvcols {
namespace {

const char* const kInput =
    "# produced by sim\n"
    "run,alpha,beta,gamma\n"
    "r1,0.12345,7,x\n"
    "r2,1.98765,8,\"y, z\"\n";

TEST(SelectColumnsTest, SelectAndRound) {
    for (bool in_memory : {false, true}) {
        SelectOptions options;
        options.columns = {"run", "alpha"};
        options.round = 2;
        options.in_memory = in_memory;

        std::istringstream in(kInput);
        std::ostringstream out;
        ASSERT_TRUE(select_columns(in, out, options).ok());
        EXPECT_EQ(out.str(), "run,alpha\nr1,0.12\nr2,1.99\n");
    }
}

TEST(SelectColumnsTest, ComplementWithOutputDelimiter) {
    SelectOptions options;
    options.columns = {"alpha"};
    options.complement = true;
    options.output_delimiter = '\t';

    std::istringstream in(kInput);
    std::ostringstream out;
    ASSERT_TRUE(select_columns(in, out, options).ok());
    EXPECT_EQ(out.str(), "run\tbeta\tgamma\nr1\t7\tx\nr2\t8\ty, z\n");
}

TEST(SelectColumnsTest, InputDelimiterIsDefaultOutputDelimiter) {
    SelectOptions options;
    options.columns = {"b"};
    options.input_delimiter = ';';
    EXPECT_EQ(options.effective_output_delimiter(), ';');

    std::istringstream in("a;b\n1;2\n");
    std::ostringstream out;
    ASSERT_TRUE(select_columns(in, out, options).ok());
    EXPECT_EQ(out.str(), "b\n2\n");
}

TEST(SelectColumnsTest, MissingColumns) {
    SelectOptions options;
    options.columns = {"run", "delta", "epsilon"};

    std::istringstream in(kInput);
    std::ostringstream out;
    auto status = select_columns(in, out, options);
    EXPECT_TRUE(status.is_not_found());
    EXPECT_EQ(status.to_string(), "NotFound: columns not present in header: [delta, epsilon]");
    EXPECT_TRUE(out.str().empty());
}

TEST(SplitWideTest, WritesOutputs) {
    test::TempDir dir("split_api_");
    const auto input = dir.path() / "table.csv";
    test::write_file(input, kInput);

    SplitOptions options;
    options.file = input.string();
    options.ncols = 2;

    std::vector<std::string> outputs;
    ASSERT_TRUE(split_wide(options, &outputs).ok());
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(test::read_file(outputs[0]), ",alpha,beta\nr1,0.12345,7\nr2,1.98765,8\n");
    EXPECT_EQ(test::read_file(outputs[1]), ",gamma\nr1,x\nr2,\"y, z\"\n");
}

TEST(SplitWideTest, TexWithUnsupportedDelimiterWritesNothing) {
    test::TempDir dir("split_api_");
    const auto input = dir.path() / "table.csv";
    test::write_file(input, "k|a|b\nx|1|2\n");

    SplitOptions options;
    options.file = input.string();
    options.ncols = 1;
    options.delimiter = '|';
    options.tex = true;

    std::vector<std::string> outputs;
    auto status = split_wide(options, &outputs);
    EXPECT_EQ(status.code(), StatusCode::kNotSupported);
    EXPECT_TRUE(outputs.empty());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "table0.csv"));
}

TEST(VersionTest, Version) {
    EXPECT_STREQ(version(), "0.1.0");
}

}  // namespace
}  // namespace csvcols
