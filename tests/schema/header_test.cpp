/**
 * @file header_test.cpp
 * @brief Unit tests for Header column resolution
 */

#include <gtest/gtest.h>

#include "schema/header.hpp"

namespace csvcols {
namespace {

class HeaderTest : public ::testing::Test {
protected:
    Header header_{Row{"id", "name", "age", "score"}};
};

TEST_F(HeaderTest, IndexOf) {
    EXPECT_EQ(header_.column_count(), 4u);
    EXPECT_EQ(header_.index_of("id"), 0);
    EXPECT_EQ(header_.index_of("score"), 3);
    EXPECT_EQ(header_.index_of("missing"), -1);
    EXPECT_EQ(header_.name(1), "name");
}

TEST_F(HeaderTest, ResolveKeepsRequestedOrder) {
    ColumnIndexMap indices;
    ASSERT_TRUE(header_.resolve({"score", "id"}, &indices).ok());
    EXPECT_EQ(indices, (ColumnIndexMap{3, 0}));
}

TEST_F(HeaderTest, ResolveRepeatedName) {
    ColumnIndexMap indices;
    ASSERT_TRUE(header_.resolve({"age", "age"}, &indices).ok());
    EXPECT_EQ(indices, (ColumnIndexMap{2, 2}));
}

TEST_F(HeaderTest, ResolveEmptyRequest) {
    ColumnIndexMap indices{7};
    ASSERT_TRUE(header_.resolve({}, &indices).ok());
    EXPECT_TRUE(indices.empty());
}

TEST_F(HeaderTest, ResolveReportsAllMissing) {
    ColumnIndexMap indices;
    auto status = header_.resolve({"id", "height", "name", "weight"}, &indices);
    EXPECT_TRUE(status.is_not_found());
    EXPECT_EQ(std::string(status.message()),
              "columns not present in header: [height, weight]");
}

TEST_F(HeaderTest, MissingColumns) {
    EXPECT_TRUE(header_.missing_columns({"id", "age"}).empty());
    EXPECT_EQ(header_.missing_columns({"x", "id", "y"}), (ColumnSet{"x", "y"}));
}

TEST_F(HeaderTest, ComplementKeepsHeaderOrder) {
    ColumnIndexMap indices;
    ASSERT_TRUE(header_.complement({"score", "name"}, &indices).ok());
    EXPECT_EQ(indices, (ColumnIndexMap{0, 2}));
}

TEST_F(HeaderTest, ComplementOfNothingIsEverything) {
    ColumnIndexMap indices;
    ASSERT_TRUE(header_.complement({}, &indices).ok());
    EXPECT_EQ(indices, (ColumnIndexMap{0, 1, 2, 3}));
}

TEST_F(HeaderTest, ComplementValidatesNames) {
    ColumnIndexMap indices;
    auto status = header_.complement({"name", "nope"}, &indices);
    EXPECT_TRUE(status.is_not_found());
}

TEST(HeaderDuplicateTest, FirstOccurrenceWinsAndComplementDropsAll) {
    Header header(Row{"a", "b", "a"});
    EXPECT_EQ(header.index_of("a"), 0);

    ColumnIndexMap indices;
    ASSERT_TRUE(header.complement({"a"}, &indices).ok());
    EXPECT_EQ(indices, (ColumnIndexMap{1}));
}

TEST(FormatColumnListTest, Formats) {
    EXPECT_EQ(format_column_list({}), "[]");
    EXPECT_EQ(format_column_list({"a"}), "[a]");
    EXPECT_EQ(format_column_list({"a", "b"}), "[a, b]");
}

}  // namespace
}  // namespace csvcols
