/**
 * @file csv_writer_test.cpp
 * @brief Unit tests for CsvWriter and the in-memory row adapters
 */

#include <gtest/gtest.h>

#include <sstream>

#include "csv/csv_reader.hpp"
#include "csv/csv_writer.hpp"

namespace csvcols {
namespace {

TEST(CsvWriterTest, PlainRows) {
    std::ostringstream out;
    CsvWriter writer(out);
    ASSERT_TRUE(writer.write({"a", "b"}).ok());
    ASSERT_TRUE(writer.write({"1", ""}).ok());
    ASSERT_TRUE(writer.flush().ok());

    EXPECT_EQ(out.str(), "a,b\n1,\n");
    EXPECT_EQ(writer.rows_written(), 2u);
}

TEST(CsvWriterTest, QuotesOnlyWhenNeeded) {
    std::ostringstream out;
    CsvWriter writer(out);
    ASSERT_TRUE(writer.write({"a,b", "say \"hi\"", "two\nlines", "plain", "semi;colon"}).ok());

    EXPECT_EQ(out.str(), "\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\",plain,semi;colon\n");
}

TEST(CsvWriterTest, QuotingFollowsDelimiter) {
    std::ostringstream out;
    CsvWriter writer(out, ';');
    ASSERT_TRUE(writer.write({"a,b", "c;d"}).ok());

    EXPECT_EQ(out.str(), "a,b;\"c;d\"\n");
}

TEST(CsvWriterTest, LoneEmptyCellIsQuoted) {
    std::ostringstream out;
    CsvWriter writer(out);
    ASSERT_TRUE(writer.write({""}).ok());
    ASSERT_TRUE(writer.write({}).ok());

    EXPECT_EQ(out.str(), "\"\"\n\n");
}

TEST(CsvWriterTest, ReaderReadsWriterOutput) {
    const Table rows = {{"id", "note"}, {"1", "a, \"quoted\"\nnote"}, {"2", ""}};

    std::ostringstream out;
    CsvWriter writer(out);
    for (const auto& row : rows) {
        ASSERT_TRUE(writer.write(row).ok());
    }

    std::istringstream in(out.str());
    CsvReader reader(in);
    Table read_back;
    Row row;
    while (reader.next(&row)) {
        read_back.push_back(row);
    }
    EXPECT_EQ(read_back, rows);
}

TEST(CsvWriterTest, FailedStreamReportsIOError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    CsvWriter writer(out);

    auto status = writer.write({"a"});
    EXPECT_TRUE(status.is_io_error());
    EXPECT_EQ(writer.rows_written(), 0u);
}

TEST(TableSourceTest, SkipsCommentsWhenAsked) {
    const Table table = {{"#c"}, {"h"}, {"#d", "1"}, {"v"}};

    TableSource source(table, true);
    Table seen;
    Row row;
    while (source.next(&row)) {
        seen.push_back(row);
    }
    EXPECT_EQ(seen, (Table{{"h"}, {"v"}}));
    EXPECT_EQ(source.comments_skipped(), 2u);
}

TEST(TableSinkTest, AppendsRows) {
    Table table;
    TableSink sink(&table);
    ASSERT_TRUE(sink.write({"a", "b"}).ok());
    ASSERT_TRUE(sink.write({"c"}).ok());
    EXPECT_EQ(table, (Table{{"a", "b"}, {"c"}}));
}

TEST(RowSourceTest, IsCommentRow) {
    EXPECT_TRUE(is_comment_row({"# x"}));
    EXPECT_TRUE(is_comment_row({"#", "a"}));
    EXPECT_FALSE(is_comment_row({"a#"}));
    EXPECT_FALSE(is_comment_row({"", "#"}));
    EXPECT_FALSE(is_comment_row({}));
}

}  // namespace
}  // namespace csvcols
