#include "storage/csv_table.hpp"

#include "test_project.hpp"

#include <gtest/gtest.h>

#include <string>

namespace segedit {

// ── parse_csv ─────────────────────────────────────────────────────────────────

TEST(ParseCsv, HeaderAndRows) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("a,b,c\n1,2,3\n4,5,6\n", doc));
    ASSERT_EQ(doc.header.size(), 3u);
    EXPECT_EQ(doc.header[1], "b");
    ASSERT_EQ(doc.rows.size(), 2u);
    EXPECT_EQ(doc.rows[1][2], "6");
}

TEST(ParseCsv, QuotedFieldsWithSeparatorsQuotesAndNewlines) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("id,text\n1,\"a, b\"\n2,\"say \"\"hi\"\"\"\n3,\"two\nlines\"\n", doc));
    ASSERT_EQ(doc.rows.size(), 3u);
    EXPECT_EQ(doc.rows[0][1], "a, b");
    EXPECT_EQ(doc.rows[1][1], "say \"hi\"");
    EXPECT_EQ(doc.rows[2][1], "two\nlines");
}

TEST(ParseCsv, CrlfAndMissingTrailingNewline) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("a,b\r\n1,2\r\n3,4", doc));
    ASSERT_EQ(doc.rows.size(), 2u);
    EXPECT_EQ(doc.header[1], "b");
    EXPECT_EQ(doc.rows[0][1], "2");
    EXPECT_EQ(doc.rows[1][1], "4");
}

TEST(ParseCsv, SkipsBlankLinesAndBom) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("\xEF\xBB\xBF" "a,b\n\n1,2\n\n", doc));
    EXPECT_EQ(doc.header[0], "a");
    EXPECT_EQ(doc.rows.size(), 1u);
}

TEST(ParseCsv, ShortRowIsPadded) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("a,b,c\n1,2\n", doc));
    ASSERT_EQ(doc.rows[0].size(), 3u);
    EXPECT_EQ(doc.rows[0][2], "");
}

TEST(ParseCsv, LongRowIsAnError) {
    CsvDocument doc;
    EXPECT_TRUE(parse_csv("a,b\n1,2,3\n", doc));
}

TEST(ParseCsv, UnterminatedQuoteIsAnError) {
    CsvDocument doc;
    EXPECT_TRUE(parse_csv("a,b\n1,\"open\n", doc));
}

TEST(ParseCsv, EmptyInputIsAnError) {
    CsvDocument doc;
    EXPECT_TRUE(parse_csv("", doc));
}

TEST(ParseCsv, HeaderOnlyHasNoRows) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("a,b\n", doc));
    EXPECT_TRUE(doc.rows.empty());
}

TEST(ParseCsv, ColumnIndex) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("x,y\n", doc));
    EXPECT_EQ(doc.column_index("y"), 1);
    EXPECT_EQ(doc.column_index("z"), -1);
}

// ── write_csv ─────────────────────────────────────────────────────────────────

TEST(WriteCsv, QuotesOnlyWhenNeeded) {
    CsvDocument doc;
    doc.header = {"id", "text"};
    doc.rows = {{"1", "plain"}, {"2", "a, b"}, {"3", "say \"hi\""}, {"4", "x\ny"}};
    EXPECT_EQ(write_csv(doc),
              "id,text\n"
              "1,plain\n"
              "2,\"a, b\"\n"
              "3,\"say \"\"hi\"\"\"\n"
              "4,\"x\ny\"\n");
}

TEST(WriteCsv, OutputParsesBackToTheSameCells) {
    CsvDocument doc;
    doc.header = {"id", "text", "note"};
    doc.rows = {{"1", "comma, quote \" and\r\nnewline", ""}};

    CsvDocument back;
    ASSERT_FALSE(parse_csv(write_csv(doc), back));
    EXPECT_EQ(back.header, doc.header);
    EXPECT_EQ(back.rows, doc.rows);
}

// ── read_csv_file ─────────────────────────────────────────────────────────────

TEST(ReadCsvFile, MissingFileReportsNoSuchFile) {
    CsvDocument doc;
    auto ec = read_csv_file("/nonexistent/segedit/none.csv", doc);
    EXPECT_EQ(ec, std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST(ReadCsvFile, ReadsFromDisk) {
    const auto root = testing::make_temp_root("csv");
    testing::write_file(root / "t.csv", "a\n1\n2\n");

    CsvDocument doc;
    ASSERT_FALSE(read_csv_file(root / "t.csv", doc));
    EXPECT_EQ(doc.rows.size(), 2u);

    std::filesystem::remove_all(root);
}

} // namespace segedit
