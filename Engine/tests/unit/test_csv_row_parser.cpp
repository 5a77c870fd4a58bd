/**
 * @file test_csv_row_parser.cpp
 * @brief Statement CSV tokenizer, field parsers and row conversion
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/csv_row_parser.hpp>
#include "../statement_fixtures.hpp"

using namespace Meisai;

TEST(CsvRowParserTest, TokenizeQuotedFields) {
    auto f = CsvRowParser::tokenize(R"(a,"b,c","say ""hi""", d)");
    ASSERT_EQ(f.size(), 4);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "say \"hi\"");
    EXPECT_EQ(f[3], "d");
}

TEST(CsvRowParserTest, TokenizeKeepsEmptyTrailingField) {
    auto f = CsvRowParser::tokenize("a,b,");
    ASSERT_EQ(f.size(), 3);
    EXPECT_EQ(f[2], "");
}

TEST(CsvRowParserTest, HeaderDetection) {
    EXPECT_TRUE(CsvRowParser::is_header(CsvRowParser::tokenize(Testing::kHeader)));
    EXPECT_TRUE(CsvRowParser::is_header({"日付", "時刻"}));
    EXPECT_FALSE(CsvRowParser::is_header(CsvRowParser::tokenize(Testing::csv_row(0))));
}

TEST(CsvRowParserTest, DateFormats) {
    EXPECT_EQ(CsvRowParser::parse_date("24/04/01"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("2024/04/01"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("24/4/1"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("2024/4/1"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("2024-04-01"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("2024.04.01"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("20240401"), "2024-04-01");
    EXPECT_EQ(CsvRowParser::parse_date("50/01/01"), "2050-01-01");
    EXPECT_EQ(CsvRowParser::parse_date("99/12/31"), "1999-12-31");

    EXPECT_FALSE(CsvRowParser::parse_date("").has_value());
    EXPECT_FALSE(CsvRowParser::parse_date("2024/13/01").has_value());
    EXPECT_FALSE(CsvRowParser::parse_date("yesterday").has_value());
}

TEST(CsvRowParserTest, TimeFormats) {
    EXPECT_EQ(CsvRowParser::parse_time("9:05"), "09:05");
    EXPECT_EQ(CsvRowParser::parse_time("09:05"), "09:05");
    EXPECT_EQ(CsvRowParser::parse_time("09:05:59"), "09:05");
    EXPECT_FALSE(CsvRowParser::parse_time("25:00").has_value());
    EXPECT_FALSE(CsvRowParser::parse_time("noon").has_value());
}

TEST(CsvRowParserTest, AmountFormats) {
    EXPECT_EQ(CsvRowParser::parse_amount("1,200"), 1200);
    EXPECT_EQ(CsvRowParser::parse_amount("1200円"), 1200);
    EXPECT_EQ(CsvRowParser::parse_amount("¥1,200"), 1200);
    EXPECT_EQ(CsvRowParser::parse_amount("￥ 980"), 980);
    EXPECT_FALSE(CsvRowParser::parse_amount("-100").has_value());
    EXPECT_FALSE(CsvRowParser::parse_amount("abc").has_value());
    EXPECT_FALSE(CsvRowParser::parse_amount("").has_value());
}

TEST(CsvRowParserTest, ParsesDataRow) {
    CsvRowParser parser;
    auto r = parser.parse_line(Testing::csv_row(61, 1500), 2);

    EXPECT_EQ(r.date, "2024-04-01");
    EXPECT_EQ(r.time, "01:01");
    EXPECT_EQ(r.exit_date, "2024-04-01");
    EXPECT_EQ(r.entry_point, "東京");
    EXPECT_EQ(r.exit_point, "横浜青葉");
    EXPECT_EQ(r.toll_station, "東京料金所");
    EXPECT_EQ(r.toll_amount, 1500);
    EXPECT_EQ(r.vehicle_class, "普通車");
    EXPECT_EQ(r.content_hash, RecordHasher::fingerprint(r));
    EXPECT_EQ(r.content_hash, Testing::make_record(61, 1500).content_hash);
}

TEST(CsvRowParserTest, MissingStartDateFallsBackToEndDate) {
    CsvRowParser parser;
    auto r = parser.parse_line(",10:00,2024/05/02,10:30,A,B,,800,,,,9999,", 1);
    EXPECT_EQ(r.date, "2024-05-02");
}

TEST(CsvRowParserTest, ShortRowIsRowError) {
    CsvRowParser parser;
    try {
        parser.parse_line("2024/05/02,10:00,A", 7);
        FAIL() << "expected a row error";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RowParse);
        EXPECT_EQ(e.context_value("row"), "7");
        EXPECT_EQ(e.context_value("field"), "columns");
    }
}

TEST(CsvRowParserTest, BadAmountIsRowError) {
    CsvRowParser parser;
    try {
        parser.parse_line("2024/05/02,10:00,,,A,B,,-50,,,,9999,", 3);
        FAIL() << "expected a row error";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RowParse);
        EXPECT_EQ(e.context_value("field"), "toll_amount");
    }
}

TEST(CsvRowParserTest, MissingCardNumberIsRowError) {
    CsvRowParser parser;
    EXPECT_THROW(parser.parse_line("2024/05/02,10:00,,,A,B,,500,,,,,", 4), MeisaiError);
}
