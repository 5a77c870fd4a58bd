/**
 * @file csv_row_parser.hpp
 * @brief Statement CSV tokenizer and row -> StatementRecord conversion
 *
 * Column order (13 columns):
 *   usage date (from), time (from), usage date (to), time (to),
 *   entry IC, exit IC, toll station, toll amount, usage category,
 *   vehicle class, vehicle number, card number, remarks
 */

#pragma once

#include <models/statement_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Meisai {

class CsvRowParser {
public:
    static constexpr size_t COLUMN_COUNT = 13;

    /**
     * @brief Split one CSV row into fields.
     *
     * Quoted fields may contain commas, newlines and doubled quotes. Stray
     * quotes inside unquoted fields are kept literally. Leading spaces before
     * a field are dropped.
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief True when the first cell names a usage date column (利用 / 日付).
     */
    static bool is_header(const std::vector<std::string>& fields);

    /**
     * @brief Build a record (content_hash assigned) from one data row.
     * @throws MeisaiError(RowParse) with context "row" and "field"
     */
    StatementRecord parse_row(const std::vector<std::string>& fields, size_t row_number) const;

    StatementRecord parse_line(const std::string& line, size_t row_number) const {
        return parse_row(tokenize(line), row_number);
    }

    /**
     * @brief YY/MM/DD, YYYY/MM/DD, YY/M/D, YYYY/M/D, YYYY-MM-DD, YYYY.MM.DD, YYYYMMDD -> YYYY-MM-DD
     *
     * Two-digit years up to 50 are 20xx, others 19xx.
     */
    static std::optional<std::string> parse_date(const std::string& text);

    /**
     * @brief H:MM, HH:MM or HH:MM:SS -> HH:MM
     */
    static std::optional<std::string> parse_time(const std::string& text);

    /**
     * @brief Strips thousands separators and yen marks; rejects anything non-numeric.
     */
    static std::optional<int64_t> parse_amount(const std::string& text);
};

} // namespace Meisai
