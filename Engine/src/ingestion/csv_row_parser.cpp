/**
 * @file csv_row_parser.cpp
 * @brief Statement CSV parsing
 */

#include <ingestion/csv_row_parser.hpp>
#include <hashing/record_hasher.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace Meisai {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool valid_ymd(int y, int m, int d) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12 || d < 1) return false;
    int limit = days[m - 1] + ((m == 2 && is_leap(y)) ? 1 : 0);
    return d <= limit;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::string erase_all(std::string s, const std::string& what) {
    size_t pos;
    while ((pos = s.find(what)) != std::string::npos) {
        s.erase(pos, what.size());
    }
    return s;
}

[[noreturn]] void row_error(size_t row, const std::string& field, const std::string& message) {
    throw MeisaiError(ErrorKind::RowParse, message,
                      {{"row", std::to_string(row)}, {"field", field}});
}

} // namespace

std::vector<std::string> CsvRowParser::tokenize(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    size_t i = 0;
    const size_t n = line.size();

    while (true) {
        field.clear();
        while (i < n && line[i] == ' ') ++i;

        if (i < n && line[i] == '"') {
            ++i;
            while (i < n) {
                if (line[i] == '"') {
                    if (i + 1 < n && line[i + 1] == '"') {
                        field.push_back('"');
                        i += 2;
                    } else if (i + 1 >= n || line[i + 1] == ',') {
                        ++i;
                        break;
                    } else {
                        // Lenient: a bare quote inside a quoted field is literal.
                        field.push_back('"');
                        ++i;
                    }
                } else {
                    field.push_back(line[i++]);
                }
            }
        } else {
            while (i < n && line[i] != ',') {
                field.push_back(line[i++]);
            }
        }

        fields.push_back(field);
        if (i < n && line[i] == ',') {
            ++i;
            continue;
        }
        break;
    }
    return fields;
}

bool CsvRowParser::is_header(const std::vector<std::string>& fields) {
    if (fields.empty()) return false;
    const std::string& first = fields[0];
    return first.find("利用") != std::string::npos || first.find("日付") != std::string::npos;
}

std::optional<std::string> CsvRowParser::parse_date(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    int y = 0, m = 0, d = 0;
    bool two_digit_year = false;

    if (all_digits(s) && s.size() == 8) {
        y = std::stoi(s.substr(0, 4));
        m = std::stoi(s.substr(4, 2));
        d = std::stoi(s.substr(6, 2));
    } else {
        char sep = 0;
        for (char c : {'/', '-', '.'}) {
            if (s.find(c) != std::string::npos) { sep = c; break; }
        }
        if (!sep) return std::nullopt;

        auto parts = split(s, sep);
        if (parts.size() != 3) return std::nullopt;
        for (const auto& p : parts) {
            if (!all_digits(p)) return std::nullopt;
        }
        if (parts[1].size() > 2 || parts[2].size() > 2) return std::nullopt;

        if (parts[0].size() == 4) {
            y = std::stoi(parts[0]);
        } else if (parts[0].size() == 2 && sep == '/') {
            y = std::stoi(parts[0]);
            two_digit_year = true;
        } else {
            return std::nullopt;
        }
        m = std::stoi(parts[1]);
        d = std::stoi(parts[2]);
    }

    if (two_digit_year) {
        y += (y <= 50) ? 2000 : 1900;
    }
    if (!valid_ymd(y, m, d)) return std::nullopt;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return std::string(buf);
}

std::optional<std::string> CsvRowParser::parse_time(const std::string& text) {
    std::string s = trim(text);
    auto parts = split(s, ':');
    if (parts.size() != 2 && parts.size() != 3) return std::nullopt;
    for (const auto& p : parts) {
        if (!all_digits(p) || p.size() > 2) return std::nullopt;
    }
    if (parts[1].size() != 2) return std::nullopt;

    int h = std::stoi(parts[0]);
    int m = std::stoi(parts[1]);
    if (h > 23 || m > 59) return std::nullopt;
    if (parts.size() == 3 && std::stoi(parts[2]) > 59) return std::nullopt;

    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return std::string(buf);
}

std::optional<int64_t> CsvRowParser::parse_amount(const std::string& text) {
    std::string s = text;
    s = erase_all(s, ",");
    s = erase_all(s, "円");
    s = erase_all(s, "￥");
    s = erase_all(s, "¥");
    s = trim(s);
    if (!all_digits(s)) return std::nullopt;

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

StatementRecord CsvRowParser::parse_row(const std::vector<std::string>& fields, size_t row_number) const {
    if (fields.size() < COLUMN_COUNT) {
        row_error(row_number, "columns", "insufficient columns: " + std::to_string(fields.size()));
    }

    StatementRecord r;

    // Missing start date falls back to the end date.
    std::string date_text = trim(fields[0]);
    if (date_text.empty()) date_text = trim(fields[2]);
    if (date_text.empty()) row_error(row_number, "date", "usage date is empty");

    auto date = parse_date(date_text);
    if (!date) row_error(row_number, "date", "unparseable date '" + date_text + "'");
    r.date = *date;

    auto time = parse_time(fields[1]);
    if (!time) row_error(row_number, "time", "unparseable time '" + trim(fields[1]) + "'");
    r.time = *time;

    if (!trim(fields[2]).empty()) {
        auto exit_date = parse_date(fields[2]);
        if (!exit_date) row_error(row_number, "exit_date", "unparseable date '" + trim(fields[2]) + "'");
        r.exit_date = *exit_date;
    }
    if (!trim(fields[3]).empty()) {
        auto exit_time = parse_time(fields[3]);
        if (!exit_time) row_error(row_number, "exit_time", "unparseable time '" + trim(fields[3]) + "'");
        r.exit_time = *exit_time;
    }

    r.entry_point = normalize_text(fields[4]);
    r.exit_point = normalize_text(fields[5]);
    r.toll_station = normalize_text(fields[6]);

    auto amount = parse_amount(fields[7]);
    if (!amount) row_error(row_number, "toll_amount", "non-numeric toll amount '" + trim(fields[7]) + "'");
    r.toll_amount = *amount;

    r.usage_category = trim(fields[8]);
    r.vehicle_class = trim(fields[9]);
    r.vehicle_number = normalize_text(fields[10]);
    r.card_number = trim(fields[11]);
    r.remarks = trim(fields[12]);

    auto problems = r.validation_errors();
    if (!problems.empty()) {
        row_error(row_number, "required", problems.front());
    }

    RecordHasher::assign(r);
    return r;
}

} // namespace Meisai
