/**
 * @file bulk_copy.cpp
 * @brief COPY text-format encoder and staging-table insert
 */

#include <database/bulk_copy.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <atomic>

namespace Meisai {

namespace {

constexpr size_t kSendThresholdBytes = 1 << 20;

std::atomic<uint64_t> g_stage_counter{0};

std::string quote_part(const std::string& part) {
    std::string out = "\"";
    for (char c : part) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string quote_identifier(const std::string& name) {
    auto dot = name.find('.');
    if (dot == std::string::npos) return quote_part(name);
    return quote_part(name.substr(0, dot)) + "." + quote_part(name.substr(dot + 1));
}

BulkCopy::BulkCopy(PostgresConnection& db, const std::string& table, std::vector<std::string> columns)
    : db_(db),
      target_(quote_identifier(table)),
      stage_(quote_part("meisai_stage_" + std::to_string(++g_stage_counter))),
      columns_(std::move(columns)) {
    if (columns_.empty()) {
        throw MeisaiError(ErrorKind::Validation, "bulk copy needs at least one column", {{"table", table}});
    }
}

BulkCopy::~BulkCopy() {
    if (!open_) return;
    try {
        db_.copy_abort("bulk copy abandoned");
    } catch (const std::exception& e) {
        // The server reports the aborted COPY as an error; that is the expected outcome.
        Logger::warn(std::string("Bulk copy aborted: ") + e.what());
    }
}

std::string BulkCopy::column_list() const {
    std::string out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) out += ", ";
        out += quote_part(columns_[i]);
    }
    return out;
}

void BulkCopy::open() {
    // Temp tables are per connection; the same name is reused inside a transaction.
    db_.execute("CREATE TEMP TABLE IF NOT EXISTS " + stage_ + " (LIKE " + target_ +
                " INCLUDING DEFAULTS) ON COMMIT DROP");
    db_.execute("TRUNCATE " + stage_);
    db_.execute("COPY " + stage_ + " (" + column_list() + ") FROM STDIN");
    open_ = true;
}

void BulkCopy::append_escaped(const std::string& value) {
    for (char c : value) {
        switch (c) {
            case '\0': break;
            case '\\': buffer_ += "\\\\"; break;
            case '\t': buffer_ += "\\t"; break;
            case '\n': buffer_ += "\\n"; break;
            case '\r': buffer_ += "\\r"; break;
            default: buffer_ += c; break;
        }
    }
}

void BulkCopy::send_buffer() {
    if (buffer_.empty()) return;
    db_.copy_data(buffer_);
    buffer_.clear();
}

void BulkCopy::add_row(const std::vector<std::string>& values) {
    if (values.size() > columns_.size()) {
        throw MeisaiError(ErrorKind::Validation, "bulk copy row has more values than columns",
                          {{"values", std::to_string(values.size())}, {"columns", std::to_string(columns_.size())}});
    }
    if (!open_) open();

    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) buffer_ += '\t';
        if (i < values.size() && !values[i].empty()) {
            append_escaped(values[i]);
        } else {
            buffer_ += "\\N";
        }
    }
    buffer_ += '\n';
    ++staged_;

    if (buffer_.size() >= kSendThresholdBytes) {
        send_buffer();
    }
}

size_t BulkCopy::commit(const PostgresConnection::RowCallback& on_row) {
    if (!open_) return 0;

    send_buffer();
    open_ = false;
    db_.copy_end();

    std::string cols = column_list();
    std::string sql = "INSERT INTO " + target_ + " (" + cols + ") SELECT " + cols + " FROM " + stage_;
    if (!conflict_clause_.empty()) {
        sql += " " + conflict_clause_;
    }
    if (!returning_.empty()) {
        sql += " RETURNING ";
        for (size_t i = 0; i < returning_.size(); ++i) {
            if (i) sql += ", ";
            sql += quote_part(returning_[i]);
        }
    }

    if (on_row) {
        db_.query(sql, on_row);
    } else {
        db_.execute(sql);
    }

    size_t n = staged_;
    staged_ = 0;
    return n;
}

} // namespace Meisai
