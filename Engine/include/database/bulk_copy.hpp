/**
 * @file bulk_copy.hpp
 * @brief Batched inserts through COPY and a staging temp table
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Meisai {

/**
 * @brief Streams rows into a session temp table with COPY, then moves them
 *        into the target with one INSERT ... SELECT.
 *
 * The INSERT carries the conflict clause and RETURNING list, so per-row
 * conflict handling still applies to data that arrived through COPY.
 *
 *   BulkCopy copy(db, "statement_records", columns);
 *   copy.on_conflict("ON CONFLICT (content_hash) DO NOTHING");
 *   copy.returning({"id", "content_hash"});
 *   for (...) copy.add_row(values);
 *   copy.commit(on_row);
 *
 * Not thread-safe; one instance per connection. Destroying an instance with
 * an open COPY aborts it without touching the target table.
 */
class BulkCopy {
public:
    BulkCopy(PostgresConnection& db, const std::string& table, std::vector<std::string> columns);
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    void on_conflict(std::string clause) { conflict_clause_ = std::move(clause); }
    void returning(std::vector<std::string> columns) { returning_ = std::move(columns); }

    /**
     * @brief Queue one row. Missing or empty trailing values become NULL.
     */
    void add_row(const std::vector<std::string>& values);

    /**
     * @brief Finish the COPY and run the INSERT ... SELECT.
     * @return rows staged (not rows inserted; conflicts may skip some)
     */
    size_t commit(const PostgresConnection::RowCallback& on_row = nullptr);

    size_t staged() const noexcept { return staged_; }

private:
    void open();
    void send_buffer();
    void append_escaped(const std::string& value);
    std::string column_list() const;

    PostgresConnection& db_;
    std::string target_;
    std::string stage_;
    std::vector<std::string> columns_;
    std::vector<std::string> returning_;
    std::string conflict_clause_ = "ON CONFLICT DO NOTHING";

    std::string buffer_;
    size_t staged_ = 0;
    bool open_ = false;
};

/**
 * @brief Double-quote an identifier, splitting an optional "schema." prefix.
 */
std::string quote_identifier(const std::string& name);

} // namespace Meisai
