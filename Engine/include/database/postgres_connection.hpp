/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Meisai {

/**
 * @brief Thin libpq wrapper.
 *
 * Every failure surfaces as MeisaiError(Storage) carrying the server message,
 * with the SQLSTATE in the "sqlstate" context field when the server sent one.
 * Text-format results only; NULL columns arrive as empty strings.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    explicit PostgresConnection(const std::string& conninfo);
    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    /**
     * @brief conninfo built from PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     *
     * Defaults: localhost, 5432, meisai, postgres, no password.
     */
    static std::string conninfo_from_env();

    /// Simple-query protocol; sql may hold several statements.
    void execute(const std::string& sql);
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute with params and return the number of affected rows
     */
    size_t execute_count(const std::string& sql, const std::vector<std::string>& params);

    /// First column of the first row, or nullopt for no rows or NULL.
    std::optional<std::string> query_single(const std::string& sql,
                                            const std::vector<std::string>& params = {});

    void query(const std::string& sql, const RowCallback& callback);
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    /**
     * @brief Single-row mode: rows are delivered as they arrive instead of buffering the result
     */
    void stream_query(const std::string& sql, const RowCallback& callback);

    // COPY ... FROM STDIN, text format
    void copy_data(std::string_view chunk);
    void copy_end();
    void copy_abort(const std::string& reason);

    /**
     * @brief RAII transaction guard. Rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

private:
    struct ResultDeleter {
        void operator()(PGresult* r) const noexcept { PQclear(r); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    ResultPtr run(const std::string& sql, const std::vector<std::string>& params);
    ResultPtr checked(PGresult* raw);
    [[noreturn]] void fail(const std::string& what, const PGresult* result = nullptr);
    void require_connection() const;
    void finish_copy();
    static Row row_at(const PGresult* result, int index);

    PGconn* conn_ = nullptr;
};

} // namespace Meisai
