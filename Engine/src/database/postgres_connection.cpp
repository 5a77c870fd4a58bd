/**
 * @file postgres_connection.cpp
 * @brief libpq-backed connection
 */

#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <exception>

namespace Meisai {

namespace {

// conninfo values are single-quoted with \ and ' escaped.
void append_param(std::string& out, const char* key, const char* env, const char* fallback) {
    const char* value = std::getenv(env);
    if (!value) value = fallback;
    if (!value) return;

    out += key;
    out += "='";
    for (const char* p = value; *p; ++p) {
        if (*p == '\\' || *p == '\'') out += '\\';
        out += *p;
    }
    out += "' ";
}

void log_notice(void*, const char* message) {
    std::string text(message ? message : "");
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    Logger::bulk("PostgreSQL: " + text);
}

} // namespace

std::string PostgresConnection::conninfo_from_env() {
    std::string conninfo;
    append_param(conninfo, "host", "PGHOST", "localhost");
    append_param(conninfo, "port", "PGPORT", "5432");
    append_param(conninfo, "dbname", "PGDATABASE", "meisai");
    append_param(conninfo, "user", "PGUSER", "postgres");
    append_param(conninfo, "password", "PGPASSWORD", nullptr);
    return conninfo;
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw MeisaiError(ErrorKind::Storage, "PostgreSQL connection failed: " + message);
    }
    PQsetNoticeProcessor(conn_, &log_notice, nullptr);
}

PostgresConnection::~PostgresConnection() {
    if (conn_) PQfinish(conn_);
}

void PostgresConnection::require_connection() const {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        throw MeisaiError(ErrorKind::Storage, "not connected to database");
    }
}

void PostgresConnection::fail(const std::string& what, const PGresult* result) {
    MeisaiError::Context ctx;
    std::string detail = PQerrorMessage(conn_);
    if (result) {
        if (const char* sqlstate = PQresultErrorField(result, PG_DIAG_SQLSTATE)) {
            ctx["sqlstate"] = sqlstate;
        }
        detail = PQresultErrorMessage(result);
    }
    throw MeisaiError(ErrorKind::Storage, what + ": " + detail, std::move(ctx));
}

PostgresConnection::ResultPtr PostgresConnection::checked(PGresult* raw) {
    ResultPtr result(raw);
    switch (PQresultStatus(result.get())) {
        case PGRES_COMMAND_OK:
        case PGRES_TUPLES_OK:
        case PGRES_COPY_IN:
            return result;
        default:
            fail("PostgreSQL query failed", result.get());
    }
}

PostgresConnection::ResultPtr PostgresConnection::run(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    return checked(PQexecParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                                values.data(), nullptr, nullptr, 0));
}

PostgresConnection::Row PostgresConnection::row_at(const PGresult* result, int index) {
    int nfields = PQnfields(result);
    Row row;
    row.reserve(nfields);
    for (int j = 0; j < nfields; ++j) {
        row.emplace_back(PQgetvalue(result, index, j));
    }
    return row;
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();
    checked(PQexec(conn_, sql.c_str()));
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    run(sql, params);
}

size_t PostgresConnection::execute_count(const std::string& sql, const std::vector<std::string>& params) {
    auto result = run(sql, params);
    const char* tuples = PQcmdTuples(result.get());
    return (tuples && *tuples) ? std::stoul(tuples) : 0;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<std::string>& params) {
    auto result = run(sql, params);
    if (PQntuples(result.get()) == 0 || PQnfields(result.get()) == 0 || PQgetisnull(result.get(), 0, 0)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(result.get(), 0, 0));
}

void PostgresConnection::query(const std::string& sql, const RowCallback& callback) {
    query(sql, {}, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    auto result = run(sql, params);
    int nrows = PQntuples(result.get());
    for (int i = 0; i < nrows; ++i) {
        callback(row_at(result.get(), i));
    }
}

void PostgresConnection::stream_query(const std::string& sql, const RowCallback& callback) {
    require_connection();

    if (PQsendQuery(conn_, sql.c_str()) == 0) {
        fail("PQsendQuery failed");
    }
    if (PQsetSingleRowMode(conn_) == 0) {
        fail("PQsetSingleRowMode failed");
    }

    // Drain every result even after a callback throws, so the connection stays usable.
    std::exception_ptr pending;
    std::optional<MeisaiError> server_error;
    while (PGresult* raw = PQgetResult(conn_)) {
        ResultPtr result(raw);
        ExecStatusType status = PQresultStatus(raw);
        if (status == PGRES_SINGLE_TUPLE) {
            if (pending || server_error) continue;
            try {
                callback(row_at(raw, 0));
            } catch (const std::exception&) {
                pending = std::current_exception();
            }
        } else if (status != PGRES_TUPLES_OK && !server_error) {
            MeisaiError::Context ctx;
            if (const char* sqlstate = PQresultErrorField(raw, PG_DIAG_SQLSTATE)) ctx["sqlstate"] = sqlstate;
            server_error.emplace(ErrorKind::Storage,
                                 std::string("PostgreSQL query failed: ") + PQresultErrorMessage(raw), std::move(ctx));
        }
    }

    if (pending) std::rethrow_exception(pending);
    if (server_error) throw *server_error;
}

void PostgresConnection::copy_data(std::string_view chunk) {
    require_connection();
    if (PQputCopyData(conn_, chunk.data(), static_cast<int>(chunk.size())) != 1) {
        fail("COPY data failed");
    }
}

void PostgresConnection::finish_copy() {
    ResultPtr failed;
    while (PGresult* raw = PQgetResult(conn_)) {
        ResultPtr result(raw);
        if (PQresultStatus(raw) != PGRES_COMMAND_OK && !failed) {
            failed = std::move(result);
        }
    }
    if (failed) {
        fail("COPY failed", failed.get());
    }
}

void PostgresConnection::copy_end() {
    require_connection();
    if (PQputCopyEnd(conn_, nullptr) != 1) {
        fail("COPY end failed");
    }
    finish_copy();
}

void PostgresConnection::copy_abort(const std::string& reason) {
    require_connection();
    if (PQputCopyEnd(conn_, reason.c_str()) != 1) {
        fail("COPY abort failed");
    }
    finish_copy();
}

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.execute("BEGIN");
}

PostgresConnection::Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        Logger::warn(std::string("Rollback in transaction destructor failed: ") + e.what());
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.execute("COMMIT");
    done_ = true;
}

} // namespace Meisai
