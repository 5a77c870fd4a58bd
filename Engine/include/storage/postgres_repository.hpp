/**
 * @file postgres_repository.hpp
 * @brief PostgreSQL-backed statement and mapping repositories
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/mapping_repository.hpp>
#include <storage/statement_repository.hpp>
#include <mutex>

namespace Meisai {

/**
 * @brief Create tables and indexes if missing. Idempotent.
 */
void ensure_schema(PostgresConnection& db);

/**
 * @brief Statement records in table statement_records.
 *
 * Takes exclusive use of @p db; calls are serialized on an internal mutex.
 */
class PostgresStatementRepository : public IStatementRepository {
public:
    explicit PostgresStatementRepository(PostgresConnection& db);

    int64_t create(StatementRecord& record) override;
    std::optional<StatementRecord> get(int64_t id) override;
    void update(const StatementRecord& record) override;
    bool remove(int64_t id) override;
    size_t bulk_insert(std::vector<StatementRecord>& records) override;
    std::optional<StatementRecord> get_by_hash(const BLAKE3Pipeline::Hash& hash) override;
    HashPresence check_duplicates_by_hash(const std::vector<BLAKE3Pipeline::Hash>& hashes) override;
    void set_external_reference(int64_t id, const std::string& reference) override;
    void with_transaction(const std::function<void(IStatementRepository&)>& fn) override;
    void for_each(const std::function<void(const StatementRecord&)>& fn) override;
    size_t count() override;

private:
    std::optional<StatementRecord> fetch_one(const std::string& where, const std::vector<std::string>& params);

    PostgresConnection& db_;
    std::recursive_mutex mutex_;
    int tx_depth_ = 0;
};

/**
 * @brief Mappings in table statement_mappings. The one-active rule is also a
 * partial unique index, so concurrent writers on other connections cannot
 * break it either.
 */
class PostgresMappingRepository : public IMappingRepository {
public:
    explicit PostgresMappingRepository(PostgresConnection& db);

    int64_t create(MappingRecord& mapping) override;
    std::optional<MappingRecord> get(int64_t id) override;
    void update(const MappingRecord& mapping) override;
    bool remove(int64_t id) override;
    std::vector<MappingRecord> list(const MappingFilter& filter) override;
    std::optional<MappingRecord> find_active(int64_t statement_record_id,
                                             const std::string& entity_type) override;

private:
    std::vector<MappingRecord> select(const std::string& where, const std::vector<std::string>& params);

    PostgresConnection& db_;
    std::mutex mutex_;
};

} // namespace Meisai
