/**
 * @file memory_repository.hpp
 * @brief In-process repositories (tests, validate-only runs, no database)
 */

#pragma once

#include <storage/mapping_repository.hpp>
#include <storage/statement_repository.hpp>
#include <map>
#include <mutex>

namespace Meisai {

class MemoryStatementRepository : public IStatementRepository {
public:
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
    int64_t insert_locked(StatementRecord& record);

    // Recursive so with_transaction can hold it across nested calls.
    std::recursive_mutex mutex_;
    std::map<int64_t, StatementRecord> records_;
    std::unordered_map<BLAKE3Pipeline::Hash, int64_t, HashHasher> by_hash_;
    int64_t next_id_ = 1;
};

class MemoryMappingRepository : public IMappingRepository {
public:
    int64_t create(MappingRecord& mapping) override;
    std::optional<MappingRecord> get(int64_t id) override;
    void update(const MappingRecord& mapping) override;
    bool remove(int64_t id) override;
    std::vector<MappingRecord> list(const MappingFilter& filter) override;
    std::optional<MappingRecord> find_active(int64_t statement_record_id,
                                             const std::string& entity_type) override;

private:
    void check_active_slot(const MappingRecord& mapping) const;    // caller holds mutex_

    std::mutex mutex_;
    std::map<int64_t, MappingRecord> mappings_;
    int64_t next_id_ = 1;
};

} // namespace Meisai
