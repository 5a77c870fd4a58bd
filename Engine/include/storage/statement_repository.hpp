/**
 * @file statement_repository.hpp
 * @brief Storage seam for statement records
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <models/statement_record.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Meisai {

/**
 * @brief Persistent statement record store.
 *
 * Implementations are thread-safe. Failures are MeisaiError(Storage); an
 * insert colliding with an existing content_hash carries context
 * "sqlstate" = "23505" (unique violation), whatever the backend.
 */
class IStatementRepository {
public:
    using HashPresence = std::unordered_map<BLAKE3Pipeline::Hash, bool, HashHasher>;

    virtual ~IStatementRepository() = default;

    /**
     * @brief Insert @p record and assign record.id.
     */
    virtual int64_t create(StatementRecord& record) = 0;

    virtual std::optional<StatementRecord> get(int64_t id) = 0;

    /**
     * @brief Replace the stored fields of record.id (content_hash included).
     * @throws MeisaiError(RecordNotFound)
     */
    virtual void update(const StatementRecord& record) = 0;

    /**
     * @return false when no record had that id
     */
    virtual bool remove(int64_t id) = 0;

    /**
     * @brief Insert many records, skipping content hashes already stored.
     *
     * Inserted records get their id assigned; skipped ones keep id 0.
     * @return number of records inserted
     */
    virtual size_t bulk_insert(std::vector<StatementRecord>& records) = 0;

    virtual std::optional<StatementRecord> get_by_hash(const BLAKE3Pipeline::Hash& hash) = 0;

    virtual HashPresence check_duplicates_by_hash(const std::vector<BLAKE3Pipeline::Hash>& hashes) = 0;

    /**
     * @brief Set (or overwrite) the reference number assigned by the mapping engine.
     * @throws MeisaiError(RecordNotFound)
     */
    virtual void set_external_reference(int64_t id, const std::string& reference) = 0;

    /**
     * @brief Run @p fn atomically: every change it makes is rolled back if it throws.
     */
    virtual void with_transaction(const std::function<void(IStatementRepository&)>& fn) = 0;

    /**
     * @brief Visit every stored record in id order.
     */
    virtual void for_each(const std::function<void(const StatementRecord&)>& fn) = 0;

    virtual size_t count() = 0;
};

} // namespace Meisai
