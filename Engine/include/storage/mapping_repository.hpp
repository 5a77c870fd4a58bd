/**
 * @file mapping_repository.hpp
 * @brief Storage seam for mapping records
 */

#pragma once

#include <matching/mapping_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Meisai {

struct MappingFilter {
    std::optional<int64_t> statement_record_id;
    std::optional<MatchType> match_type;
    std::optional<MappingStatus> status;
    std::optional<std::string> entity_type;
    size_t offset = 0;
    size_t limit = 0;       // 0 = unlimited

    bool matches(const MappingRecord& m) const {
        if (statement_record_id && m.statement_record_id != *statement_record_id) return false;
        if (match_type && m.match_type != *match_type) return false;
        if (status && m.status != *status) return false;
        if (entity_type && m.external_entity_type != *entity_type) return false;
        return true;
    }
};

/**
 * @brief Persistent mapping store. Thread-safe; failures are MeisaiError(Storage).
 *
 * Mutations reject a second active mapping for the same
 * (statement_record_id, external_entity_type) with MeisaiError(MappingConflict).
 */
class IMappingRepository {
public:
    virtual ~IMappingRepository() = default;

    /**
     * @brief Insert @p mapping and assign mapping.id.
     */
    virtual int64_t create(MappingRecord& mapping) = 0;

    virtual std::optional<MappingRecord> get(int64_t id) = 0;

    /**
     * @throws MeisaiError(MappingNotFound)
     */
    virtual void update(const MappingRecord& mapping) = 0;

    virtual bool remove(int64_t id) = 0;

    /**
     * @brief Matching mappings in id order.
     */
    virtual std::vector<MappingRecord> list(const MappingFilter& filter) = 0;

    virtual std::optional<MappingRecord> find_active(int64_t statement_record_id,
                                                     const std::string& entity_type) = 0;
};

} // namespace Meisai
