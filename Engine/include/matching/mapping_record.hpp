/**
 * @file mapping_record.hpp
 * @brief Link between a statement record and an external accounting entity
 */

#pragma once

#include <utils/time.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace Meisai {

enum class MatchType {
    Exact,
    Fuzzy,
    Time,
    Amount,
    Manual
};

enum class MappingStatus {
    Pending,
    Active,
    Inactive,
    Rejected    // terminal
};

const char* to_string(MatchType type);
const char* to_string(MappingStatus status);
std::optional<MatchType> parse_match_type(const std::string& text);
std::optional<MappingStatus> parse_mapping_status(const std::string& text);

/**
 * @brief Accepts [0,1] as-is and (1,100] as a percentage.
 * @throws MeisaiError(Validation) for anything outside [0,100] or NaN
 */
double normalize_confidence(double value);

/**
 * @brief Whether @p from -> @p to is a legal mapping transition.
 *
 * pending -> active, active <-> inactive, any non-rejected -> rejected.
 */
bool can_transition(MappingStatus from, MappingStatus to);

struct MappingRecord {
    static constexpr double HIGH_CONFIDENCE = 0.8;

    int64_t id = 0;
    int64_t statement_record_id = 0;
    std::string external_entity_id;
    std::string external_entity_type;
    std::optional<double> confidence;       // [0,1]; optional only for manual mappings
    MatchType match_type = MatchType::Manual;
    MappingStatus status = MappingStatus::Pending;
    std::string rejection_reason;
    std::string created_by;
    std::string notes;
    Timestamp created_at{};
    Timestamp updated_at{};

    /**
     * @throws MeisaiError(Validation) when a record invariant does not hold
     */
    void validate() const;

    bool is_high_confidence() const {
        return confidence && *confidence >= HIGH_CONFIDENCE;
    }
};

} // namespace Meisai
