#include <matching/mapping_record.hpp>
#include <core/errors.hpp>
#include <cmath>

namespace Meisai {

const char* to_string(MatchType type) {
    switch (type) {
        case MatchType::Exact:  return "exact";
        case MatchType::Fuzzy:  return "fuzzy";
        case MatchType::Time:   return "time";
        case MatchType::Amount: return "amount";
        case MatchType::Manual: return "manual";
    }
    return "unknown";
}

const char* to_string(MappingStatus status) {
    switch (status) {
        case MappingStatus::Pending:  return "pending";
        case MappingStatus::Active:   return "active";
        case MappingStatus::Inactive: return "inactive";
        case MappingStatus::Rejected: return "rejected";
    }
    return "unknown";
}

std::optional<MatchType> parse_match_type(const std::string& text) {
    for (auto t : {MatchType::Exact, MatchType::Fuzzy, MatchType::Time, MatchType::Amount, MatchType::Manual}) {
        if (text == to_string(t)) return t;
    }
    return std::nullopt;
}

std::optional<MappingStatus> parse_mapping_status(const std::string& text) {
    for (auto s : {MappingStatus::Pending, MappingStatus::Active, MappingStatus::Inactive, MappingStatus::Rejected}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

double normalize_confidence(double value) {
    if (std::isnan(value) || value < 0.0 || value > 100.0) {
        throw MeisaiError(ErrorKind::Validation, "confidence must be within [0, 1] or [0, 100]",
                          {{"field", "confidence"}, {"value", std::to_string(value)}});
    }
    return value > 1.0 ? value / 100.0 : value;
}

bool can_transition(MappingStatus from, MappingStatus to) {
    if (from == MappingStatus::Rejected) return false;
    switch (to) {
        case MappingStatus::Active:   return from == MappingStatus::Pending || from == MappingStatus::Inactive;
        case MappingStatus::Inactive: return from == MappingStatus::Active;
        case MappingStatus::Rejected: return true;
        case MappingStatus::Pending:  return false;
    }
    return false;
}

void MappingRecord::validate() const {
    if (statement_record_id <= 0) {
        throw MeisaiError(ErrorKind::Validation, "statement record id must be positive",
                          {{"field", "statement_record_id"}});
    }
    if (external_entity_id.empty()) {
        throw MeisaiError(ErrorKind::Validation, "external entity id cannot be empty",
                          {{"field", "external_entity_id"}});
    }
    if (external_entity_type.empty() || external_entity_type.size() > 50) {
        throw MeisaiError(ErrorKind::Validation, "external entity type must be 1-50 characters",
                          {{"field", "external_entity_type"}});
    }
    if (match_type != MatchType::Manual && !confidence) {
        throw MeisaiError(ErrorKind::Validation, "confidence is required for non-manual matches",
                          {{"field", "confidence"}, {"match_type", to_string(match_type)}});
    }
    if (confidence && (std::isnan(*confidence) || *confidence < 0.0 || *confidence > 1.0)) {
        throw MeisaiError(ErrorKind::Validation, "confidence must be between 0.0 and 1.0",
                          {{"field", "confidence"}});
    }
    bool rejected = status == MappingStatus::Rejected;
    if (rejected == rejection_reason.empty()) {
        throw MeisaiError(ErrorKind::Validation,
                          rejected ? "rejected mapping requires a reason"
                                   : "rejection reason is only allowed on rejected mappings",
                          {{"field", "rejection_reason"}});
    }
    if (created_by.size() > 100) {
        throw MeisaiError(ErrorKind::Validation, "created_by too long (max 100 characters)",
                          {{"field", "created_by"}});
    }
}

} // namespace Meisai
