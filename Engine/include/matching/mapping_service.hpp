/**
 * @file mapping_service.hpp
 * @brief Mapping administration and state transitions
 */

#pragma once

#include <export.hpp>
#include <matching/match_engine.hpp>
#include <storage/mapping_repository.hpp>
#include <storage/statement_repository.hpp>
#include <map>
#include <memory>
#include <mutex>

namespace Meisai {

struct CreateMappingRequest {
    int64_t statement_record_id = 0;
    std::string external_entity_id;
    std::string external_entity_type;
    std::optional<double> confidence;                   // [0,1] or percent
    MatchType match_type = MatchType::Manual;
    MappingStatus initial_status = MappingStatus::Pending;  // Active allowed for manual only
    std::string created_by;
    std::string notes;
};

struct MappingUpdate {
    std::optional<double> confidence;
    std::optional<MappingStatus> status;
    std::string rejection_reason;                       // required when status is Rejected
    std::optional<std::string> notes;
};

struct MappingStats {
    size_t total = 0;
    std::map<MatchType, size_t> by_match_type;
    std::map<MappingStatus, size_t> by_status;
    size_t high_confidence = 0;     // >= MappingRecord::HIGH_CONFIDENCE
    size_t low_confidence = 0;
    double average_confidence = 0.0;    // over mappings that carry a confidence
};

struct AutoLinkResult {
    std::vector<ScoredMatch> proposals;
    std::vector<MappingRecord> created;
    std::optional<int64_t> confirmed_id;
};

/**
 * @brief Creates, queries and transitions mappings.
 *
 * Transitions run under one mutex so the check for an already active
 * mapping and the write that activates another are a single step. Every
 * rejected operation leaves storage untouched.
 */
class MEISAI_API MappingService {
public:
    MappingService(std::shared_ptr<IStatementRepository> statements,
                   std::shared_ptr<IMappingRepository> mappings,
                   MatchConfig match_config = {});

    MappingRecord create(const CreateMappingRequest& request);

    /**
     * @brief Pending mapping from a MatchEngine proposal.
     */
    MappingRecord create_from_proposal(int64_t statement_record_id, const ScoredMatch& proposal,
                                       const std::string& created_by = "match-engine");

    /**
     * @throws MeisaiError(MappingNotFound)
     */
    MappingRecord get(int64_t id);

    std::vector<MappingRecord> list(const MappingFilter& filter);

    /**
     * @brief Change confidence, notes and/or status (through the transition rules).
     */
    MappingRecord update(int64_t id, const MappingUpdate& update);

    /**
     * @throws MeisaiError(MappingNotFound)
     */
    void remove(int64_t id);

    /**
     * @brief pending/inactive -> active; stamps the statement's external reference.
     * @throws MeisaiError(MappingConflict) when another mapping holds the slot
     */
    MappingRecord confirm(int64_t id);
    MappingRecord deactivate(int64_t id);
    MappingRecord reactivate(int64_t id);
    MappingRecord reject(int64_t id, const std::string& reason);

    std::vector<ScoredMatch> propose(const StatementRecord& record,
                                     const std::vector<ExternalEntity>& candidates) const;

    /**
     * @brief Propose, store every proposal as pending, and confirm the single
     * proposal at or above @p auto_confirm_threshold if there is exactly one.
     * Proposals already linked to the record count toward that uniqueness but
     * are never created or confirmed again.
     */
    AutoLinkResult auto_link(const StatementRecord& record, const std::vector<ExternalEntity>& candidates,
                             double auto_confirm_threshold);

    MappingStats stats();

    const MatchEngine& engine() const noexcept { return engine_; }

private:
    MappingRecord load(int64_t id);                                 // caller holds mutex_
    MappingRecord transition(int64_t id, MappingStatus to, const std::string& reason);
    // @p stored is restored if stamping the external reference fails
    MappingRecord transition_locked(MappingRecord mapping, MappingStatus to, const std::string& reason,
                                    const MappingRecord& stored);
    MappingRecord create_locked(const CreateMappingRequest& request);

    std::shared_ptr<IStatementRepository> statements_;
    std::shared_ptr<IMappingRepository> mappings_;
    MatchEngine engine_;
    std::mutex mutex_;
};

} // namespace Meisai
