#include <matching/mapping_service.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

namespace Meisai {

namespace {

MeisaiError invalid_transition(const MappingRecord& m, MappingStatus to) {
    return MeisaiError(ErrorKind::Validation,
                       std::string("cannot move mapping from ") + to_string(m.status) + " to " + to_string(to),
                       {{"mapping_id", std::to_string(m.id)},
                        {"from", to_string(m.status)},
                        {"to", to_string(to)}});
}

} // namespace

MappingService::MappingService(std::shared_ptr<IStatementRepository> statements,
                               std::shared_ptr<IMappingRepository> mappings,
                               MatchConfig match_config)
    : statements_(std::move(statements)), mappings_(std::move(mappings)), engine_(std::move(match_config)) {
    if (!statements_ || !mappings_) {
        throw MeisaiError(ErrorKind::Validation, "mapping service needs both repositories");
    }
}

MappingRecord MappingService::create(const CreateMappingRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_locked(request);
}

MappingRecord MappingService::create_locked(const CreateMappingRequest& request) {
    MappingRecord m;
    m.statement_record_id = request.statement_record_id;
    m.external_entity_id = trim(request.external_entity_id);
    m.external_entity_type = trim(request.external_entity_type);
    m.match_type = request.match_type;
    m.status = request.initial_status;
    m.created_by = request.created_by;
    m.notes = request.notes;
    if (request.confidence) {
        m.confidence = normalize_confidence(*request.confidence);
    }

    if (m.status != MappingStatus::Pending &&
        !(m.status == MappingStatus::Active && m.match_type == MatchType::Manual)) {
        throw MeisaiError(ErrorKind::Validation,
                          std::string("new ") + to_string(m.match_type) + " mapping cannot start as " + to_string(m.status),
                          {{"field", "status"}});
    }
    m.validate();

    if (!statements_->get(m.statement_record_id)) {
        throw MeisaiError(ErrorKind::Validation, "statement record does not exist",
                          {{"field", "statement_record_id"},
                           {"statement_record_id", std::to_string(m.statement_record_id)}});
    }

    if (m.status == MappingStatus::Active) {
        if (auto active = mappings_->find_active(m.statement_record_id, m.external_entity_type)) {
            throw MeisaiError(ErrorKind::MappingConflict, "another mapping is already active",
                              {{"active_mapping_id", std::to_string(active->id)},
                               {"statement_record_id", std::to_string(m.statement_record_id)},
                               {"entity_type", m.external_entity_type}});
        }
    }

    mappings_->create(m);
    if (m.status == MappingStatus::Active) {
        try {
            statements_->set_external_reference(m.statement_record_id, m.external_entity_id);
        } catch (const MeisaiError&) {
            mappings_->remove(m.id);
            throw;
        }
    }
    return m;
}

MappingRecord MappingService::create_from_proposal(int64_t statement_record_id, const ScoredMatch& proposal,
                                                   const std::string& created_by) {
    CreateMappingRequest request;
    request.statement_record_id = statement_record_id;
    request.external_entity_id = proposal.candidate_id;
    request.external_entity_type = proposal.entity_type;
    request.confidence = proposal.confidence;
    request.match_type = proposal.match_type;
    request.created_by = created_by;
    return create(request);
}

MappingRecord MappingService::load(int64_t id) {
    auto m = mappings_->get(id);
    if (!m) {
        throw MeisaiError(ErrorKind::MappingNotFound, "mapping not found", {{"mapping_id", std::to_string(id)}});
    }
    return *m;
}

MappingRecord MappingService::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(id);
}

std::vector<MappingRecord> MappingService::list(const MappingFilter& filter) {
    return mappings_->list(filter);
}

MappingRecord MappingService::update(int64_t id, const MappingUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    MappingRecord current = load(id);
    MappingRecord next = current;

    if (update.confidence) {
        next.confidence = normalize_confidence(*update.confidence);
    }
    if (update.notes) {
        next.notes = *update.notes;
    }
    if (update.status && *update.status != current.status) {
        if (!can_transition(current.status, *update.status)) {
            throw invalid_transition(current, *update.status);
        }
    }

    bool fields_changed = next.confidence != current.confidence || next.notes != current.notes;
    if (fields_changed && current.status == MappingStatus::Rejected) {
        throw MeisaiError(ErrorKind::Validation, "rejected mappings are immutable",
                          {{"mapping_id", std::to_string(id)}});
    }

    if (update.status && *update.status != current.status) {
        return transition_locked(next, *update.status, update.rejection_reason, current);
    }
    if (fields_changed) {
        next.validate();
        mappings_->update(next);
    }
    return next;
}

void MappingService::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mappings_->remove(id)) {
        throw MeisaiError(ErrorKind::MappingNotFound, "mapping not found", {{"mapping_id", std::to_string(id)}});
    }
}

MappingRecord MappingService::transition(int64_t id, MappingStatus to, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    MappingRecord m = load(id);
    return transition_locked(m, to, reason, m);
}

MappingRecord MappingService::transition_locked(MappingRecord mapping, MappingStatus to, const std::string& reason,
                                                const MappingRecord& stored) {
    if (!can_transition(mapping.status, to)) {
        throw invalid_transition(mapping, to);
    }

    mapping.status = to;

    if (to == MappingStatus::Rejected) {
        if (trim(reason).empty()) {
            throw MeisaiError(ErrorKind::Validation, "rejection requires a reason",
                              {{"field", "rejection_reason"}, {"mapping_id", std::to_string(mapping.id)}});
        }
        mapping.rejection_reason = trim(reason);
    }

    if (to == MappingStatus::Active) {
        auto active = mappings_->find_active(mapping.statement_record_id, mapping.external_entity_type);
        if (active && active->id != mapping.id) {
            Logger::warn("Mapping " + std::to_string(mapping.id) + " conflicts with active mapping " +
                         std::to_string(active->id) + " for record " + std::to_string(mapping.statement_record_id));
            throw MeisaiError(ErrorKind::MappingConflict, "another mapping is already active",
                              {{"mapping_id", std::to_string(mapping.id)},
                               {"active_mapping_id", std::to_string(active->id)},
                               {"statement_record_id", std::to_string(mapping.statement_record_id)},
                               {"entity_type", mapping.external_entity_type}});
        }
    }

    mapping.validate();
    mappings_->update(mapping);

    if (to == MappingStatus::Active) {
        try {
            statements_->set_external_reference(mapping.statement_record_id, mapping.external_entity_id);
        } catch (const MeisaiError&) {
            mappings_->update(stored);
            throw;
        }
    }
    return mapping;
}

MappingRecord MappingService::confirm(int64_t id) {
    return transition(id, MappingStatus::Active, "");
}

MappingRecord MappingService::deactivate(int64_t id) {
    return transition(id, MappingStatus::Inactive, "");
}

MappingRecord MappingService::reactivate(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    MappingRecord m = load(id);
    if (m.status != MappingStatus::Inactive) {
        throw invalid_transition(m, MappingStatus::Active);
    }
    return transition_locked(m, MappingStatus::Active, "", m);
}

MappingRecord MappingService::reject(int64_t id, const std::string& reason) {
    return transition(id, MappingStatus::Rejected, reason);
}

std::vector<ScoredMatch> MappingService::propose(const StatementRecord& record,
                                                 const std::vector<ExternalEntity>& candidates) const {
    return engine_.propose(record, candidates);
}

AutoLinkResult MappingService::auto_link(const StatementRecord& record, const std::vector<ExternalEntity>& candidates,
                                         double auto_confirm_threshold) {
    double threshold = normalize_confidence(auto_confirm_threshold);

    AutoLinkResult result;
    result.proposals = engine_.propose(record, candidates);

    std::lock_guard<std::mutex> lock(mutex_);

    // Skip candidates already linked (in any state) to this record
    MappingFilter existing_filter;
    existing_filter.statement_record_id = record.id;
    auto existing = mappings_->list(existing_filter);

    // Uniqueness is judged over every proposal, including those already linked
    size_t strong_proposals = 0;
    for (const auto& p : result.proposals) {
        if (p.confidence >= threshold) ++strong_proposals;
    }

    MappingRecord* strong = nullptr;
    for (const auto& p : result.proposals) {
        bool known = false;
        for (const auto& e : existing) {
            if (e.external_entity_id == p.candidate_id && e.external_entity_type == p.entity_type) {
                known = true;
                break;
            }
        }
        if (known) continue;

        CreateMappingRequest request;
        request.statement_record_id = record.id;
        request.external_entity_id = p.candidate_id;
        request.external_entity_type = p.entity_type;
        request.confidence = p.confidence;
        request.match_type = p.match_type;
        request.created_by = "auto-link";
        result.created.push_back(create_locked(request));
    }

    if (strong_proposals == 1) {
        for (auto& m : result.created) {
            if (m.confidence && *m.confidence >= threshold) strong = &m;
        }
    }

    if (strong) {
        try {
            *strong = transition_locked(*strong, MappingStatus::Active, "", *strong);
            result.confirmed_id = strong->id;
        } catch (const MeisaiError& e) {
            if (e.kind() != ErrorKind::MappingConflict) throw;
            Logger::warn("Auto-link left mapping " + std::to_string(strong->id) + " pending: " + e.what());
        }
    }

    Logger::info("Auto-link record " + std::to_string(record.id) + ": " +
                 std::to_string(result.proposals.size()) + " proposals, " +
                 std::to_string(result.created.size()) + " created" +
                 (result.confirmed_id ? ", confirmed " + std::to_string(*result.confirmed_id) : ""));
    return result;
}

MappingStats MappingService::stats() {
    MappingStats s;
    double sum = 0.0;
    size_t with_confidence = 0;
    for (const auto& m : mappings_->list({})) {
        ++s.total;
        ++s.by_match_type[m.match_type];
        ++s.by_status[m.status];
        if (!m.confidence) continue;
        ++with_confidence;
        sum += *m.confidence;
        if (m.is_high_confidence()) ++s.high_confidence;
        else ++s.low_confidence;
    }
    if (with_confidence) s.average_confidence = sum / static_cast<double>(with_confidence);
    return s;
}

} // namespace Meisai
