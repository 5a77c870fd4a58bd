#include <storage/memory_repository.hpp>
#include <core/errors.hpp>
#include <utils/time.hpp>

namespace Meisai {

namespace {

MeisaiError unique_violation(const BLAKE3Pipeline::Hash& hash) {
    return MeisaiError(ErrorKind::Storage, "content hash already stored",
                       {{"sqlstate", "23505"}, {"content_hash", BLAKE3Pipeline::to_hex(hash)}});
}

} // namespace

// ---------------------------------------------------------------------------
// MemoryStatementRepository
// ---------------------------------------------------------------------------

int64_t MemoryStatementRepository::insert_locked(StatementRecord& record) {
    if (by_hash_.count(record.content_hash)) {
        throw unique_violation(record.content_hash);
    }
    record.id = next_id_++;
    records_[record.id] = record;
    by_hash_[record.content_hash] = record.id;
    return record.id;
}

int64_t MemoryStatementRepository::create(StatementRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return insert_locked(record);
}

std::optional<StatementRecord> MemoryStatementRepository::get(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void MemoryStatementRepository::update(const StatementRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(record.id);
    if (it == records_.end()) {
        throw MeisaiError(ErrorKind::RecordNotFound, "statement record not found",
                          {{"record_id", std::to_string(record.id)}});
    }
    auto clash = by_hash_.find(record.content_hash);
    if (clash != by_hash_.end() && clash->second != record.id) {
        throw unique_violation(record.content_hash);
    }
    by_hash_.erase(it->second.content_hash);
    it->second = record;
    by_hash_[record.content_hash] = record.id;
}

bool MemoryStatementRepository::remove(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    by_hash_.erase(it->second.content_hash);
    records_.erase(it);
    return true;
}

size_t MemoryStatementRepository::bulk_insert(std::vector<StatementRecord>& records) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t inserted = 0;
    for (auto& r : records) {
        if (by_hash_.count(r.content_hash)) {
            r.id = 0;
            continue;
        }
        insert_locked(r);
        ++inserted;
    }
    return inserted;
}

std::optional<StatementRecord> MemoryStatementRepository::get_by_hash(const BLAKE3Pipeline::Hash& hash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = by_hash_.find(hash);
    if (it == by_hash_.end()) return std::nullopt;
    return records_.at(it->second);
}

IStatementRepository::HashPresence MemoryStatementRepository::check_duplicates_by_hash(
    const std::vector<BLAKE3Pipeline::Hash>& hashes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    HashPresence out;
    for (const auto& h : hashes) {
        out[h] = by_hash_.count(h) > 0;
    }
    return out;
}

void MemoryStatementRepository::set_external_reference(int64_t id, const std::string& reference) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw MeisaiError(ErrorKind::RecordNotFound, "statement record not found",
                          {{"record_id", std::to_string(id)}});
    }
    it->second.external_reference_number = reference;
}

void MemoryStatementRepository::with_transaction(const std::function<void(IStatementRepository&)>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto records = records_;
    auto by_hash = by_hash_;
    auto next_id = next_id_;
    try {
        fn(*this);
    } catch (const std::exception&) {
        records_ = std::move(records);
        by_hash_ = std::move(by_hash);
        next_id_ = next_id;
        throw;
    }
}

void MemoryStatementRepository::for_each(const std::function<void(const StatementRecord&)>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& [id, record] : records_) {
        fn(record);
    }
}

size_t MemoryStatementRepository::count() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return records_.size();
}

// ---------------------------------------------------------------------------
// MemoryMappingRepository
// ---------------------------------------------------------------------------

void MemoryMappingRepository::check_active_slot(const MappingRecord& mapping) const {
    if (mapping.status != MappingStatus::Active) return;
    for (const auto& [id, other] : mappings_) {
        if (id != mapping.id &&
            other.status == MappingStatus::Active &&
            other.statement_record_id == mapping.statement_record_id &&
            other.external_entity_type == mapping.external_entity_type) {
            throw MeisaiError(ErrorKind::MappingConflict, "another mapping is already active",
                              {{"mapping_id", std::to_string(mapping.id)},
                               {"active_mapping_id", std::to_string(id)},
                               {"statement_record_id", std::to_string(mapping.statement_record_id)},
                               {"entity_type", mapping.external_entity_type}});
        }
    }
}

int64_t MemoryMappingRepository::create(MappingRecord& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    mapping.id = 0;
    check_active_slot(mapping);
    mapping.id = next_id_++;
    if (mapping.created_at == Timestamp{}) mapping.created_at = now();
    mapping.updated_at = mapping.created_at;
    mappings_[mapping.id] = mapping;
    return mapping.id;
}

std::optional<MappingRecord> MemoryMappingRepository::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mappings_.find(id);
    if (it == mappings_.end()) return std::nullopt;
    return it->second;
}

void MemoryMappingRepository::update(const MappingRecord& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mappings_.find(mapping.id);
    if (it == mappings_.end()) {
        throw MeisaiError(ErrorKind::MappingNotFound, "mapping not found",
                          {{"mapping_id", std::to_string(mapping.id)}});
    }
    check_active_slot(mapping);
    it->second = mapping;
    it->second.updated_at = now();
}

bool MemoryMappingRepository::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return mappings_.erase(id) > 0;
}

std::vector<MappingRecord> MemoryMappingRepository::list(const MappingFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MappingRecord> out;
    size_t skipped = 0;
    for (const auto& [id, m] : mappings_) {
        if (!filter.matches(m)) continue;
        if (skipped < filter.offset) {
            ++skipped;
            continue;
        }
        out.push_back(m);
        if (filter.limit && out.size() >= filter.limit) break;
    }
    return out;
}

std::optional<MappingRecord> MemoryMappingRepository::find_active(int64_t statement_record_id,
                                                                  const std::string& entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, m] : mappings_) {
        if (m.status == MappingStatus::Active &&
            m.statement_record_id == statement_record_id &&
            m.external_entity_type == entity_type) {
            return m;
        }
    }
    return std::nullopt;
}

} // namespace Meisai
