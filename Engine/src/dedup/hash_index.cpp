/**
 * @file hash_index.cpp
 * @brief Fingerprint index with check-and-reserve classification
 */

#include <dedup/hash_index.hpp>
#include <hashing/record_hasher.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

namespace Meisai {

const char* to_string(Classification c) {
    switch (c) {
        case Classification::New:       return "new";
        case Classification::Duplicate: return "duplicate";
        case Classification::Changed:   return "changed";
    }
    return "unknown";
}

// ============================================================================
// Reservation
// ============================================================================

HashIndex::Reservation::~Reservation() {
    if (!index_) return;
    try {
        release();
    } catch (const std::exception& e) {
        Logger::error(std::string("HashIndex: failed to release reservation: ") + e.what());
    }
}

HashIndex::Reservation::Reservation(Reservation&& other) noexcept
    : index_(other.index_), hash_(other.hash_) {
    other.index_ = nullptr;
}

HashIndex::Reservation& HashIndex::Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        if (index_) {
            try {
                release();
            } catch (const std::exception& e) {
                Logger::error(std::string("HashIndex: failed to release reservation: ") + e.what());
            }
        }
        index_ = other.index_;
        hash_ = other.hash_;
        other.index_ = nullptr;
    }
    return *this;
}

void HashIndex::Reservation::commit(int64_t record_id) {
    if (!index_) throw std::logic_error("HashIndex::Reservation: commit on inactive reservation");
    HashIndex* index = index_;
    index_ = nullptr;
    index->finish(hash_, record_id);
}

void HashIndex::Reservation::release() {
    if (!index_) return;
    HashIndex* index = index_;
    index_ = nullptr;
    index->finish(hash_, std::nullopt);
}

// ============================================================================
// HashIndex
// ============================================================================

HashIndex::HashIndex(HashIndexOptions options) : options_(options) {}

void HashIndex::wait_not_clearing(std::unique_lock<std::mutex>& lock) {
    cv_.wait(lock, [this] { return !clearing_; });
}

void HashIndex::wait_quiescent(std::unique_lock<std::mutex>& lock) {
    wait_not_clearing(lock);
    clearing_ = true;
    cv_.wait(lock, [this] { return pending_ == 0; });
}

HashIndex::Decision HashIndex::classify(const BLAKE3Pipeline::Hash& hash, const StatementRecord& record) {
    BLAKE3Pipeline::Hash natural_key{};
    if (options_.detect_changes) {
        natural_key = RecordHasher::natural_key(record);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    wait_not_clearing(lock);

    while (true) {
        auto it = entries_.find(hash);
        if (it == entries_.end()) break;

        if (!it->second.pending) {
            it->second.last_seen_at = now();
            Decision d;
            d.kind = Classification::Duplicate;
            d.hash = hash;
            d.existing_record_id = it->second.record_id;
            return d;
        }

        // Another session holds this fingerprint; wait for it to resolve.
        cv_.wait(lock);
        wait_not_clearing(lock);
    }

    Decision d;
    d.hash = hash;

    if (options_.detect_changes) {
        auto nit = by_natural_key_.find(natural_key);
        if (nit != by_natural_key_.end()) {
            const Entry& prev = entries_.at(nit->second);
            d.kind = Classification::Changed;
            d.existing_record_id = prev.record_id;
            d.previous_amount = prev.toll_amount;
            d.previous_hash = nit->second;
        }
    }

    Entry entry;
    entry.pending = true;
    entry.natural_key = natural_key;
    entry.toll_amount = record.toll_amount;
    entry.last_seen_at = now();
    entries_.emplace(hash, entry);
    ++pending_;

    d.reservation = Reservation(this, hash);
    return d;
}

void HashIndex::finish(const BLAKE3Pipeline::Hash& hash, std::optional<int64_t> record_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(hash);
        if (it != entries_.end() && it->second.pending) {
            --pending_;
            if (!record_id) {
                entries_.erase(it);
            } else {
                it->second.pending = false;
                it->second.record_id = *record_id;
                it->second.last_seen_at = now();

                if (options_.detect_changes) {
                    const auto natural_key = it->second.natural_key;
                    auto nit = by_natural_key_.find(natural_key);
                    if (nit != by_natural_key_.end() && nit->second != hash) {
                        // Updated in place: the old fingerprint no longer describes a stored record.
                        auto old = entries_.find(nit->second);
                        if (old != entries_.end() && !old->second.pending && old->second.record_id == *record_id) {
                            entries_.erase(old);
                        }
                    }
                    by_natural_key_[natural_key] = hash;
                }
            }
        }
    }
    cv_.notify_all();
}

Classification HashIndex::peek(const BLAKE3Pipeline::Hash& hash, const StatementRecord& record) const {
    BLAKE3Pipeline::Hash natural_key{};
    if (options_.detect_changes) {
        natural_key = RecordHasher::natural_key(record);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(hash) != entries_.end()) return Classification::Duplicate;
    if (options_.detect_changes && by_natural_key_.find(natural_key) != by_natural_key_.end()) {
        return Classification::Changed;
    }
    return Classification::New;
}

bool HashIndex::contains(const BLAKE3Pipeline::Hash& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(hash);
    return it != entries_.end() && !it->second.pending;
}

std::optional<int64_t> HashIndex::record_id(const BLAKE3Pipeline::Hash& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(hash);
    if (it == entries_.end() || it->second.pending) return std::nullopt;
    return it->second.record_id;
}

void HashIndex::insert(const StatementRecord& record) {
    const auto hash = record.content_hash;
    BLAKE3Pipeline::Hash natural_key{};
    if (options_.detect_changes) {
        natural_key = RecordHasher::natural_key(record);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    wait_not_clearing(lock);

    auto it = entries_.find(hash);
    if (it != entries_.end() && it->second.pending) return;

    Entry entry;
    entry.record_id = record.id;
    entry.natural_key = natural_key;
    entry.toll_amount = record.toll_amount;
    entry.last_seen_at = now();
    entries_[hash] = entry;

    if (options_.detect_changes) {
        by_natural_key_[natural_key] = hash;
    }
}

bool HashIndex::erase(const BLAKE3Pipeline::Hash& hash) {
    std::unique_lock<std::mutex> lock(mutex_);
    wait_not_clearing(lock);

    auto it = entries_.find(hash);
    if (it == entries_.end() || it->second.pending) return false;

    auto nit = by_natural_key_.find(it->second.natural_key);
    if (nit != by_natural_key_.end() && nit->second == hash) {
        by_natural_key_.erase(nit);
    }
    entries_.erase(it);
    return true;
}

HashIndexStats HashIndex::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    HashIndexStats s;
    s.total_records = entries_.size() - pending_;
    s.pending_reservations = pending_;
    s.change_detection = options_.detect_changes;

    // Node payload plus a per-node allocator/link overhead, plus the bucket arrays.
    constexpr size_t node_overhead = 2 * sizeof(void*);
    s.memory_estimate_bytes =
        entries_.size() * (sizeof(BLAKE3Pipeline::Hash) + sizeof(Entry) + node_overhead) +
        by_natural_key_.size() * (2 * sizeof(BLAKE3Pipeline::Hash) + node_overhead) +
        (entries_.bucket_count() + by_natural_key_.bucket_count()) * sizeof(void*);
    return s;
}

void HashIndex::clear() {
    size_t dropped = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        wait_quiescent(lock);
        dropped = entries_.size();
        entries_.clear();
        by_natural_key_.clear();
        clearing_ = false;
    }
    cv_.notify_all();
    Logger::warn("Hash index cleared (" + std::to_string(dropped) + " entries)");
}

void HashIndex::save_snapshot(const std::string& path) const {
    nlohmann::json entries = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [hash, entry] : entries_) {
            if (entry.pending) continue;
            entries.push_back({
                {"hash", BLAKE3Pipeline::to_hex(hash)},
                {"record_id", entry.record_id},
                {"last_seen_at", to_unix_ms(entry.last_seen_at)},
                {"natural_key", BLAKE3Pipeline::to_hex(entry.natural_key)},
                {"toll_amount", entry.toll_amount}
            });
        }
    }

    nlohmann::json doc = {
        {"version", 1},
        {"detect_changes", options_.detect_changes},
        {"entries", std::move(entries)}
    };

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw MeisaiError(ErrorKind::Storage, "cannot write hash index snapshot", {{"path", path}});
    }
    out << doc.dump();
    if (!out) {
        throw MeisaiError(ErrorKind::Storage, "failed writing hash index snapshot", {{"path", path}});
    }
    Logger::success("Hash index snapshot saved: " + path);
}

bool HashIndex::load_snapshot(const std::string& path) {
    if (!std::filesystem::exists(path)) return false;

    std::ifstream in(path);
    if (!in) {
        throw MeisaiError(ErrorKind::Storage, "cannot read hash index snapshot", {{"path", path}});
    }

    std::unordered_map<BLAKE3Pipeline::Hash, Entry, HashHasher> loaded;
    std::unordered_map<BLAKE3Pipeline::Hash, BLAKE3Pipeline::Hash, HashHasher> loaded_keys;
    try {
        auto doc = nlohmann::json::parse(in);
        if (doc.value("version", 0) != 1) {
            throw MeisaiError(ErrorKind::Validation, "unsupported hash index snapshot version", {{"path", path}});
        }
        // Natural keys are only meaningful if the writer maintained them
        const bool keyed = options_.detect_changes && doc.value("detect_changes", false);
        for (const auto& item : doc.at("entries")) {
            Entry entry;
            entry.record_id = item.at("record_id").get<int64_t>();
            entry.last_seen_at = from_unix_ms(item.at("last_seen_at").get<int64_t>());
            entry.natural_key = BLAKE3Pipeline::from_hex(item.at("natural_key").get<std::string>());
            entry.toll_amount = item.at("toll_amount").get<int64_t>();
            auto hash = BLAKE3Pipeline::from_hex(item.at("hash").get<std::string>());
            loaded[hash] = entry;
            if (keyed) loaded_keys[entry.natural_key] = hash;
        }
    } catch (const nlohmann::json::exception& e) {
        throw MeisaiError(ErrorKind::Validation, std::string("malformed hash index snapshot: ") + e.what(), {{"path", path}});
    } catch (const std::invalid_argument& e) {
        throw MeisaiError(ErrorKind::Validation, std::string("malformed hash index snapshot: ") + e.what(), {{"path", path}});
    }

    size_t count = loaded.size();
    {
        std::unique_lock<std::mutex> lock(mutex_);
        wait_quiescent(lock);
        entries_ = std::move(loaded);
        by_natural_key_ = std::move(loaded_keys);
        clearing_ = false;
    }
    cv_.notify_all();
    Logger::success("Hash index snapshot loaded: " + path + " (" + std::to_string(count) + " entries)");
    return true;
}

} // namespace Meisai
