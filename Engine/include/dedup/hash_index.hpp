/**
 * @file hash_index.hpp
 * @brief Synchronized fingerprint index backing import deduplication
 */

#pragma once

#include <export.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <models/statement_record.hpp>
#include <utils/time.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Meisai {

enum class Classification {
    New,
    Duplicate,
    Changed     // same natural key, different fingerprint (change detection only)
};

const char* to_string(Classification c);

struct HashIndexStats {
    size_t total_records = 0;
    size_t pending_reservations = 0;
    size_t memory_estimate_bytes = 0;
    bool change_detection = false;
};

struct HashIndexOptions {
    // Maintain a secondary index on the natural key (fingerprint minus amount).
    bool detect_changes = false;
};

/**
 * @brief In-memory fingerprint -> record summary map.
 *
 * classify() is an atomic check-and-reserve: for any fingerprint exactly one
 * caller observes New. A second caller for the same fingerprint blocks until
 * the first commits (then sees Duplicate) or releases (then takes the slot).
 * A released or abandoned reservation never leaves a fingerprint behind.
 *
 * clear() waits for outstanding reservations, blocks new ones, and empties
 * the index in one step.
 */
class MEISAI_API HashIndex {
public:
    /**
     * @brief Outstanding New/Changed slot. Released on destruction unless committed.
     */
    class Reservation {
    public:
        Reservation() = default;
        ~Reservation();

        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&& other) noexcept;

        /**
         * @brief Register the fingerprint as stored under @p record_id.
         */
        void commit(int64_t record_id);

        /**
         * @brief Drop the reservation; the fingerprint stays unknown.
         */
        void release();

        bool active() const noexcept { return index_ != nullptr; }

    private:
        friend class HashIndex;
        Reservation(HashIndex* index, const BLAKE3Pipeline::Hash& hash) : index_(index), hash_(hash) {}

        HashIndex* index_ = nullptr;
        BLAKE3Pipeline::Hash hash_{};
    };

    struct Decision {
        Classification kind = Classification::New;
        BLAKE3Pipeline::Hash hash{};
        int64_t existing_record_id = 0;           // Duplicate / Changed
        int64_t previous_amount = 0;              // Changed
        std::optional<BLAKE3Pipeline::Hash> previous_hash;  // Changed
        Reservation reservation;                  // active for New / Changed
    };

    explicit HashIndex(HashIndexOptions options = {});
    ~HashIndex() = default;

    HashIndex(const HashIndex&) = delete;
    HashIndex& operator=(const HashIndex&) = delete;

    /**
     * @brief Classify @p record (whose fingerprint is @p hash) and reserve its slot if new.
     */
    Decision classify(const BLAKE3Pipeline::Hash& hash, const StatementRecord& record);

    /**
     * @brief Classification without side effects (validate-only runs).
     */
    Classification peek(const BLAKE3Pipeline::Hash& hash, const StatementRecord& record) const;

    bool contains(const BLAKE3Pipeline::Hash& hash) const;
    std::optional<int64_t> record_id(const BLAKE3Pipeline::Hash& hash) const;

    /**
     * @brief Register an already-stored record (preload from storage or snapshot).
     */
    void insert(const StatementRecord& record);

    /**
     * @brief Drop a committed fingerprint (stored record was replaced or removed).
     */
    bool erase(const BLAKE3Pipeline::Hash& hash);

    HashIndexStats stats() const;

    void clear();

    /**
     * @brief Write committed entries as JSON.
     */
    void save_snapshot(const std::string& path) const;

    /**
     * @brief Replace the index contents with a snapshot.
     * @return false when @p path does not exist (index left untouched)
     */
    bool load_snapshot(const std::string& path);

    bool change_detection() const noexcept { return options_.detect_changes; }

private:
    struct Entry {
        int64_t record_id = 0;
        Timestamp last_seen_at{};
        BLAKE3Pipeline::Hash natural_key{};
        int64_t toll_amount = 0;
        bool pending = false;
    };

    void finish(const BLAKE3Pipeline::Hash& hash, std::optional<int64_t> record_id);
    void wait_not_clearing(std::unique_lock<std::mutex>& lock);
    void wait_quiescent(std::unique_lock<std::mutex>& lock);

    HashIndexOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<BLAKE3Pipeline::Hash, Entry, HashHasher> entries_;
    std::unordered_map<BLAKE3Pipeline::Hash, BLAKE3Pipeline::Hash, HashHasher> by_natural_key_;
    size_t pending_ = 0;
    bool clearing_ = false;
};

} // namespace Meisai
