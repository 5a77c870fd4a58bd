/**
 * @file import_pipeline.hpp
 * @brief Drives one import session: chunks -> rows -> records -> dedup -> storage
 */

#pragma once

#include <dedup/hash_index.hpp>
#include <ingestion/chunk_reassembler.hpp>
#include <ingestion/csv_row_parser.hpp>
#include <ingestion/import_session.hpp>
#include <storage/statement_repository.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace Meisai {

struct PipelineOptions {
    SessionMismatchPolicy mismatch_policy = SessionMismatchPolicy::Reject;

    // Fraction of processed rows allowed to be errors before the session fails
    double max_error_rate = 1.0;

    // Duplicates are counted and skipped. When false, a duplicate whose
    // stored record has disappeared is stored again.
    bool skip_duplicates = true;

    // A Changed row (change detection on) overwrites the stored record
    bool update_existing = false;

    // Classify without touching the index or storage
    bool validate_only = false;

    // Emit a progress snapshot every N rows; terminal snapshots always go out
    size_t progress_every = 1;
};

struct ImportCounts {
    size_t added = 0;
    size_t updated = 0;
    size_t duplicate = 0;
    size_t error = 0;
    size_t total = 0;
};

using ProgressSink = std::function<void(const ProgressSnapshot&)>;

/**
 * @brief Sequential ingestion of one session.
 *
 * Rows are handled strictly in order and each one updates the session
 * before the next starts. Row-level problems (parse errors, storage
 * failures) are counted and skipped. Session-level problems (sequence
 * errors, a malformed header, cancellation, too many bad rows) fail the
 * session; feed() itself does not throw for them.
 *
 * Not thread-safe: one ingestor belongs to one worker.
 */
class SessionIngestor {
public:
    SessionIngestor(std::shared_ptr<ImportSession> session,
                    HashIndex& index,
                    IStatementRepository& repository,
                    PipelineOptions options = {},
                    ProgressSink sink = {});

    /**
     * @brief Consume one streamed chunk. The last chunk completes the session.
     */
    void feed(const Chunk& chunk);

    /**
     * @brief Whole-file import: the total is confirmed before the first row.
     */
    void import_content(const std::string& content);

    /**
     * @brief Fail the session (stream closed early, caller timeout).
     */
    void abort(const std::string& reason);

    bool done() const { return session_->is_terminal(); }

    const ImportCounts& counts() const noexcept { return counts_; }

    ImportSession& session() noexcept { return *session_; }

private:
    void process_rows(std::vector<std::string> rows, bool last);
    void process_row(const std::string& row, size_t row_number);
    void classify_and_store(StatementRecord& record);
    void persist_new(StatementRecord& record, HashIndex::Reservation& reservation);
    void restore_missing(StatementRecord& record);
    void finish();
    void fail(const std::string& reason);
    bool check_cancel();
    void emit(bool force);

    std::shared_ptr<ImportSession> session_;
    HashIndex& index_;
    IStatementRepository& repository_;
    PipelineOptions options_;
    ProgressSink sink_;

    ChunkReassembler reassembler_;
    CsvRowParser parser_;
    bool header_checked_ = false;
    size_t row_number_ = 0;
    ImportCounts counts_;

    // validate_only runs
    std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> validated_hashes_;
    std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> validated_keys_;
};

} // namespace Meisai
