/**
 * @file import_service.hpp
 * @brief Concurrent import sessions on a worker pool
 */

#pragma once

#include <export.hpp>
#include <dedup/hash_index.hpp>
#include <ingestion/hash_importer.hpp>
#include <ingestion/import_pipeline.hpp>
#include <ingestion/session_registry.hpp>
#include <utils/bounded_queue.hpp>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Meisai {

struct ServiceOptions {
    size_t workers = 4;
    size_t task_queue_capacity = 16;        // queued sessions before submit blocks
    size_t chunk_queue_capacity = 64;       // per stream
    size_t progress_queue_capacity = 256;   // per stream
    PipelineOptions pipeline;
};

namespace detail {

struct StreamState {
    StreamState(std::shared_ptr<ImportSession> s, size_t chunk_capacity, size_t progress_capacity)
        : session(std::move(s)), chunks(chunk_capacity), progress(progress_capacity) {}

    std::shared_ptr<ImportSession> session;
    BoundedQueue<Chunk> chunks;
    BoundedQueue<ProgressSnapshot> progress;
};

} // namespace detail

/**
 * @brief Client side of one streamed upload.
 *
 * send() blocks while the chunk queue is full. The worker blocks on the
 * progress queue while it is full; close_progress() (consumer gone) unblocks
 * it and drops every later snapshot. cancel() also unblocks it: snapshots are
 * then dropped while the queue is full, and the terminal snapshot replaces the
 * oldest queued one. Unless progress was closed, the terminal snapshot is
 * delivered before next_progress() reports the end of the stream.
 */
class StreamHandle {
public:
    explicit StreamHandle(std::shared_ptr<detail::StreamState> state) : state_(std::move(state)) {}

    const std::string& session_id() const { return state_->session->id(); }

    /**
     * @return false once the stream no longer accepts chunks
     */
    bool send(Chunk chunk);

    /**
     * @brief No more chunks will be sent. Without a final chunk the session fails.
     */
    void finish_sending() { state_->chunks.close(); }

    /**
     * @brief Next progress snapshot; blocks. False when the stream is over.
     */
    bool next_progress(ProgressSnapshot& out) { return state_->progress.pop(out); }

    void close_progress() { state_->progress.close(); }

    void cancel();

private:
    std::shared_ptr<detail::StreamState> state_;
};

/**
 * @brief Owns the session registry and runs each session on one pool worker.
 *
 * Sessions proceed concurrently and share the HashIndex; rows within a
 * session are processed in order.
 */
class MEISAI_API ImportService {
public:
    ImportService(HashIndex& index, std::shared_ptr<IStatementRepository> repository, ServiceOptions options = {});
    ~ImportService();

    ImportService(const ImportService&) = delete;
    ImportService& operator=(const ImportService&) = delete;

    /**
     * @brief Whole-file import on the calling thread. Always returns a summary.
     */
    SessionSummary import_file(const SessionInfo& info, const std::string& content);

    /**
     * @brief Whole-file import on the pool. Poll get_session() for the outcome.
     */
    std::string submit_file(const SessionInfo& info, std::string content);

    /**
     * @brief Register a streamed session and schedule its worker.
     */
    std::shared_ptr<StreamHandle> open_stream(const SessionInfo& info, size_t estimated_rows = 0);

    /**
     * @throws MeisaiError(SessionNotFound)
     */
    SessionSummary get_session(const std::string& session_id) const;

    Page<SessionSummary> list_sessions(const SessionFilter& filter, size_t page, size_t page_size) const;

    /**
     * @return false when the session had already finished
     * @throws MeisaiError(SessionNotFound)
     */
    bool cancel_session(const std::string& session_id);

    /**
     * @brief Block until every scheduled session has finished.
     */
    void wait_idle();

    HashImportResult hash_import(const std::string& path, const HashImportOptions& options = {});
    HashIndexStats hash_stats() const { return index_.stats(); }
    void clear_hash_index() { index_.clear(); }

    const SessionRegistry& registry() const noexcept { return registry_; }

private:
    void enqueue(std::function<void()> task);
    void worker();
    void run_stream(const std::shared_ptr<detail::StreamState>& state);

    HashIndex& index_;
    std::shared_ptr<IStatementRepository> repository_;
    ServiceOptions options_;
    SessionRegistry registry_;

    std::mutex streams_mutex_;
    std::unordered_map<std::string, std::weak_ptr<detail::StreamState>> streams_;

    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    bool stop_ = false;
    size_t busy_ = 0;
};

} // namespace Meisai
