/**
 * @file import_service.cpp
 * @brief Worker pool and stream plumbing for import sessions
 */

#include <ingestion/import_service.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Meisai {

// ============================================================================
// StreamHandle
// ============================================================================

bool StreamHandle::send(Chunk chunk) {
    if (state_->session->cancel_requested() || state_->session->is_terminal()) return false;
    return state_->chunks.push(std::move(chunk));
}

void StreamHandle::cancel() {
    state_->session->request_cancel();
    state_->chunks.close();
    state_->progress.wake_producers();
}

// ============================================================================
// ImportService
// ============================================================================

ImportService::ImportService(HashIndex& index, std::shared_ptr<IStatementRepository> repository, ServiceOptions options)
    : index_(index), repository_(std::move(repository)), options_(options) {
    if (!repository_) {
        throw MeisaiError(ErrorKind::Validation, "import service needs a statement repository");
    }
    size_t n = options_.workers == 0 ? 1 : options_.workers;
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i)
        workers_.emplace_back(&ImportService::worker, this);
}

ImportService::~ImportService() {
    // Streams still waiting for chunks would keep their worker forever.
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& [id, weak] : streams_) {
            if (auto state = weak.lock()) {
                state->session->request_cancel();
                state->chunks.close();
                state->progress.close();
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

void ImportService::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return queue_.size() < options_.task_queue_capacity || stop_; });
        if (stop_) {
            throw MeisaiError(ErrorKind::SessionFailure, "import service is shutting down");
        }
        queue_.push(std::move(task));
    }
    cv_.notify_all();
}

void ImportService::worker() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
            if (stop_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop();
            busy_++;
        }
        cv_.notify_all();

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Import worker task failed: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_--;
        }
        cv_.notify_all();
    }
}

void ImportService::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

SessionSummary ImportService::import_file(const SessionInfo& info, const std::string& content) {
    auto session = registry_.create(info);
    SessionIngestor ingestor(session, index_, *repository_, options_.pipeline);
    ingestor.import_content(content);
    return session->summary();
}

std::string ImportService::submit_file(const SessionInfo& info, std::string content) {
    auto session = registry_.create(info);
    enqueue([this, session, content = std::move(content)] {
        SessionIngestor ingestor(session, index_, *repository_, options_.pipeline);
        try {
            ingestor.import_content(content);
        } catch (const std::exception& e) {
            ingestor.abort(e.what());
        }
    });
    return session->id();
}

std::shared_ptr<StreamHandle> ImportService::open_stream(const SessionInfo& info, size_t estimated_rows) {
    auto session = registry_.create(info);
    if (estimated_rows) session->set_estimated_total(estimated_rows);

    auto state = std::make_shared<detail::StreamState>(session, options_.chunk_queue_capacity,
                                                       options_.progress_queue_capacity);
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_[session->id()] = state;
    }
    enqueue([this, state] { run_stream(state); });
    return std::make_shared<StreamHandle>(state);
}

void ImportService::run_stream(const std::shared_ptr<detail::StreamState>& state) {
    auto& session = state->session;
    // Blocks while the progress queue is full until cancelled. After a cancel,
    // intermediate snapshots are dropped and the terminal one displaces the oldest.
    auto sink = [state](const ProgressSnapshot& p) {
        auto cancelled = [&state] { return state->session->cancel_requested(); };
        if (state->progress.push(p, cancelled)) return;
        if (p.status == SessionStatus::Completed || p.status == SessionStatus::Failed) {
            state->progress.push_latest(p);
        }
    };
    SessionIngestor ingestor(session, index_, *repository_, options_.pipeline, sink);
    try {
        Chunk chunk;
        while (!ingestor.done() && state->chunks.pop(chunk)) {
            ingestor.feed(chunk);
        }
        if (!ingestor.done()) {
            ingestor.abort(session->cancel_requested() ? "cancelled" : "stream ended before final chunk");
        }
    } catch (const std::exception& e) {
        ingestor.abort(e.what());
    }

    state->chunks.close();
    state->progress.close();
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.erase(session->id());
    }
}

SessionSummary ImportService::get_session(const std::string& session_id) const {
    return registry_.get(session_id)->summary();
}

Page<SessionSummary> ImportService::list_sessions(const SessionFilter& filter, size_t page, size_t page_size) const {
    return registry_.list(filter, page, page_size);
}

bool ImportService::cancel_session(const std::string& session_id) {
    auto session = registry_.get(session_id);
    if (!session->request_cancel()) return false;

    std::shared_ptr<detail::StreamState> state;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(session_id);
        if (it != streams_.end()) state = it->second.lock();
    }
    if (state) {
        state->chunks.close();
        state->progress.wake_producers();
    }

    Logger::warn("Cancel requested for import session " + session_id);
    return true;
}

HashImportResult ImportService::hash_import(const std::string& path, const HashImportOptions& options) {
    HashImporter importer(index_, *repository_);
    return importer.import_csv(path, options);
}

} // namespace Meisai
