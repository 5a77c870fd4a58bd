#include <ingestion/session_registry.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <storage/format_utils.hpp>
#include <utils/logger.hpp>

namespace Meisai {

std::string SessionRegistry::next_id(const SessionInfo& info) {
    // Unique per process: the counter never repeats, the clock separates processes.
    auto digest = BLAKE3Pipeline::FieldHasher("meisai 2024-04 import session id")
                      .field(info.account_id)
                      .field(info.file_name)
                      .field(static_cast<int64_t>(WallClock::now().time_since_epoch().count()))
                      .field(static_cast<int64_t>(++counter_))
                      .finish();
    return hash_to_uuid(digest);
}

std::shared_ptr<ImportSession> SessionRegistry::create(const SessionInfo& info) {
    info.validate();

    auto session = std::make_shared<ImportSession>(next_id(info), info);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(session->id(), session);
        order_.push_back(session->id());
    }
    Logger::info("Import session " + session->id() + " created (" + to_string(info.account_type) + "/" +
                 info.account_id + ", " + info.file_name + ")");
    return session;
}

std::shared_ptr<ImportSession> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<ImportSession> SessionRegistry::get(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        throw MeisaiError(ErrorKind::SessionNotFound, "import session not found", {{"session_id", session_id}});
    }
    return session;
}

Page<SessionSummary> SessionRegistry::list(const SessionFilter& filter, size_t page, size_t page_size) const {
    if (page < 1) {
        throw MeisaiError(ErrorKind::Validation, "page must be at least 1", {{"field", "page"}});
    }
    if (page_size < 1 || page_size > MAX_PAGE_SIZE) {
        throw MeisaiError(ErrorKind::Validation, "page size must be between 1 and 1000", {{"field", "page_size"}});
    }

    std::vector<std::shared_ptr<ImportSession>> newest_first;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        newest_first.reserve(order_.size());
        for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
            newest_first.push_back(sessions_.at(*it));
        }
    }

    Page<SessionSummary> out;
    out.page = page;
    out.page_size = page_size;
    const size_t first = (page - 1) * page_size;

    for (const auto& session : newest_first) {
        SessionSummary s = session->summary();
        if (filter.account_type && s.info.account_type != *filter.account_type) continue;
        if (filter.account_id && s.info.account_id != *filter.account_id) continue;
        if (filter.status && s.status != *filter.status) continue;

        if (out.total >= first && out.items.size() < page_size) {
            out.items.push_back(std::move(s));
        }
        ++out.total;
    }
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace Meisai
