/**
 * @file session_registry.hpp
 * @brief Owns import sessions and answers session queries
 */

#pragma once

#include <ingestion/import_session.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Meisai {

struct SessionFilter {
    std::optional<AccountType> account_type;
    std::optional<std::string> account_id;
    std::optional<SessionStatus> status;
};

template <typename T>
struct Page {
    std::vector<T> items;
    size_t total = 0;       // matches across all pages
    size_t page = 1;        // 1-based
    size_t page_size = 0;

    size_t total_pages() const {
        return page_size == 0 ? 0 : (total + page_size - 1) / page_size;
    }
};

class SessionRegistry {
public:
    static constexpr size_t MAX_PAGE_SIZE = 1000;

    /**
     * @brief Validate @p info and register a new pending session.
     */
    std::shared_ptr<ImportSession> create(const SessionInfo& info);

    /**
     * @throws MeisaiError(SessionNotFound)
     */
    std::shared_ptr<ImportSession> get(const std::string& session_id) const;

    std::shared_ptr<ImportSession> find(const std::string& session_id) const;

    /**
     * @brief Matching sessions, newest first.
     * @throws MeisaiError(Validation) for page < 1 or page_size outside [1, MAX_PAGE_SIZE]
     */
    Page<SessionSummary> list(const SessionFilter& filter, size_t page, size_t page_size) const;

    size_t size() const;

private:
    std::string next_id(const SessionInfo& info);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ImportSession>> sessions_;
    std::vector<std::string> order_;        // creation order
    std::atomic<uint64_t> counter_{0};
};

} // namespace Meisai
