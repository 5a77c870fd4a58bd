/**
 * @file import_session.hpp
 * @brief Lifecycle and counters of one import operation
 */

#pragma once

#include <utils/time.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Meisai {

enum class SessionStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

enum class AccountType {
    Corporate,
    Personal
};

const char* to_string(SessionStatus status);
const char* to_string(AccountType type);
std::optional<SessionStatus> parse_session_status(const std::string& text);
std::optional<AccountType> parse_account_type(const std::string& text);

struct ImportRowError {
    size_t row_number = 0;
    std::string error_type;
    std::string message;
};

/**
 * @brief Who imports what. Validated when a session is registered.
 */
struct SessionInfo {
    AccountType account_type = AccountType::Corporate;
    std::string account_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::string created_by;

    /**
     * @throws MeisaiError(Validation)
     */
    void validate() const;
};

struct ProgressSnapshot {
    std::string session_id;
    SessionStatus status = SessionStatus::Pending;
    size_t processed_rows = 0;
    size_t total_rows = 0;
    size_t success_rows = 0;
    size_t error_rows = 0;
    size_t duplicate_rows = 0;
    double progress_percentage = 0.0;
};

struct SessionSummary {
    std::string session_id;
    SessionInfo info;
    SessionStatus status = SessionStatus::Pending;
    size_t total_rows = 0;
    bool total_confirmed = false;
    size_t processed_rows = 0;
    size_t success_rows = 0;
    size_t error_rows = 0;
    size_t duplicate_rows = 0;
    size_t updated_rows = 0;        // subset of success_rows
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::string failure_reason;
    std::vector<ImportRowError> errors;
};

/**
 * @brief Session state machine: pending -> processing -> completed | failed.
 *
 * Every mutation holds the session mutex, so each observation satisfies
 * success + error + duplicate == processed, and processed <= total once the
 * total is confirmed. Exactly one terminal transition is accepted; row
 * updates after it throw MeisaiError(SessionFailure).
 */
class ImportSession {
public:
    static constexpr size_t MAX_LOGGED_ERRORS = 100;

    ImportSession(std::string id, SessionInfo info);

    const std::string& id() const noexcept { return id_; }

    /**
     * @brief Fix the total row count. Throws if rows already exceed it.
     */
    void confirm_total(size_t total);

    /**
     * @brief Client-provided row estimate for progress before the total is known.
     */
    void set_estimated_total(size_t estimate);

    /**
     * @brief pending -> processing. No-op if already processing.
     */
    void start_processing();

    void record_success(bool updated = false);
    void record_duplicate();
    void record_error(size_t row_number, const std::string& error_type, const std::string& message);

    /**
     * @return false if the session had already reached a terminal state
     */
    bool complete();
    bool fail(const std::string& reason);

    SessionStatus status() const;
    bool is_terminal() const;

    /**
     * @brief Raise the cancel signal. The row in flight finishes; no further
     * rows start and the ingesting worker fails the session.
     * @return false if the session had already reached a terminal state
     */
    bool request_cancel();
    bool cancel_requested() const noexcept { return cancel_requested_.load(); }

    SessionSummary summary() const;
    ProgressSnapshot progress() const;

private:
    void begin_row();                              // caller holds mutex_
    ProgressSnapshot progress_locked() const;      // caller holds mutex_

    const std::string id_;
    const SessionInfo info_;
    const Timestamp created_at_;
    std::atomic<bool> cancel_requested_{false};

    mutable std::mutex mutex_;
    SessionStatus status_ = SessionStatus::Pending;
    std::optional<size_t> confirmed_total_;
    size_t estimated_total_ = 0;
    size_t processed_ = 0;
    size_t success_ = 0;
    size_t errors_ = 0;
    size_t duplicates_ = 0;
    size_t updated_ = 0;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> completed_at_;
    std::string failure_reason_;
    std::vector<ImportRowError> error_log_;
};

} // namespace Meisai
