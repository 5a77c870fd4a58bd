/**
 * @file import_session.cpp
 * @brief ImportSession state machine
 */

#include <ingestion/import_session.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace Meisai {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending:    return "pending";
        case SessionStatus::Processing: return "processing";
        case SessionStatus::Completed:  return "completed";
        case SessionStatus::Failed:     return "failed";
    }
    return "unknown";
}

const char* to_string(AccountType type) {
    switch (type) {
        case AccountType::Corporate: return "corporate";
        case AccountType::Personal:  return "personal";
    }
    return "unknown";
}

std::optional<SessionStatus> parse_session_status(const std::string& text) {
    for (auto s : {SessionStatus::Pending, SessionStatus::Processing, SessionStatus::Completed, SessionStatus::Failed}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

std::optional<AccountType> parse_account_type(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "corporate") return AccountType::Corporate;
    if (lower == "personal") return AccountType::Personal;
    return std::nullopt;
}

void SessionInfo::validate() const {
    if (account_id.empty()) {
        throw MeisaiError(ErrorKind::Validation, "account id cannot be empty", {{"field", "account_id"}});
    }
    if (account_id.size() > 50) {
        throw MeisaiError(ErrorKind::Validation, "account id too long (max 50 characters)", {{"field", "account_id"}});
    }
    for (char c : account_id) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '@' || c == '.';
        if (!ok) {
            throw MeisaiError(ErrorKind::Validation, "account id contains invalid characters", {{"field", "account_id"}});
        }
    }
    if (file_name.empty()) {
        throw MeisaiError(ErrorKind::Validation, "file name cannot be empty", {{"field", "file_name"}});
    }
    if (file_name.size() > 255) {
        throw MeisaiError(ErrorKind::Validation, "file name too long (max 255 characters)", {{"field", "file_name"}});
    }
    if (created_by.size() > 100) {
        throw MeisaiError(ErrorKind::Validation, "created_by too long (max 100 characters)", {{"field", "created_by"}});
    }
}

ImportSession::ImportSession(std::string id, SessionInfo info)
    : id_(std::move(id)), info_(std::move(info)), created_at_(now()) {}

void ImportSession::confirm_total(size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (processed_ > total) {
        throw MeisaiError(ErrorKind::SessionFailure, "confirmed total is below processed rows",
                          {{"session_id", id_}, {"total", std::to_string(total)},
                           {"processed", std::to_string(processed_)}});
    }
    confirmed_total_ = total;
}

void ImportSession::set_estimated_total(size_t estimate) {
    std::lock_guard<std::mutex> lock(mutex_);
    estimated_total_ = estimate;
}

void ImportSession::start_processing() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == SessionStatus::Pending) {
        status_ = SessionStatus::Processing;
        started_at_ = now();
    }
}

void ImportSession::begin_row() {
    if (status_ == SessionStatus::Completed || status_ == SessionStatus::Failed) {
        throw MeisaiError(ErrorKind::SessionFailure, "session already finished", {{"session_id", id_}});
    }
    if (confirmed_total_ && processed_ + 1 > *confirmed_total_) {
        throw MeisaiError(ErrorKind::SessionFailure, "row beyond confirmed total",
                          {{"session_id", id_}, {"total", std::to_string(*confirmed_total_)}});
    }
    if (status_ == SessionStatus::Pending) {
        status_ = SessionStatus::Processing;
        started_at_ = now();
    }
    ++processed_;
}

void ImportSession::record_success(bool updated) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_row();
    ++success_;
    if (updated) ++updated_;
}

void ImportSession::record_duplicate() {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_row();
    ++duplicates_;
}

void ImportSession::record_error(size_t row_number, const std::string& error_type, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_row();
    ++errors_;
    if (error_log_.size() < MAX_LOGGED_ERRORS) {
        error_log_.push_back({row_number, error_type, message});
    }
}

bool ImportSession::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == SessionStatus::Completed || status_ == SessionStatus::Failed) return false;
    status_ = SessionStatus::Completed;
    if (!started_at_) started_at_ = now();
    completed_at_ = now();
    if (!confirmed_total_) confirmed_total_ = processed_;
    return true;
}

bool ImportSession::fail(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == SessionStatus::Completed || status_ == SessionStatus::Failed) return false;
    status_ = SessionStatus::Failed;
    completed_at_ = now();
    failure_reason_ = reason;
    return true;
}

SessionStatus ImportSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool ImportSession::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == SessionStatus::Completed || status_ == SessionStatus::Failed;
}

bool ImportSession::request_cancel() {
    if (is_terminal()) return false;
    cancel_requested_.store(true);
    return true;
}

SessionSummary ImportSession::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSummary s;
    s.session_id = id_;
    s.info = info_;
    s.status = status_;
    s.total_confirmed = confirmed_total_.has_value();
    s.total_rows = confirmed_total_ ? *confirmed_total_ : std::max(estimated_total_, processed_);
    s.processed_rows = processed_;
    s.success_rows = success_;
    s.error_rows = errors_;
    s.duplicate_rows = duplicates_;
    s.updated_rows = updated_;
    s.created_at = created_at_;
    s.started_at = started_at_;
    s.completed_at = completed_at_;
    s.failure_reason = failure_reason_;
    s.errors = error_log_;
    return s;
}

ProgressSnapshot ImportSession::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_locked();
}

ProgressSnapshot ImportSession::progress_locked() const {
    ProgressSnapshot p;
    p.session_id = id_;
    p.status = status_;
    p.processed_rows = processed_;
    p.success_rows = success_;
    p.error_rows = errors_;
    p.duplicate_rows = duplicates_;

    if (confirmed_total_) {
        p.total_rows = *confirmed_total_;
        p.progress_percentage = (*confirmed_total_ == 0)
            ? (status_ == SessionStatus::Completed ? 100.0 : 0.0)
            : 100.0 * static_cast<double>(processed_) / static_cast<double>(*confirmed_total_);
    } else {
        // Unconfirmed totals never report completion.
        p.total_rows = std::max(estimated_total_, processed_);
        p.progress_percentage = (p.total_rows == 0)
            ? 0.0
            : std::min(99.0, 100.0 * static_cast<double>(processed_) / static_cast<double>(p.total_rows));
    }
    return p;
}

} // namespace Meisai
