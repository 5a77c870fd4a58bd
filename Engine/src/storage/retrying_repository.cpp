#include <storage/retrying_repository.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <thread>

namespace Meisai {

namespace {

bool is_transient(const MeisaiError& e) {
    return e.kind() == ErrorKind::Storage && e.context_value("sqlstate") != "23505";
}

} // namespace

RetryingStatementRepository::RetryingStatementRepository(std::shared_ptr<IStatementRepository> inner,
                                                         RetryPolicy policy)
    : inner_(std::move(inner)), policy_(policy) {
    if (!inner_) {
        throw MeisaiError(ErrorKind::Validation, "retrying repository needs an inner repository");
    }
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
}

template <typename Fn>
auto RetryingStatementRepository::attempt(const char* operation, Fn&& fn) -> decltype(fn()) {
    for (int i = 1;; ++i) {
        try {
            return fn();
        } catch (const MeisaiError& e) {
            if (!is_transient(e) || i >= policy_.max_attempts) throw;
            auto delay = policy_.base_delay * (1 << (i - 1));
            ++retries_;
            Logger::warn(std::string(operation) + " failed (attempt " + std::to_string(i) + "/" +
                         std::to_string(policy_.max_attempts) + "), retrying in " +
                         std::to_string(delay.count()) + "ms: " + e.what());
            std::this_thread::sleep_for(delay);
        }
    }
}

int64_t RetryingStatementRepository::create(StatementRecord& record) {
    return attempt("create", [&] { return inner_->create(record); });
}

std::optional<StatementRecord> RetryingStatementRepository::get(int64_t id) {
    return attempt("get", [&] { return inner_->get(id); });
}

void RetryingStatementRepository::update(const StatementRecord& record) {
    attempt("update", [&] { inner_->update(record); });
}

bool RetryingStatementRepository::remove(int64_t id) {
    return attempt("remove", [&] { return inner_->remove(id); });
}

size_t RetryingStatementRepository::bulk_insert(std::vector<StatementRecord>& records) {
    return attempt("bulk_insert", [&] { return inner_->bulk_insert(records); });
}

std::optional<StatementRecord> RetryingStatementRepository::get_by_hash(const BLAKE3Pipeline::Hash& hash) {
    return attempt("get_by_hash", [&] { return inner_->get_by_hash(hash); });
}

IStatementRepository::HashPresence RetryingStatementRepository::check_duplicates_by_hash(
    const std::vector<BLAKE3Pipeline::Hash>& hashes) {
    return attempt("check_duplicates_by_hash", [&] { return inner_->check_duplicates_by_hash(hashes); });
}

void RetryingStatementRepository::set_external_reference(int64_t id, const std::string& reference) {
    attempt("set_external_reference", [&] { inner_->set_external_reference(id, reference); });
}

void RetryingStatementRepository::with_transaction(const std::function<void(IStatementRepository&)>& fn) {
    attempt("with_transaction", [&] { inner_->with_transaction(fn); });
}

void RetryingStatementRepository::for_each(const std::function<void(const StatementRecord&)>& fn) {
    // Not retried: the visitor may already have seen part of the rows.
    inner_->for_each(fn);
}

size_t RetryingStatementRepository::count() {
    return attempt("count", [&] { return inner_->count(); });
}

} // namespace Meisai
