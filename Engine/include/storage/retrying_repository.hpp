/**
 * @file retrying_repository.hpp
 * @brief Statement repository decorator that retries transient storage failures
 */

#pragma once

#include <storage/statement_repository.hpp>
#include <atomic>
#include <chrono>
#include <memory>

namespace Meisai {

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{20};   // doubled per attempt
};

/**
 * @brief Retries MeisaiError(Storage) with exponential backoff.
 *
 * Unique violations are deterministic and rethrown immediately, as are all
 * other error kinds. Calls made inside with_transaction() go straight to the
 * inner repository; the transaction as a whole is retried instead.
 */
class RetryingStatementRepository : public IStatementRepository {
public:
    RetryingStatementRepository(std::shared_ptr<IStatementRepository> inner, RetryPolicy policy = {});

    int64_t create(StatementRecord& record) override;
    std::optional<StatementRecord> get(int64_t id) override;
    void update(const StatementRecord& record) override;
    bool remove(int64_t id) override;
    size_t bulk_insert(std::vector<StatementRecord>& records) override;
    std::optional<StatementRecord> get_by_hash(const BLAKE3Pipeline::Hash& hash) override;
    HashPresence check_duplicates_by_hash(const std::vector<BLAKE3Pipeline::Hash>& hashes) override;
    void set_external_reference(int64_t id, const std::string& reference) override;
    void with_transaction(const std::function<void(IStatementRepository&)>& fn) override;
    void for_each(const std::function<void(const StatementRecord&)>& fn) override;
    size_t count() override;

    size_t retries() const noexcept { return retries_; }

private:
    template <typename Fn>
    auto attempt(const char* operation, Fn&& fn) -> decltype(fn());

    std::shared_ptr<IStatementRepository> inner_;
    RetryPolicy policy_;
    std::atomic<size_t> retries_{0};
};

} // namespace Meisai
