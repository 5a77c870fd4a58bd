/**
 * @file match_engine.hpp
 * @brief Confidence-scored matching of statement records to external entities
 */

#pragma once

#include <export.hpp>
#include <matching/mapping_record.hpp>
#include <models/statement_record.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Meisai {

/**
 * @brief A record in an external accounting system (e.g. a trip log row).
 */
struct ExternalEntity {
    std::string id;
    std::string entity_type;
    std::string date;               // YYYY-MM-DD
    std::string time;               // HH:MM
    std::string entry_point;
    std::string exit_point;
    int64_t toll_amount = 0;
    std::string vehicle_number;
};

struct ScoredMatch {
    std::string candidate_id;
    std::string entity_type;
    double confidence = 0.0;
    MatchType match_type = MatchType::Exact;
};

struct MatchConfig {
    // Time window
    int64_t time_tolerance_minutes = 30;
    double time_confidence_max = 0.98;
    double time_confidence_min = 0.90;

    // Amount tolerance; the wider of the two limits applies
    int64_t amount_tolerance = 100;
    std::optional<double> amount_tolerance_percent;
    double amount_confidence_max = 0.95;
    double amount_confidence_min = 0.50;

    // Fuzzy text
    double fuzzy_min_similarity = 0.8;
    double fuzzy_weight = 0.9;

    // Candidates scoring below this are dropped
    double acceptance_threshold = 0.5;

    /**
     * @throws MeisaiError(Validation) for inverted ranges or values outside [0,1]
     */
    void validate() const;
};

/**
 * @brief Normalized Levenshtein similarity over code points, in [0,1].
 */
double text_similarity(const std::string& a, const std::string& b);

/**
 * @brief One independent way of scoring a candidate.
 */
class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;

    virtual MatchType type() const = 0;

    /**
     * @return confidence in (0,1], or nullopt when the strategy does not apply
     */
    virtual std::optional<double> score(const StatementRecord& record, const ExternalEntity& candidate) const = 0;
};

// All compared fields identical -> 1.0
class ExactStrategy : public MatchStrategy {
public:
    MatchType type() const override { return MatchType::Exact; }
    std::optional<double> score(const StatementRecord& record, const ExternalEntity& candidate) const override;
};

// Route and amount identical, timestamps apart by at most the tolerance
class TimeWindowStrategy : public MatchStrategy {
public:
    explicit TimeWindowStrategy(const MatchConfig& config) : config_(config) {}
    MatchType type() const override { return MatchType::Time; }
    std::optional<double> score(const StatementRecord& record, const ExternalEntity& candidate) const override;

private:
    MatchConfig config_;
};

// Date, time and route identical, amount within tolerance
class AmountToleranceStrategy : public MatchStrategy {
public:
    explicit AmountToleranceStrategy(const MatchConfig& config) : config_(config) {}
    MatchType type() const override { return MatchType::Amount; }
    std::optional<double> score(const StatementRecord& record, const ExternalEntity& candidate) const override;

private:
    MatchConfig config_;
};

// Date, time and amount identical; IC names (and vehicle numbers when both
// sides carry one) similar enough
class FuzzyTextStrategy : public MatchStrategy {
public:
    explicit FuzzyTextStrategy(const MatchConfig& config) : config_(config) {}
    MatchType type() const override { return MatchType::Fuzzy; }
    std::optional<double> score(const StatementRecord& record, const ExternalEntity& candidate) const override;

private:
    MatchConfig config_;
};

/**
 * @brief Runs every strategy per candidate and keeps the best score.
 *
 * Strategies are not averaged. propose() returns every candidate at or above
 * the acceptance threshold, best first (ties by candidate id).
 */
class MEISAI_API MatchEngine {
public:
    explicit MatchEngine(MatchConfig config = {});

    /**
     * @brief Append a strategy to the defaults.
     */
    void add_strategy(std::unique_ptr<MatchStrategy> strategy);

    std::optional<ScoredMatch> score(const StatementRecord& record, const ExternalEntity& candidate) const;

    std::vector<ScoredMatch> propose(const StatementRecord& record,
                                     const std::vector<ExternalEntity>& candidates) const;

    const MatchConfig& config() const noexcept { return config_; }

private:
    MatchConfig config_;
    std::vector<std::unique_ptr<MatchStrategy>> strategies_;
};

} // namespace Meisai
