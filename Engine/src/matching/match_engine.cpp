#include <matching/match_engine.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace Meisai {

namespace {

bool same_route(const StatementRecord& r, const ExternalEntity& c) {
    return normalize_text(r.entry_point) == normalize_text(c.entry_point) &&
           normalize_text(r.exit_point) == normalize_text(c.exit_point);
}

// max at distance 0, min at distance == limit
double decay(double max, double min, double distance, double limit) {
    if (limit <= 0.0) return max;
    return max - (max - min) * (distance / limit);
}

std::optional<int64_t> minutes_apart(const StatementRecord& r, const ExternalEntity& c) {
    auto a = r.epoch_minutes();
    auto b = epoch_minutes(c.date, c.time);
    if (!a || !b) return std::nullopt;
    return std::llabs(*a - *b);
}

void require_unit(double v, const char* field) {
    if (v < 0.0 || v > 1.0) {
        throw MeisaiError(ErrorKind::Validation, std::string(field) + " must be within [0, 1]", {{"field", field}});
    }
}

} // namespace

void MatchConfig::validate() const {
    require_unit(time_confidence_max, "time_confidence_max");
    require_unit(time_confidence_min, "time_confidence_min");
    require_unit(amount_confidence_max, "amount_confidence_max");
    require_unit(amount_confidence_min, "amount_confidence_min");
    require_unit(fuzzy_min_similarity, "fuzzy_min_similarity");
    require_unit(fuzzy_weight, "fuzzy_weight");
    require_unit(acceptance_threshold, "acceptance_threshold");
    if (time_confidence_min > time_confidence_max) {
        throw MeisaiError(ErrorKind::Validation, "time confidence range is inverted", {{"field", "time_confidence_min"}});
    }
    if (amount_confidence_min > amount_confidence_max) {
        throw MeisaiError(ErrorKind::Validation, "amount confidence range is inverted", {{"field", "amount_confidence_min"}});
    }
    if (time_tolerance_minutes < 0 || amount_tolerance < 0 ||
        (amount_tolerance_percent && *amount_tolerance_percent < 0.0)) {
        throw MeisaiError(ErrorKind::Validation, "tolerances must be non-negative", {{"field", "tolerance"}});
    }
}

double text_similarity(const std::string& a, const std::string& b) {
    std::u32string s = utf8_to_utf32(normalize_text(a));
    std::u32string t = utf8_to_utf32(normalize_text(b));
    if (s.empty() && t.empty()) return 1.0;
    size_t longest = std::max(s.size(), t.size());

    // Two-row Levenshtein
    std::vector<size_t> prev(t.size() + 1), cur(t.size() + 1);
    for (size_t j = 0; j <= t.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= s.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= t.size(); ++j) {
            size_t cost = (s[i - 1] == t[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return 1.0 - static_cast<double>(prev[t.size()]) / static_cast<double>(longest);
}

std::optional<double> ExactStrategy::score(const StatementRecord& r, const ExternalEntity& c) const {
    if (r.date == c.date && r.time == c.time && r.toll_amount == c.toll_amount && same_route(r, c)) {
        return 1.0;
    }
    return std::nullopt;
}

std::optional<double> TimeWindowStrategy::score(const StatementRecord& r, const ExternalEntity& c) const {
    if (r.toll_amount != c.toll_amount || !same_route(r, c)) return std::nullopt;
    auto delta = minutes_apart(r, c);
    if (!delta || *delta > config_.time_tolerance_minutes) return std::nullopt;
    return decay(config_.time_confidence_max, config_.time_confidence_min,
                 static_cast<double>(*delta), static_cast<double>(config_.time_tolerance_minutes));
}

std::optional<double> AmountToleranceStrategy::score(const StatementRecord& r, const ExternalEntity& c) const {
    if (r.date != c.date || r.time != c.time || !same_route(r, c)) return std::nullopt;

    // Candidate amounts are caller-supplied; the int64 difference may not fit
    double delta = std::fabs(static_cast<double>(r.toll_amount) - static_cast<double>(c.toll_amount));
    double limit = static_cast<double>(config_.amount_tolerance);
    if (config_.amount_tolerance_percent) {
        double base = static_cast<double>(std::max(r.toll_amount, c.toll_amount));
        limit = std::max(limit, base * *config_.amount_tolerance_percent / 100.0);
    }
    if (delta > limit) return std::nullopt;
    return decay(config_.amount_confidence_max, config_.amount_confidence_min, delta, limit);
}

std::optional<double> FuzzyTextStrategy::score(const StatementRecord& r, const ExternalEntity& c) const {
    if (r.date != c.date || r.time != c.time || r.toll_amount != c.toll_amount) return std::nullopt;

    double total = text_similarity(r.entry_point, c.entry_point) + text_similarity(r.exit_point, c.exit_point);
    int fields = 2;
    if (!r.vehicle_number.empty() && !c.vehicle_number.empty()) {
        total += text_similarity(r.vehicle_number, c.vehicle_number);
        ++fields;
    }
    double similarity = total / fields;
    if (similarity < config_.fuzzy_min_similarity) return std::nullopt;
    return similarity * config_.fuzzy_weight;
}

MatchEngine::MatchEngine(MatchConfig config) : config_(std::move(config)) {
    config_.validate();
    strategies_.push_back(std::make_unique<ExactStrategy>());
    strategies_.push_back(std::make_unique<TimeWindowStrategy>(config_));
    strategies_.push_back(std::make_unique<AmountToleranceStrategy>(config_));
    strategies_.push_back(std::make_unique<FuzzyTextStrategy>(config_));
}

void MatchEngine::add_strategy(std::unique_ptr<MatchStrategy> strategy) {
    if (!strategy) {
        throw MeisaiError(ErrorKind::Validation, "null match strategy");
    }
    strategies_.push_back(std::move(strategy));
}

std::optional<ScoredMatch> MatchEngine::score(const StatementRecord& record, const ExternalEntity& candidate) const {
    std::optional<ScoredMatch> best;
    for (const auto& strategy : strategies_) {
        auto s = strategy->score(record, candidate);
        if (!s || *s <= 0.0) continue;
        double confidence = std::min(*s, 1.0);
        // Earlier strategies win ties
        if (!best || confidence > best->confidence) {
            best = ScoredMatch{candidate.id, candidate.entity_type, confidence, strategy->type()};
        }
    }
    return best;
}

std::vector<ScoredMatch> MatchEngine::propose(const StatementRecord& record,
                                              const std::vector<ExternalEntity>& candidates) const {
    std::vector<ScoredMatch> out;
    for (const auto& c : candidates) {
        auto m = score(record, c);
        if (m && m->confidence >= config_.acceptance_threshold) {
            out.push_back(std::move(*m));
        }
    }
    std::sort(out.begin(), out.end(), [](const ScoredMatch& a, const ScoredMatch& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.candidate_id < b.candidate_id;
    });
    return out;
}

} // namespace Meisai
