#pragma once

#include "scoring/backtest_cache_record.hpp"
#include "scoring/score_math.hpp"
#include "scoring/settings_lookup.hpp"
#include "scoring/template_score_settings.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class BacktestScope { TRAINING, VALIDATION };

// Anything other than "validation" is scored as training.
inline BacktestScope parse_backtest_scope(const std::string& s) {
    return s == "validation" ? BacktestScope::VALIDATION : BacktestScope::TRAINING;
}

struct StrategyPerformance {
    std::optional<double> cagr;
    std::optional<double> max_drawdown_percent;  // 0-100
    std::optional<double> total_trades;
    std::optional<double> sharpe_ratio;
    std::optional<double> calmar_ratio;
};

struct TemplateScoreSnapshot {
    std::string template_id;
    std::string strategy_id;
    int period_months = 0;
    std::optional<int> period_days;
    BacktestScope scope = BacktestScope::TRAINING;
    std::optional<StrategyPerformance> performance;
    std::optional<int64_t> created_at_ms;  // Unix epoch, milliseconds
};

struct TemplateVerificationMetrics {
    std::optional<double> verify_sharpe_ratio;
    std::optional<double> verify_calmar_ratio;
    std::optional<double> verify_cagr;
    std::optional<double> verify_max_drawdown_ratio;
};

// Verify columns of a cache record, as used for a template's best parameter
// set.
inline TemplateVerificationMetrics verification_from_record(const BacktestCacheRecord& record) {
    TemplateVerificationMetrics m;
    m.verify_sharpe_ratio = record.verify_sharpe_ratio;
    m.verify_calmar_ratio = record.verify_calmar_ratio;
    m.verify_cagr = record.verify_cagr;
    m.verify_max_drawdown_ratio = record.verify_max_drawdown_ratio;
    return m;
}

struct TemplateScorePeriod {
    int period_months = 0;
    std::optional<int> period_days;
    std::optional<int64_t> created_at_ms;
    double training_cagr = 0.0;
    double validation_cagr = 0.0;
    double validation_drawdown = 0.0;
    double trades_per_year = 0.0;
    double return_score = 0.0;
    double consistency_score = 0.0;
    double risk_score = 0.0;
    double liquidity_score = 0.0;
    double period_score01 = 0.0;
    double length_weight = 0.0;
    double recency_weight = 0.0;
    double weight = 0.0;
};

struct TemplateComponentAverages {
    double return_score = 0.0;
    double consistency_score = 0.0;
    double risk_score = 0.0;
    double liquidity_score = 0.0;
};

struct TemplateWeightSummary {
    double total_weight = 0.0;
    int period_count = 0;
    double length_weight_avg = 0.0;
    double recency_weight_avg = 0.0;
};

struct TemplateScoreBreakdown {
    std::string template_id;
    std::string strategy_id;
    double base_score01 = 0.0;
    double final_score01 = 0.0;
    int base_score100 = 0;
    int final_score100 = 0;
    TemplateComponentAverages component_averages;
    TemplateWeightSummary weights;
    std::vector<TemplateScorePeriod> periods;
    std::optional<double> verification_multiplier;
};

struct TemplateScoreResults {
    std::map<std::string, double> scores;
    std::map<std::string, TemplateScoreBreakdown> breakdowns;
};

struct TemplateScoreOptions {
    std::map<std::string, TemplateVerificationMetrics> verification_by_template;
    const SettingsLookup* settings_lookup = nullptr;
    TemplateScoreOverrides overrides;
    // Reference time for recency weighting; system clock when unset.
    std::optional<int64_t> now_ms;
};

// ---------------------------------------------------------------------------
// Per-period component scores
// ---------------------------------------------------------------------------
namespace template_scoring {

constexpr double CONSISTENCY_EPSILON = 1e-6;
constexpr double MS_PER_DAY = 1000.0 * 60.0 * 60.0 * 24.0;
constexpr double DAYS_PER_YEAR = 365.25;
constexpr double RECENCY_FLOOR = 0.6;

inline double score_return(double validation_cagr, const TemplateScoreSettings& cfg) {
    if (!std::isfinite(validation_cagr) || validation_cagr < 0.0) return 0.0;
    return score_math::saturate(validation_cagr, cfg.return_scale);
}

// Penalizes validation falling short of training, never the reverse.
inline double score_consistency(double training_cagr, double validation_cagr) {
    double denom = std::abs(training_cagr) + std::abs(validation_cagr);
    if (denom <= CONSISTENCY_EPSILON) return 1.0;
    double shortfall = std::max(0.0, training_cagr - validation_cagr);
    return score_math::clamp01(1.0 - score_math::clamp01(shortfall / denom));
}

inline double score_risk(double validation_drawdown, const TemplateScoreSettings& cfg) {
    return score_math::drawdown_survival(cfg.drawdown_lambda, validation_drawdown);
}

inline double score_liquidity(double trades_per_year, const TemplateScoreSettings& cfg) {
    double confidence = score_math::saturate(trades_per_year, cfg.trade_target);
    return (1.0 - cfg.trade_weight) + cfg.trade_weight * confidence;
}

// Applied on top of score_return already being 0 for losing periods.
inline double negative_validation_penalty(double validation_cagr,
                                          const TemplateScoreSettings& cfg) {
    if (!std::isfinite(validation_cagr) || validation_cagr >= 0.0) return 1.0;
    return std::exp(-cfg.validation_negative_penalty_strength * std::abs(validation_cagr));
}

inline std::optional<double> trades_per_year(double total_trades, int period_months,
                                             std::optional<int> period_days) {
    if (!std::isfinite(total_trades) || total_trades <= 0.0) return std::nullopt;
    double years = 0.0;
    if (period_months > 0) {
        years = static_cast<double>(period_months) / 12.0;
    } else if (period_days && *period_days > 0) {
        years = static_cast<double>(*period_days) / DAYS_PER_YEAR;
    }
    if (!(years > 0.0)) return std::nullopt;
    return total_trades / years;
}

inline double recency_weight(std::optional<int64_t> created_at_ms, int64_t now_ms,
                             const TemplateScoreSettings& cfg) {
    if (!created_at_ms) return 1.0;
    double age_days = std::max(0.0, static_cast<double>(now_ms - *created_at_ms) / MS_PER_DAY);
    double half_life = std::max(score_math::MIN_SCALE, cfg.recency_half_life_days);
    double decay = std::exp(-std::log(2.0) * age_days / half_life);
    return RECENCY_FLOOR + (1.0 - RECENCY_FLOOR) * decay;
}

inline std::optional<double> score_positive_metric(std::optional<double> value, double scale) {
    value = score_math::finite_or_null(value);
    if (!value) return std::nullopt;
    double v = std::max(0.0, *value);
    if (v <= 0.0) return 0.0;
    return score_math::saturate(v, scale);
}

// 0.5 is neutral; gains approach 1 on pos_scale, losses approach 0 on the
// (steeper) neg_scale.
inline std::optional<double> score_signed_metric(std::optional<double> value,
                                                 double pos_scale, double neg_scale) {
    value = score_math::finite_or_null(value);
    if (!value) return std::nullopt;
    if (*value >= 0.0) {
        return 0.5 + 0.5 * score_math::saturate(*value, pos_scale);
    }
    return 0.5 - 0.5 * score_math::saturate(std::abs(*value), neg_scale);
}

// Geometric mean of the available verification components, mapped linearly
// onto [verify_min_multiplier, verify_max_multiplier].
inline std::optional<double> verification_multiplier(const TemplateVerificationMetrics& m,
                                                     const TemplateScoreSettings& cfg) {
    std::vector<double> components;
    if (auto s = score_positive_metric(m.verify_sharpe_ratio, cfg.verify_sharpe_scale)) {
        components.push_back(*s);
    }
    if (auto s = score_positive_metric(m.verify_calmar_ratio, cfg.verify_calmar_scale)) {
        components.push_back(*s);
    }
    if (auto s = score_signed_metric(m.verify_cagr, cfg.verify_cagr_scale,
                                     cfg.verify_cagr_neg_scale)) {
        components.push_back(*s);
    }
    if (auto dd = score_math::finite_or_null(m.verify_max_drawdown_ratio)) {
        components.push_back(score_math::drawdown_survival(cfg.verify_drawdown_lambda, *dd));
    }
    if (components.empty()) return std::nullopt;

    double product = 1.0;
    for (double c : components) product *= std::max(0.0, c);
    double g = std::pow(product, 1.0 / static_cast<double>(components.size()));
    if (!std::isfinite(g)) return std::nullopt;

    return cfg.verify_min_multiplier +
           (cfg.verify_max_multiplier - cfg.verify_min_multiplier) * g;
}

struct PeriodSlots {
    int period_months = 0;
    std::optional<int> period_days;
    const TemplateScoreSnapshot* training = nullptr;
    const TemplateScoreSnapshot* validation = nullptr;
};

struct StrategyGroup {
    std::string strategy_id;
    std::string template_id;
    std::vector<PeriodSlots> periods;  // first-seen order
    std::unordered_map<int, size_t> period_index;
};

inline std::optional<TemplateScorePeriod> score_period(const PeriodSlots& slots, int64_t now_ms,
                                                       const TemplateScoreSettings& cfg) {
    if (!slots.training || !slots.validation) return std::nullopt;
    const auto& training = *slots.training->performance;
    const auto& validation = *slots.validation->performance;

    auto t_cagr = score_math::finite_or_null(training.cagr);
    auto v_cagr = score_math::finite_or_null(validation.cagr);
    if (!t_cagr || !v_cagr) return std::nullopt;

    auto dd_pct = score_math::finite_or_null(validation.max_drawdown_percent);
    if (!dd_pct) return std::nullopt;
    double v_dd = *dd_pct / 100.0;

    if (!validation.total_trades) return std::nullopt;
    auto tpy = trades_per_year(*validation.total_trades, slots.period_months, slots.period_days);
    if (!tpy) return std::nullopt;

    TemplateScorePeriod p;
    p.period_months = slots.period_months;
    p.period_days = slots.period_days;
    p.created_at_ms = slots.validation->created_at_ms;
    p.training_cagr = *t_cagr;
    p.validation_cagr = *v_cagr;
    p.validation_drawdown = v_dd;
    p.trades_per_year = *tpy;
    p.return_score = score_return(*v_cagr, cfg);
    p.consistency_score = score_consistency(*t_cagr, *v_cagr);
    p.risk_score = score_risk(v_dd, cfg);
    p.liquidity_score = score_liquidity(*tpy, cfg);

    double score = p.return_score * p.consistency_score * p.risk_score * p.liquidity_score;
    score *= negative_validation_penalty(*v_cagr, cfg);
    if (!std::isfinite(score)) return std::nullopt;
    p.period_score01 = score_math::clamp01(score);

    p.length_weight = std::sqrt(std::max(1.0, static_cast<double>(slots.period_months)));
    p.recency_weight = recency_weight(p.created_at_ms, now_ms, cfg);
    p.weight = p.length_weight * p.recency_weight;
    return p;
}

inline int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace template_scoring

// ---------------------------------------------------------------------------
// compute_template_score_results: one 0-1 score per template: the best
// strategy's length- and recency-weighted mean of per-period scores,
// optionally scaled by an out-of-sample verification multiplier.
// ---------------------------------------------------------------------------
inline TemplateScoreResults compute_template_score_results(
    const std::vector<TemplateScoreSnapshot>& snapshots,
    const TemplateScoreOptions& options = {}) {
    using namespace template_scoring;

    const TemplateScoreSettings cfg =
        resolve_template_score_settings(options.settings_lookup, options.overrides);
    const int64_t now_ms = options.now_ms.value_or(system_now_ms());

    std::vector<StrategyGroup> groups;
    std::unordered_map<std::string, size_t> group_index;

    for (const auto& snap : snapshots) {
        if (!snap.performance || snap.period_months <= 0) continue;

        auto git = group_index.find(snap.strategy_id);
        if (git == group_index.end()) {
            git = group_index.emplace(snap.strategy_id, groups.size()).first;
            StrategyGroup g;
            g.strategy_id = snap.strategy_id;
            g.template_id = snap.template_id;
            groups.push_back(std::move(g));
        }
        auto& group = groups[git->second];

        auto pit = group.period_index.find(snap.period_months);
        if (pit == group.period_index.end()) {
            pit = group.period_index.emplace(snap.period_months, group.periods.size()).first;
            PeriodSlots slots;
            slots.period_months = snap.period_months;
            slots.period_days = snap.period_days;
            group.periods.push_back(slots);
        }
        auto& slots = group.periods[pit->second];

        if (snap.scope == BacktestScope::VALIDATION) slots.validation = &snap;
        else slots.training = &snap;

        bool has_days = slots.period_days && *slots.period_days != 0;
        if (!has_days && snap.period_days && *snap.period_days != 0) {
            slots.period_days = snap.period_days;
        }
    }

    TemplateScoreResults results;

    for (const auto& group : groups) {
        std::vector<TemplateScorePeriod> periods;
        for (const auto& slots : group.periods) {
            if (auto p = score_period(slots, now_ms, cfg)) periods.push_back(*p);
        }
        if (periods.empty()) continue;

        double total_weight = 0.0;
        double weighted = 0.0;
        for (const auto& p : periods) {
            total_weight += p.weight;
            weighted += p.period_score01 * p.weight;
        }
        if (!std::isfinite(total_weight) || total_weight <= 0.0) continue;

        double base = score_math::clamp01(weighted / total_weight);
        auto existing = results.scores.find(group.template_id);
        if (existing != results.scores.end() && !(base > existing->second)) continue;

        auto weighted_avg = [&](double TemplateScorePeriod::*field) {
            double sum = 0.0;
            for (const auto& p : periods) sum += p.*field * p.weight;
            return sum / total_weight;
        };

        TemplateScoreBreakdown b;
        b.template_id = group.template_id;
        b.strategy_id = group.strategy_id;
        b.base_score01 = base;
        b.final_score01 = base;
        b.base_score100 = score_math::to_score100(base);
        b.final_score100 = score_math::to_score100(base);
        b.component_averages.return_score = weighted_avg(&TemplateScorePeriod::return_score);
        b.component_averages.consistency_score =
            weighted_avg(&TemplateScorePeriod::consistency_score);
        b.component_averages.risk_score = weighted_avg(&TemplateScorePeriod::risk_score);
        b.component_averages.liquidity_score = weighted_avg(&TemplateScorePeriod::liquidity_score);
        b.weights.total_weight = total_weight;
        b.weights.period_count = static_cast<int>(periods.size());
        b.weights.length_weight_avg = weighted_avg(&TemplateScorePeriod::length_weight);
        b.weights.recency_weight_avg = weighted_avg(&TemplateScorePeriod::recency_weight);
        b.periods = std::move(periods);

        results.scores[group.template_id] = base;
        results.breakdowns[group.template_id] = std::move(b);
    }

    if (options.verification_by_template.empty()) return results;

    for (auto& [template_id, score] : results.scores) {
        auto it = options.verification_by_template.find(template_id);
        if (it == options.verification_by_template.end()) continue;
        auto multiplier = verification_multiplier(it->second, cfg);
        if (!multiplier) continue;

        // A multiplier above 1 must not push the score past the 0-1 band.
        score = score_math::clamp01(score * *multiplier);
        auto& b = results.breakdowns[template_id];
        b.verification_multiplier = multiplier;
        b.final_score01 = score;
        b.final_score100 = score_math::to_score100(score);
    }
    return results;
}

inline std::map<std::string, double> compute_template_scores(
    const std::vector<TemplateScoreSnapshot>& snapshots,
    const TemplateScoreOptions& options = {}) {
    return compute_template_score_results(snapshots, options).scores;
}
