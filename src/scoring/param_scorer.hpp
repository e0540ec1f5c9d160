#pragma once

#include "scoring/backtest_cache_record.hpp"
#include "scoring/param_score_settings.hpp"
#include "scoring/score_availability.hpp"
#include "scoring/score_math.hpp"
#include "scoring/settings_lookup.hpp"
#include "scoring/stability.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ParamScoreResult: one ranked parameter set. record_index points back into
// the caller's input vector for fields the scorer does not copy (id,
// tickers, verify columns).
// ---------------------------------------------------------------------------
struct ParamScoreResult {
    size_t record_index = 0;
    ParameterSet parameters;

    double sharpe_ratio = 0.0;
    double calmar_ratio = 0.0;
    double total_return = 0.0;
    double cagr = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_ratio = 0.0;
    std::optional<double> win_rate;
    int64_t total_trades = 0;

    double core_score = 0.0;
    double dd_penalty = 0.0;
    double stability_score = 0.0;
    double final_score = 0.0;
};

struct ParamScoreSummary {
    std::vector<ParamScoreResult> scored;
    std::map<std::string, ScoreAvailability> availability_by_id;
    // One verdict per input record, same order as the input.
    std::vector<ScoreAvailability> availability_by_record;
};

struct ParamScoreOptions {
    const SettingsLookup* settings_lookup = nullptr;
    ParamScoreOverrides overrides;
};

namespace param_scoring {

// Candidate that passed the eligibility gate, metrics parsed.
struct Candidate {
    size_t record_index = 0;
    const ParameterSet* parameters = nullptr;
    double sharpe_ratio = 0.0;
    double calmar_ratio = 0.0;
    double total_return = 0.0;
    double cagr = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_ratio = 0.0;
    std::optional<double> win_rate;
    int64_t total_trades = 0;
    std::optional<double> verify_sharpe_ratio;
    std::optional<double> verify_calmar_ratio;
    std::optional<double> verify_return_like;
    std::optional<double> verify_max_drawdown_ratio;
};

struct Evaluation {
    std::optional<Candidate> candidate;
    ScoreAvailability availability;
};

inline Evaluation evaluate_record(const BacktestCacheRecord& record, size_t index,
                                  const ParamScoreSettings& cfg) {
    using score_math::finite_or_null;
    Evaluation ev;

    auto sharpe = finite_or_null(record.sharpe_ratio);
    auto calmar = finite_or_null(record.calmar_ratio);
    auto total_return = finite_or_null(record.total_return);
    if (!sharpe || !calmar || !total_return) {
        ev.availability = ScoreAvailability::excluded(
            AvailabilityReason::MISSING_METRICS,
            "Missing Sharpe, Calmar, or total return metrics.");
        return ev;
    }
    if (record.parameters.empty()) {
        ev.availability = ScoreAvailability::excluded(
            AvailabilityReason::MISSING_PARAMETERS, "Parameter set is empty or invalid.");
        return ev;
    }
    auto trades_raw = finite_or_null(record.total_trades);
    if (!trades_raw) {
        ev.availability = ScoreAvailability::excluded(
            AvailabilityReason::MISSING_TRADES, "Total trade count is missing.");
        return ev;
    }
    int64_t trades = score_math::to_count(*trades_raw);
    int64_t min_trades = score_math::to_count(cfg.min_trades);
    if (min_trades > 0 && trades < min_trades) {
        ev.availability = ScoreAvailability::excluded(
            AvailabilityReason::INSUFFICIENT_TRADES,
            "Requires at least " + std::to_string(min_trades) + " trades (only " +
                std::to_string(trades) + " recorded).");
        return ev;
    }

    Candidate c;
    c.record_index = index;
    c.parameters = &record.parameters;
    c.sharpe_ratio = *sharpe;
    c.calmar_ratio = *calmar;
    c.total_return = *total_return;
    c.cagr = finite_or_null(record.cagr).value_or(0.0);
    c.max_drawdown = finite_or_null(record.max_drawdown).value_or(0.0);
    c.max_drawdown_ratio = finite_or_null(record.max_drawdown_ratio).value_or(0.0);
    c.win_rate = finite_or_null(record.win_rate);
    c.total_trades = trades;
    c.verify_sharpe_ratio = finite_or_null(record.verify_sharpe_ratio);
    c.verify_calmar_ratio = finite_or_null(record.verify_calmar_ratio);
    auto verify_return = finite_or_null(record.verify_total_return);
    c.verify_return_like = verify_return ? verify_return : finite_or_null(record.verify_cagr);
    c.verify_max_drawdown_ratio = finite_or_null(record.verify_max_drawdown_ratio);

    ev.candidate = c;
    ev.availability = ScoreAvailability::ok();
    return ev;
}

// Percentiles over the candidates that carry `field`, empty elsewhere.
inline std::vector<std::optional<double>> verify_percentiles(
    const std::vector<Candidate>& candidates,
    std::optional<double> Candidate::*field) {
    std::vector<std::pair<size_t, double>> entries;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& v = candidates[i].*field;
        if (v) entries.emplace_back(i, *v);
    }
    return score_math::aligned_percentile_ranks(entries, candidates.size());
}

}  // namespace param_scoring

// ---------------------------------------------------------------------------
// score_backtest_parameters: rank every eligible parameter set of one
// template by core quality x drawdown penalty x neighborhood stability.
//
// Every input record gets an availability verdict, whether scored or not.
// Exceptions from the settings lookup propagate.
// ---------------------------------------------------------------------------
inline ParamScoreSummary score_backtest_parameters(const std::vector<BacktestCacheRecord>& records,
                                                   const ParamScoreOptions& options = {}) {
    using namespace param_scoring;

    const ParamScoreSettings cfg =
        resolve_param_score_settings(options.settings_lookup, options.overrides);

    ParamScoreSummary summary;
    summary.availability_by_record.reserve(records.size());
    std::vector<Candidate> candidates;

    for (size_t i = 0; i < records.size(); ++i) {
        auto ev = evaluate_record(records[i], i, cfg);
        const auto& id = records[i].id;
        if (id && id->find_first_not_of(" \t\r\n") != std::string::npos) {
            summary.availability_by_id[*id] = ev.availability;
        }
        summary.availability_by_record.push_back(std::move(ev.availability));
        if (ev.candidate) candidates.push_back(*ev.candidate);
    }

    if (candidates.empty()) return summary;

    size_t n = candidates.size();
    std::vector<double> sharpe(n), calmar(n), ret(n);
    for (size_t i = 0; i < n; ++i) {
        sharpe[i] = candidates[i].sharpe_ratio;
        calmar[i] = candidates[i].calmar_ratio;
        ret[i] = candidates[i].total_return;
    }
    auto sharpe_pct = score_math::percentile_ranks(sharpe);
    auto calmar_pct = score_math::percentile_ranks(calmar);
    auto return_pct = score_math::percentile_ranks(ret);
    auto v_sharpe_pct = verify_percentiles(candidates, &Candidate::verify_sharpe_ratio);
    auto v_calmar_pct = verify_percentiles(candidates, &Candidate::verify_calmar_ratio);
    auto v_return_pct = verify_percentiles(candidates, &Candidate::verify_return_like);

    std::vector<ParamScoreResult> results(n);
    std::vector<double> quality(n);
    std::vector<const ParameterSet*> params(n);

    for (size_t i = 0; i < n; ++i) {
        const auto& c = candidates[i];
        double core = score_math::geometric_core(sharpe_pct[i], calmar_pct[i], return_pct[i]);
        if (v_sharpe_pct[i] && v_calmar_pct[i] && v_return_pct[i]) {
            double core_verify = score_math::geometric_core(
                *v_sharpe_pct[i], *v_calmar_pct[i], *v_return_pct[i]);
            core = std::sqrt(core * core_verify);
        }

        double dd = score_math::drawdown_survival(cfg.drawdown_lambda, c.max_drawdown_ratio);
        if (c.verify_max_drawdown_ratio) {
            double dd_verify = score_math::drawdown_survival(
                cfg.drawdown_lambda, *c.verify_max_drawdown_ratio);
            dd = std::sqrt(dd * dd_verify);
        }

        auto& r = results[i];
        r.record_index = c.record_index;
        r.parameters = *c.parameters;
        r.sharpe_ratio = c.sharpe_ratio;
        r.calmar_ratio = c.calmar_ratio;
        r.total_return = c.total_return;
        r.cagr = c.cagr;
        r.max_drawdown = c.max_drawdown;
        r.max_drawdown_ratio = c.max_drawdown_ratio;
        r.win_rate = c.win_rate;
        r.total_trades = c.total_trades;
        r.core_score = core;
        r.dd_penalty = dd;

        quality[i] = core * dd;
        params[i] = c.parameters;
    }

    // Any limit at or above the candidate count means exact search.
    double limit = std::min(cfg.pairwise_neighbor_limit, static_cast<double>(n));
    NeighborStability stability(cfg.neighbor_threshold, static_cast<size_t>(limit));
    auto stab = stability.compute(params, quality);

    for (size_t i = 0; i < n; ++i) {
        auto& r = results[i];
        r.stability_score = stab[i];
        double factor = std::pow(score_math::clamp01(stab[i]), cfg.stability_gamma);
        r.final_score = r.core_score * r.dd_penalty * factor;
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const ParamScoreResult& a, const ParamScoreResult& b) {
                         return a.final_score > b.final_score;
                     });
    summary.scored = std::move(results);
    return summary;
}

// ---------------------------------------------------------------------------
// best_params_by_template: score each template's records independently and
// keep the top-ranked parameter set. Templates with nothing eligible are
// omitted. record_index refers to the full input vector.
// ---------------------------------------------------------------------------
inline std::map<std::string, ParamScoreResult> best_params_by_template(
    const std::vector<BacktestCacheRecord>& records,
    const ParamScoreOptions& options = {}) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<size_t>> members;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& tid = records[i].template_id;
        auto it = members.find(tid);
        if (it == members.end()) {
            order.push_back(tid);
            members[tid].push_back(i);
        } else {
            it->second.push_back(i);
        }
    }

    std::map<std::string, ParamScoreResult> best;
    for (const auto& tid : order) {
        const auto& idx = members[tid];
        std::vector<BacktestCacheRecord> group;
        group.reserve(idx.size());
        for (size_t i : idx) group.push_back(records[i]);

        auto summary = score_backtest_parameters(group, options);
        if (summary.scored.empty()) continue;
        auto top = summary.scored.front();
        top.record_index = idx[top.record_index];
        best.emplace(tid, std::move(top));
    }
    return best;
}
