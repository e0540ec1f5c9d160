#pragma once

// test_record_helpers.hpp: builders for backtest-cache records and template
// snapshots shared by the scorer, CSV and JSON tests.

#include "scoring/backtest_cache_record.hpp"
#include "scoring/template_scorer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace record_test_helpers {

// 2025-01-01T00:00:00Z
constexpr int64_t FIXED_NOW_MS = 1735689600000LL;
constexpr int64_t MS_PER_DAY = 86400000LL;

// A fully populated, eligible record with one numeric parameter.
inline BacktestCacheRecord make_record(const std::string& id, double sharpe, double calmar,
                                       double total_return, double x, double trades = 50.0) {
    BacktestCacheRecord r;
    r.id = id;
    r.template_id = "tpl";
    r.parameters = {{"x", x}};
    r.sharpe_ratio = sharpe;
    r.calmar_ratio = calmar;
    r.total_return = total_return;
    r.cagr = total_return;
    r.max_drawdown = 0.0;
    r.max_drawdown_ratio = 0.0;
    r.win_rate = 0.5;
    r.total_trades = trades;
    return r;
}

inline StrategyPerformance make_performance(double cagr, double dd_percent = 10.0,
                                            double trades = 200.0) {
    StrategyPerformance p;
    p.cagr = cagr;
    p.max_drawdown_percent = dd_percent;
    p.total_trades = trades;
    return p;
}

inline TemplateScoreSnapshot make_snapshot(const std::string& template_id,
                                           const std::string& strategy_id,
                                           BacktestScope scope,
                                           std::optional<StrategyPerformance> perf,
                                           int period_months = 12,
                                           std::optional<int> period_days = 365,
                                           std::optional<int64_t> created_at_ms = FIXED_NOW_MS) {
    TemplateScoreSnapshot s;
    s.template_id = template_id;
    s.strategy_id = strategy_id;
    s.scope = scope;
    s.performance = std::move(perf);
    s.period_months = period_months;
    s.period_days = period_days;
    s.created_at_ms = created_at_ms;
    return s;
}

// Training + validation pair for one period with the given CAGRs.
inline std::pair<TemplateScoreSnapshot, TemplateScoreSnapshot> make_period(
    const std::string& template_id, const std::string& strategy_id,
    double training_cagr, double validation_cagr, int period_months = 12,
    std::optional<int64_t> created_at_ms = FIXED_NOW_MS) {
    return {make_snapshot(template_id, strategy_id, BacktestScope::TRAINING,
                          make_performance(training_cagr), period_months, 365, created_at_ms),
            make_snapshot(template_id, strategy_id, BacktestScope::VALIDATION,
                          make_performance(validation_cagr), period_months, 365, created_at_ms)};
}

inline TemplateScoreOptions fixed_clock_options() {
    TemplateScoreOptions options;
    options.now_ms = FIXED_NOW_MS;
    return options;
}

}  // namespace record_test_helpers
