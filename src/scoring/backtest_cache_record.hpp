#pragma once

#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <variant>

// Parameter values have no fixed schema: numbers, flags and labels mix freely.
using ParamValue = std::variant<double, bool, std::string>;
using ParameterSet = std::map<std::string, ParamValue>;

// Finite numeric parameter value, if any. Booleans and strings are not
// numeric.
inline std::optional<double> numeric_param(const ParamValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) return *d;
    }
    return std::nullopt;
}

inline std::optional<double> numeric_param(const ParameterSet& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    return numeric_param(it->second);
}

// ---------------------------------------------------------------------------
// BacktestCacheRecord: one cached backtest outcome for a parameter set.
// All metrics are optional as stored; the scorer decides which absences
// exclude a record.
// ---------------------------------------------------------------------------
struct BacktestCacheRecord {
    std::optional<std::string> id;
    std::string template_id;
    ParameterSet parameters;

    std::optional<double> sharpe_ratio;
    std::optional<double> calmar_ratio;
    std::optional<double> total_return;
    std::optional<double> cagr;
    std::optional<double> max_drawdown;
    std::optional<double> max_drawdown_ratio;
    std::optional<double> win_rate;
    std::optional<double> total_trades;

    // Out-of-sample re-run of the same parameter set
    std::optional<double> verify_sharpe_ratio;
    std::optional<double> verify_calmar_ratio;
    std::optional<double> verify_total_return;
    std::optional<double> verify_cagr;
    std::optional<double> verify_max_drawdown_ratio;

    // Display only
    std::optional<std::string> top_abs_gain_ticker;
    std::optional<std::string> top_rel_gain_ticker;
};
