#pragma once

#include "scoring/settings_lookup.hpp"

#include <optional>

// ---------------------------------------------------------------------------
// ParamScoreSettings: knobs for ranking parameter sets of one template
// ---------------------------------------------------------------------------
struct ParamScoreSettings {
    double min_trades = 20.0;
    double drawdown_lambda = 3.5;
    double neighbor_threshold = 0.15;
    double core_score_quantile = 0.6;
    double pairwise_neighbor_limit = 1500.0;
    double stability_gamma = 2.0;
};

struct ParamScoreOverrides {
    std::optional<double> min_trades;
    std::optional<double> drawdown_lambda;
    std::optional<double> neighbor_threshold;
    std::optional<double> core_score_quantile;
    std::optional<double> pairwise_neighbor_limit;
    std::optional<double> stability_gamma;
};

namespace param_score_keys {
constexpr const char* MIN_TRADES = "PARAM_SCORE_MIN_TRADES";
constexpr const char* DRAWDOWN_LAMBDA = "PARAM_SCORE_DRAWDOWN_LAMBDA";
constexpr const char* NEIGHBOR_THRESHOLD = "PARAM_SCORE_NEIGHBOR_THRESHOLD";
constexpr const char* CORE_SCORE_QUANTILE = "PARAM_SCORE_CORE_SCORE_QUANTILE";
constexpr const char* PAIRWISE_NEIGHBOR_LIMIT = "PARAM_SCORE_PAIRWISE_NEIGHBOR_LIMIT";
}  // namespace param_score_keys

using ParamScoreField = settings::NumberField<ParamScoreSettings, ParamScoreOverrides>;

// stability_gamma has no external key; only callers can override it.
inline const ParamScoreField PARAM_SCORE_FIELDS[] = {
    {param_score_keys::MIN_TRADES, &ParamScoreSettings::min_trades,
     &ParamScoreOverrides::min_trades, {0.0, std::nullopt, true}},
    {param_score_keys::DRAWDOWN_LAMBDA, &ParamScoreSettings::drawdown_lambda,
     &ParamScoreOverrides::drawdown_lambda, {0.0, std::nullopt, false}},
    {param_score_keys::NEIGHBOR_THRESHOLD, &ParamScoreSettings::neighbor_threshold,
     &ParamScoreOverrides::neighbor_threshold, {0.0, std::nullopt, false}},
    {param_score_keys::CORE_SCORE_QUANTILE, &ParamScoreSettings::core_score_quantile,
     &ParamScoreOverrides::core_score_quantile, {0.0, 1.0, false}},
    {param_score_keys::PAIRWISE_NEIGHBOR_LIMIT, &ParamScoreSettings::pairwise_neighbor_limit,
     &ParamScoreOverrides::pairwise_neighbor_limit, {1.0, std::nullopt, true}},
    {nullptr, &ParamScoreSettings::stability_gamma,
     &ParamScoreOverrides::stability_gamma, {0.0, std::nullopt, false}},
};

// defaults <- lookup <- caller overrides, then validated once.
inline ParamScoreSettings resolve_param_score_settings(const SettingsLookup* lookup,
                                                       const ParamScoreOverrides& overrides) {
    auto merged = settings::overrides_from_lookup(lookup, PARAM_SCORE_FIELDS);
    settings::merge_overrides(merged, overrides, PARAM_SCORE_FIELDS);
    return settings::resolve(merged, PARAM_SCORE_FIELDS);
}
