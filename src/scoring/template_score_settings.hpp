#pragma once

#include "scoring/settings_lookup.hpp"

#include <algorithm>
#include <optional>

// ---------------------------------------------------------------------------
// TemplateScoreSettings: knobs for multi-period template scoring and the
// out-of-sample verification multiplier
// ---------------------------------------------------------------------------
struct TemplateScoreSettings {
    double return_scale = 0.20;
    double validation_negative_penalty_strength = 2.0;
    double drawdown_lambda = 2.5;
    double trade_target = 200.0;
    double trade_weight = 0.25;
    double recency_half_life_days = 365.0;
    double verify_sharpe_scale = 2.0;
    double verify_calmar_scale = 2.0;
    double verify_cagr_scale = 0.25;
    double verify_cagr_neg_scale = 0.10;
    double verify_drawdown_lambda = 2.5;
    double verify_min_multiplier = 0.8;
    double verify_max_multiplier = 1.2;
};

struct TemplateScoreOverrides {
    std::optional<double> return_scale;
    std::optional<double> validation_negative_penalty_strength;
    std::optional<double> drawdown_lambda;
    std::optional<double> trade_target;
    std::optional<double> trade_weight;
    std::optional<double> recency_half_life_days;
    std::optional<double> verify_sharpe_scale;
    std::optional<double> verify_calmar_scale;
    std::optional<double> verify_cagr_scale;
    std::optional<double> verify_cagr_neg_scale;
    std::optional<double> verify_drawdown_lambda;
    std::optional<double> verify_min_multiplier;
    std::optional<double> verify_max_multiplier;
};

namespace template_score_keys {
constexpr const char* RETURN_SCALE = "TEMPLATE_SCORE_RETURN_SCALE";
constexpr const char* VALIDATION_NEGATIVE_PENALTY_STRENGTH =
    "TEMPLATE_SCORE_VALIDATION_NEGATIVE_PENALTY_STRENGTH";
constexpr const char* DRAWDOWN_LAMBDA = "TEMPLATE_SCORE_DRAWDOWN_LAMBDA";
constexpr const char* TRADE_TARGET = "TEMPLATE_SCORE_TRADE_TARGET";
constexpr const char* TRADE_WEIGHT = "TEMPLATE_SCORE_TRADE_WEIGHT";
constexpr const char* RECENCY_HALF_LIFE_DAYS = "TEMPLATE_SCORE_RECENCY_HALF_LIFE_DAYS";
constexpr const char* VERIFY_SHARPE_SCALE = "TEMPLATE_SCORE_VERIFY_SHARPE_SCALE";
constexpr const char* VERIFY_CALMAR_SCALE = "TEMPLATE_SCORE_VERIFY_CALMAR_SCALE";
constexpr const char* VERIFY_CAGR_SCALE = "TEMPLATE_SCORE_VERIFY_CAGR_SCALE";
constexpr const char* VERIFY_CAGR_NEG_SCALE = "TEMPLATE_SCORE_VERIFY_CAGR_NEG_SCALE";
constexpr const char* VERIFY_DRAWDOWN_LAMBDA = "TEMPLATE_SCORE_VERIFY_DRAWDOWN_LAMBDA";
constexpr const char* VERIFY_MIN_MULTIPLIER = "TEMPLATE_SCORE_VERIFY_MIN_MULTIPLIER";
constexpr const char* VERIFY_MAX_MULTIPLIER = "TEMPLATE_SCORE_VERIFY_MAX_MULTIPLIER";
}  // namespace template_score_keys

using TemplateScoreField = settings::NumberField<TemplateScoreSettings, TemplateScoreOverrides>;

inline const TemplateScoreField TEMPLATE_SCORE_FIELDS[] = {
    {template_score_keys::RETURN_SCALE, &TemplateScoreSettings::return_scale,
     &TemplateScoreOverrides::return_scale, {1e-6, std::nullopt, false}},
    {template_score_keys::VALIDATION_NEGATIVE_PENALTY_STRENGTH,
     &TemplateScoreSettings::validation_negative_penalty_strength,
     &TemplateScoreOverrides::validation_negative_penalty_strength, {0.0, std::nullopt, false}},
    {template_score_keys::DRAWDOWN_LAMBDA, &TemplateScoreSettings::drawdown_lambda,
     &TemplateScoreOverrides::drawdown_lambda, {0.0, std::nullopt, false}},
    {template_score_keys::TRADE_TARGET, &TemplateScoreSettings::trade_target,
     &TemplateScoreOverrides::trade_target, {1e-6, std::nullopt, false}},
    {template_score_keys::TRADE_WEIGHT, &TemplateScoreSettings::trade_weight,
     &TemplateScoreOverrides::trade_weight, {0.0, 1.0, false}},
    {template_score_keys::RECENCY_HALF_LIFE_DAYS, &TemplateScoreSettings::recency_half_life_days,
     &TemplateScoreOverrides::recency_half_life_days, {1e-6, std::nullopt, false}},
    {template_score_keys::VERIFY_SHARPE_SCALE, &TemplateScoreSettings::verify_sharpe_scale,
     &TemplateScoreOverrides::verify_sharpe_scale, {1e-6, std::nullopt, false}},
    {template_score_keys::VERIFY_CALMAR_SCALE, &TemplateScoreSettings::verify_calmar_scale,
     &TemplateScoreOverrides::verify_calmar_scale, {1e-6, std::nullopt, false}},
    {template_score_keys::VERIFY_CAGR_SCALE, &TemplateScoreSettings::verify_cagr_scale,
     &TemplateScoreOverrides::verify_cagr_scale, {1e-6, std::nullopt, false}},
    {template_score_keys::VERIFY_CAGR_NEG_SCALE, &TemplateScoreSettings::verify_cagr_neg_scale,
     &TemplateScoreOverrides::verify_cagr_neg_scale, {1e-6, std::nullopt, false}},
    {template_score_keys::VERIFY_DRAWDOWN_LAMBDA, &TemplateScoreSettings::verify_drawdown_lambda,
     &TemplateScoreOverrides::verify_drawdown_lambda, {0.0, std::nullopt, false}},
    {template_score_keys::VERIFY_MIN_MULTIPLIER, &TemplateScoreSettings::verify_min_multiplier,
     &TemplateScoreOverrides::verify_min_multiplier, {0.0, std::nullopt, false}},
    {template_score_keys::VERIFY_MAX_MULTIPLIER, &TemplateScoreSettings::verify_max_multiplier,
     &TemplateScoreOverrides::verify_max_multiplier, {0.0, std::nullopt, false}},
};

inline TemplateScoreSettings resolve_template_score_settings(
    const SettingsLookup* lookup, const TemplateScoreOverrides& overrides) {
    auto merged = settings::overrides_from_lookup(lookup, TEMPLATE_SCORE_FIELDS);
    settings::merge_overrides(merged, overrides, TEMPLATE_SCORE_FIELDS);
    auto resolved = settings::resolve(merged, TEMPLATE_SCORE_FIELDS);
    // The multiplier band never inverts.
    resolved.verify_max_multiplier =
        std::max(resolved.verify_min_multiplier, resolved.verify_max_multiplier);
    return resolved;
}
