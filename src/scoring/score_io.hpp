#pragma once

#include "scoring/backtest_cache_record.hpp"
#include "scoring/param_scorer.hpp"
#include "scoring/score_availability.hpp"
#include "scoring/template_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace score_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// JSON has no NaN/Inf; those become null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss.precision(12);
    ss << v;
    return ss.str();
}

inline std::string json_number(const std::optional<double>& v) {
    return v ? json_number(*v) : "null";
}

inline std::string json_string(const std::optional<std::string>& s) {
    return s ? "\"" + json_escape(*s) + "\"" : "null";
}

inline std::string to_json(const ParamValue& value) {
    if (const double* d = std::get_if<double>(&value)) return json_number(*d);
    if (const bool* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    return "\"" + json_escape(std::get<std::string>(value)) + "\"";
}

inline std::string to_json(const ParameterSet& params) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << json_escape(key) << "\":" << to_json(value);
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ScoreAvailability& a) {
    if (a.eligible) return "{\"eligible\":true}";
    std::ostringstream ss;
    ss << "{\"eligible\":false";
    ss << ",\"reason_code\":\"" << availability_reason_code(a.reason_code) << "\"";
    ss << ",\"reason\":\"" << json_escape(a.reason) << "\"";
    ss << "}";
    return ss.str();
}

// Serialize a parameter-scoring summary. `records` is the input the summary
// was computed from; it supplies ids and display fields.
inline std::string to_json(const ParamScoreSummary& summary,
                           const std::vector<BacktestCacheRecord>& records) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"scored\":[";
    for (size_t i = 0; i < summary.scored.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& r = summary.scored[i];
        const auto& src = records.at(r.record_index);
        ss << "{";
        ss << "\"rank\":" << (i + 1);
        ss << ",\"id\":" << json_string(src.id);
        ss << ",\"template_id\":\"" << json_escape(src.template_id) << "\"";
        ss << ",\"parameters\":" << to_json(r.parameters);
        ss << ",\"sharpe_ratio\":" << json_number(r.sharpe_ratio);
        ss << ",\"calmar_ratio\":" << json_number(r.calmar_ratio);
        ss << ",\"total_return\":" << json_number(r.total_return);
        ss << ",\"cagr\":" << json_number(r.cagr);
        ss << ",\"max_drawdown\":" << json_number(r.max_drawdown);
        ss << ",\"max_drawdown_ratio\":" << json_number(r.max_drawdown_ratio);
        ss << ",\"win_rate\":" << json_number(r.win_rate);
        ss << ",\"total_trades\":" << r.total_trades;
        ss << ",\"core_score\":" << json_number(r.core_score);
        ss << ",\"dd_penalty\":" << json_number(r.dd_penalty);
        ss << ",\"stability_score\":" << json_number(r.stability_score);
        ss << ",\"final_score\":" << json_number(r.final_score);
        ss << ",\"top_abs_gain_ticker\":" << json_string(src.top_abs_gain_ticker);
        ss << ",\"top_rel_gain_ticker\":" << json_string(src.top_rel_gain_ticker);
        ss << "}";
    }
    ss << "]";

    ss << ",\"availability\":[";
    for (size_t i = 0; i < summary.availability_by_record.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& src = records.at(i);
        ss << "{\"index\":" << i;
        ss << ",\"id\":" << json_string(src.id);
        ss << ",\"verdict\":" << to_json(summary.availability_by_record[i]);
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

inline std::string to_json(const TemplateScorePeriod& p) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"period_months\":" << p.period_months;
    ss << ",\"period_days\":" << (p.period_days ? std::to_string(*p.period_days) : "null");
    ss << ",\"created_at_ms\":"
       << (p.created_at_ms ? std::to_string(*p.created_at_ms) : "null");
    ss << ",\"training_cagr\":" << json_number(p.training_cagr);
    ss << ",\"validation_cagr\":" << json_number(p.validation_cagr);
    ss << ",\"validation_drawdown\":" << json_number(p.validation_drawdown);
    ss << ",\"trades_per_year\":" << json_number(p.trades_per_year);
    ss << ",\"return_score\":" << json_number(p.return_score);
    ss << ",\"consistency_score\":" << json_number(p.consistency_score);
    ss << ",\"risk_score\":" << json_number(p.risk_score);
    ss << ",\"liquidity_score\":" << json_number(p.liquidity_score);
    ss << ",\"period_score01\":" << json_number(p.period_score01);
    ss << ",\"length_weight\":" << json_number(p.length_weight);
    ss << ",\"recency_weight\":" << json_number(p.recency_weight);
    ss << ",\"weight\":" << json_number(p.weight);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const TemplateScoreBreakdown& b) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"template_id\":\"" << json_escape(b.template_id) << "\"";
    ss << ",\"strategy_id\":\"" << json_escape(b.strategy_id) << "\"";
    ss << ",\"base_score01\":" << json_number(b.base_score01);
    ss << ",\"final_score01\":" << json_number(b.final_score01);
    ss << ",\"base_score100\":" << b.base_score100;
    ss << ",\"final_score100\":" << b.final_score100;
    ss << ",\"verification_multiplier\":" << json_number(b.verification_multiplier);

    const auto& c = b.component_averages;
    ss << ",\"component_averages\":{";
    ss << "\"return_score\":" << json_number(c.return_score);
    ss << ",\"consistency_score\":" << json_number(c.consistency_score);
    ss << ",\"risk_score\":" << json_number(c.risk_score);
    ss << ",\"liquidity_score\":" << json_number(c.liquidity_score);
    ss << "}";

    const auto& w = b.weights;
    ss << ",\"weights\":{";
    ss << "\"total_weight\":" << json_number(w.total_weight);
    ss << ",\"period_count\":" << w.period_count;
    ss << ",\"length_weight_avg\":" << json_number(w.length_weight_avg);
    ss << ",\"recency_weight_avg\":" << json_number(w.recency_weight_avg);
    ss << "}";

    ss << ",\"periods\":[";
    for (size_t i = 0; i < b.periods.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(b.periods[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

// Templates in descending final score; ties keep template id order.
inline std::string to_json(const TemplateScoreResults& results) {
    std::vector<const TemplateScoreBreakdown*> ordered;
    for (const auto& kv : results.breakdowns) ordered.push_back(&kv.second);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TemplateScoreBreakdown* a, const TemplateScoreBreakdown* b) {
                         return a->final_score01 > b->final_score01;
                     });

    std::ostringstream ss;
    ss << "{\"templates\":[";
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(*ordered[i]);
    }
    ss << "]}";
    return ss.str();
}

}  // namespace score_io
