#pragma once

#include "scoring/backtest_cache_record.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parameter-space geometry for stability scoring
//
// Distances are measured in units of each key's inter-decile spread across
// the candidate population, so a threshold of 0.15 means "within 15% of the
// typical spread of every parameter".
// ---------------------------------------------------------------------------
namespace parameter_space {

constexpr double MIN_SPREAD = 1e-8;
constexpr double MIN_KEY_SCALE = 1e-6;
constexpr double SCALE_FLOOR = 1e-9;
constexpr double MIN_BUCKET_STEP = 0.01;
constexpr double MISSING_VALUE_PENALTY = 1.0;

// Capital size, leverage cap and ticker describe scale, not behaviour.
inline bool is_ignored_key(const std::string& key) {
    return key == "initialCapital" || key == "maxLeverage" || key == "ticker";
}

using ScaleMap = std::map<std::string, double>;

// p90 - p10 of each numeric key, using floor((n-1)*q) positions in the sorted
// values. Keys whose spread is below MIN_SPREAD do not discriminate and get no
// scale.
inline ScaleMap compute_scales(const std::vector<const ParameterSet*>& sets) {
    std::map<std::string, std::vector<double>> values_by_key;
    for (const auto* params : sets) {
        for (const auto& [key, value] : *params) {
            if (is_ignored_key(key)) continue;
            auto v = numeric_param(value);
            if (v) values_by_key[key].push_back(*v);
        }
    }

    ScaleMap scales;
    for (auto& [key, values] : values_by_key) {
        if (values.empty()) continue;
        std::sort(values.begin(), values.end());
        size_t last = values.size() - 1;
        auto hi = static_cast<size_t>(std::floor(static_cast<double>(last) * 0.9));
        auto lo = static_cast<size_t>(std::floor(static_cast<double>(last) * 0.1));
        double spread = values[hi] - values[lo];
        if (spread < MIN_SPREAD) continue;
        scales[key] = std::max(spread, MIN_KEY_SCALE);
    }
    return scales;
}

// RMS of per-key scaled differences over the scaled keys present in either
// set. A key numeric on only one side contributes MISSING_VALUE_PENALTY to
// the sum of squares. Returns 0 when no key qualifies.
inline double distance(const ParameterSet& a, const ParameterSet& b, const ScaleMap& scales) {
    std::set<std::string> keys;
    for (const auto& kv : a) {
        if (!is_ignored_key(kv.first) && scales.count(kv.first)) keys.insert(kv.first);
    }
    for (const auto& kv : b) {
        if (!is_ignored_key(kv.first) && scales.count(kv.first)) keys.insert(kv.first);
    }
    if (keys.empty()) return 0.0;

    double sum_sq = 0.0;
    for (const auto& key : keys) {
        auto va = numeric_param(a, key);
        auto vb = numeric_param(b, key);
        if (va && vb) {
            double scale = std::max(scales.at(key), SCALE_FLOOR);
            double z = std::abs(*va - *vb) / scale;
            sum_sq += z * z;
        } else {
            sum_sq += MISSING_VALUE_PENALTY;
        }
    }
    return std::sqrt(sum_sq / static_cast<double>(keys.size()));
}

// Round half up, matching how bucket boundaries were drawn historically.
// Indices saturate at +-2^62 so adjacent buckets stay representable.
inline long long quantize(double scaled, double step) {
    constexpr double LIMIT = 4611686018427387904.0;
    double q = std::floor(scaled / step + 0.5);
    return static_cast<long long>(std::clamp(q, -LIMIT, LIMIT));
}

// Bucket keys for the approximate neighbor search: for every scaled numeric
// key (in name order) the candidate's own bucket and the two adjacent ones,
// plus one key for the full quantized vector. Only one dimension at a time is
// widened. Sets sharing no bucket are never compared, so pairs with no
// numeric key in common miss each other even when the missing-value penalty
// keeps them within the threshold.
inline std::vector<std::string> bucket_keys(const ParameterSet& params, double step,
                                            const ScaleMap& scales) {
    double safe_step = std::max(step, MIN_BUCKET_STEP);
    std::set<std::string> keys;
    std::string vector_key;
    bool any = false;

    for (const auto& [key, value] : params) {
        if (is_ignored_key(key)) continue;
        auto scale_it = scales.find(key);
        if (scale_it == scales.end()) continue;
        auto v = numeric_param(value);
        if (!v) continue;

        double normalized = *v / std::max(scale_it->second, SCALE_FLOOR);
        long long q = quantize(normalized, safe_step);
        if (any) vector_key += '|';
        vector_key += key + "=" + std::to_string(q);
        any = true;
        keys.insert(key + ":" + std::to_string(q));
        keys.insert(key + ":" + std::to_string(q - 1));
        keys.insert(key + ":" + std::to_string(q + 1));
    }

    if (!any) {
        keys.insert("vector:__empty__");
    } else {
        keys.insert("vector:" + vector_key);
    }
    return {keys.begin(), keys.end()};
}

}  // namespace parameter_space
