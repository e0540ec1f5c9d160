#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Numerical-stability constants shared by both scorers
// ---------------------------------------------------------------------------
namespace score_math {

constexpr double PERCENTILE_TOLERANCE = 1e-12;
constexpr double CORE_SCORE_EPSILON = 1e-9;
constexpr double QUALITY_RANGE_EPSILON = 1e-12;
constexpr double MIN_SCALE = 1e-6;
// Counts above 2^53 are no longer exact in a double.
constexpr double MAX_COUNT = 9007199254740992.0;

// Non-finite input maps to lo.
inline double clamp(double value, double lo, double hi) {
    if (!std::isfinite(value)) return lo;
    return std::min(std::max(value, lo), hi);
}

inline double clamp01(double value) { return clamp(value, 0.0, 1.0); }

// 0-1 score to the integer 0-100 display value.
inline int to_score100(double score01) {
    return static_cast<int>(std::floor(clamp01(score01) * 100.0 + 0.5));
}

// Round a count half up and hold it in [0, MAX_COUNT].
inline int64_t to_count(double value) {
    return static_cast<int64_t>(clamp(std::floor(value + 0.5), 0.0, MAX_COUNT));
}

inline std::optional<double> finite_or_null(std::optional<double> value) {
    if (value && std::isfinite(*value)) return value;
    return std::nullopt;
}

// Geometric mean of three percentiles, each lifted by CORE_SCORE_EPSILON so a
// single zero does not erase the product.
inline double geometric_core(double a, double b, double c) {
    return std::cbrt((a + CORE_SCORE_EPSILON) *
                     (b + CORE_SCORE_EPSILON) *
                     (c + CORE_SCORE_EPSILON));
}

// ---------------------------------------------------------------------------
// Percentile ranks: average rank of each tie run divided by (n - 1).
// Values within PERCENTILE_TOLERANCE of the first value of a run share it.
// A single value gets rank 1.
// ---------------------------------------------------------------------------
inline std::vector<double> percentile_ranks(const std::vector<double>& values) {
    size_t n = values.size();
    if (n == 0) return {};
    if (n == 1) return {1.0};

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return values[a] < values[b];
    });

    std::vector<double> ranks(n, 0.0);
    double denom = static_cast<double>(n - 1);
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n &&
               std::abs(values[order[j]] - values[order[i]]) <= PERCENTILE_TOLERANCE) {
            ++j;
        }
        double avg_rank = 0.5 * (static_cast<double>(i) + static_cast<double>(j - 1));
        for (size_t k = i; k < j; ++k) {
            ranks[order[k]] = avg_rank / denom;
        }
        i = j;
    }
    return ranks;
}

// Percentiles over a sparse subset, aligned back to a vector of `total`
// slots. Slots without an entry stay empty.
inline std::vector<std::optional<double>> aligned_percentile_ranks(
    const std::vector<std::pair<size_t, double>>& entries, size_t total) {
    std::vector<std::optional<double>> aligned(total);
    if (entries.empty()) return aligned;

    std::vector<double> values;
    values.reserve(entries.size());
    for (const auto& e : entries) values.push_back(e.second);

    auto ranks = percentile_ranks(values);
    for (size_t i = 0; i < entries.size(); ++i) {
        aligned[entries[i].first] = ranks[i];
    }
    return aligned;
}

// Saturating exponential: 0 at x = 0, approaching 1 as x grows.
inline double saturate(double x, double scale) {
    return 1.0 - std::exp(-x / std::max(scale, MIN_SCALE));
}

// Exponential survival multiplier for a non-negative drawdown ratio.
inline double drawdown_survival(double lambda, double drawdown_ratio) {
    return std::exp(-lambda * std::max(0.0, drawdown_ratio));
}

}  // namespace score_math
