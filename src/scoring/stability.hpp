#pragma once

#include "scoring/backtest_cache_record.hpp"
#include "scoring/parameter_space.hpp"
#include "scoring/score_math.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// NeighborStability: mean quality of a candidate's parameter-space
// neighbors, normalized against the population's quality range.
//
// Candidates without neighbors score 0. When every quality is equal, any
// candidate with a neighbor scores 1.
// ---------------------------------------------------------------------------
class NeighborStability {
public:
    NeighborStability(double neighbor_threshold, size_t pairwise_limit)
        : threshold_(neighbor_threshold), pairwise_limit_(pairwise_limit) {}

    std::vector<double> compute(const std::vector<const ParameterSet*>& params,
                                const std::vector<double>& quality) {
        size_t n = params.size();
        if (n == 0) return {};

        scales_ = parameter_space::compute_scales(params);

        double q_min = std::numeric_limits<double>::infinity();
        double q_max = -std::numeric_limits<double>::infinity();
        for (double q : quality) {
            if (!std::isfinite(q)) continue;
            q_min = std::min(q_min, q);
            q_max = std::max(q_max, q);
        }
        if (!std::isfinite(q_min) || !std::isfinite(q_max)) {
            q_min = 0.0;
            q_max = 0.0;
        }

        if (n <= pairwise_limit_) {
            return pairwise(params, quality, q_min, q_max);
        }
        return bucketed(params, quality, q_min, q_max);
    }

    // Whether the last compute() call fell back to bucketed search.
    bool last_used_buckets() const { return used_buckets_; }

    const parameter_space::ScaleMap& scales() const { return scales_; }

private:
    double threshold_;
    size_t pairwise_limit_;
    parameter_space::ScaleMap scales_;
    bool used_buckets_ = false;

    double normalize(double neighbor_sum, int neighbor_count,
                     double q_min, double q_max) const {
        if (neighbor_count == 0) return 0.0;
        double mean = neighbor_sum / static_cast<double>(neighbor_count);
        double range = q_max - q_min;
        double normalized = (range > score_math::QUALITY_RANGE_EPSILON)
            ? (mean - q_min) / range
            : 1.0;
        return score_math::clamp01(normalized);
    }

    std::vector<double> pairwise(const std::vector<const ParameterSet*>& params,
                                 const std::vector<double>& quality,
                                 double q_min, double q_max) {
        used_buckets_ = false;
        size_t n = params.size();
        std::vector<double> stability(n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            int count = 0;
            double sum = 0.0;
            for (size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                double d = parameter_space::distance(*params[i], *params[j], scales_);
                if (d <= threshold_) {
                    ++count;
                    sum += quality[j];
                }
            }
            stability[i] = normalize(sum, count, q_min, q_max);
        }
        return stability;
    }

    // Exact distances only among candidates sharing at least one bucket key.
    std::vector<double> bucketed(const std::vector<const ParameterSet*>& params,
                                 const std::vector<double>& quality,
                                 double q_min, double q_max) {
        used_buckets_ = true;
        size_t n = params.size();
        double step = std::max(threshold_, parameter_space::MIN_BUCKET_STEP);

        std::unordered_map<std::string, std::vector<size_t>> buckets;
        std::vector<std::vector<std::string>> keys_of(n);
        for (size_t i = 0; i < n; ++i) {
            keys_of[i] = parameter_space::bucket_keys(*params[i], step, scales_);
            for (const auto& key : keys_of[i]) buckets[key].push_back(i);
        }

        std::vector<double> stability(n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            std::set<size_t> candidates;
            for (const auto& key : keys_of[i]) {
                const auto& members = buckets[key];
                candidates.insert(members.begin(), members.end());
            }

            int count = 0;
            double sum = 0.0;
            for (size_t j : candidates) {
                if (j == i) continue;
                double d = parameter_space::distance(*params[i], *params[j], scales_);
                if (d <= threshold_) {
                    ++count;
                    sum += quality[j];
                }
            }
            stability[i] = normalize(sum, count, q_min, q_max);
        }
        return stability;
    }
};
