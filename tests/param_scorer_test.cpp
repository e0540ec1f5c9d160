// param_scorer_test.cpp: eligibility gate, core/drawdown/stability scoring
// and ranking of one template's parameter sets.

#include <gtest/gtest.h>

#include "scoring/param_scorer.hpp"
#include "test_record_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using record_test_helpers::make_record;

namespace {

ParamScoreOptions with_threshold(double threshold) {
    ParamScoreOptions options;
    options.overrides.neighbor_threshold = threshold;
    return options;
}

const ParamScoreResult* find_by_x(const ParamScoreSummary& summary, double x) {
    for (const auto& r : summary.scored) {
        auto v = numeric_param(r.parameters, "x");
        if (v && *v == x) return &r;
    }
    return nullptr;
}

}  // namespace

// ===========================================================================
// 1. Eligibility gate
// ===========================================================================
class ParamEligibilityTest : public ::testing::Test {};

TEST_F(ParamEligibilityTest, MinimumTradeGateAtTwenty) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 1.0, 1.0, 0.1, 1.0, 19.0),
        make_record("b", 1.0, 1.0, 0.1, 2.0, 20.0),
    };
    auto summary = score_backtest_parameters(records);

    ASSERT_EQ(summary.scored.size(), 1u);
    EXPECT_EQ(summary.scored[0].record_index, 1u);

    const auto& excluded = summary.availability_by_id.at("a");
    EXPECT_FALSE(excluded.eligible);
    EXPECT_EQ(excluded.reason_code, AvailabilityReason::INSUFFICIENT_TRADES);
    EXPECT_EQ(excluded.reason, "Requires at least 20 trades (only 19 recorded).");
    EXPECT_TRUE(summary.availability_by_id.at("b").eligible);
}

TEST_F(ParamEligibilityTest, TradeCountRoundsHalfUp) {
    std::vector<BacktestCacheRecord> records = {make_record("a", 1.0, 1.0, 0.1, 1.0, 19.5)};
    auto summary = score_backtest_parameters(records);
    ASSERT_EQ(summary.scored.size(), 1u);
    EXPECT_EQ(summary.scored[0].total_trades, 20);
}

TEST_F(ParamEligibilityTest, ZeroMinTradesDisablesGate) {
    std::vector<BacktestCacheRecord> records = {make_record("a", 1.0, 1.0, 0.1, 1.0, 0.0)};
    ParamScoreOptions options;
    options.overrides.min_trades = 0.0;
    EXPECT_EQ(score_backtest_parameters(records, options).scored.size(), 1u);
}

TEST_F(ParamEligibilityTest, TradeCountsBeyondIntRange) {
    std::vector<BacktestCacheRecord> records = {make_record("a", 1.0, 1.0, 0.1, 1.0, 5e9)};
    auto summary = score_backtest_parameters(records);
    ASSERT_EQ(summary.scored.size(), 1u);
    EXPECT_EQ(summary.scored[0].total_trades, 5000000000LL);

    ParamScoreOptions options;
    options.overrides.min_trades = 3e9;
    std::vector<BacktestCacheRecord> few = {make_record("b", 1.0, 1.0, 0.1, 1.0, 50.0)};
    auto gated = score_backtest_parameters(few, options);
    EXPECT_TRUE(gated.scored.empty());
    const auto& excluded = gated.availability_by_id.at("b");
    EXPECT_EQ(excluded.reason_code, AvailabilityReason::INSUFFICIENT_TRADES);
    EXPECT_EQ(excluded.reason, "Requires at least 3000000000 trades (only 50 recorded).");

    EXPECT_EQ(score_backtest_parameters(records, options).scored.size(), 1u);
}

TEST_F(ParamEligibilityTest, HugePairwiseLimitMeansExactSearch) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 1.0, 1.0, 0.1, 0.0),
        make_record("b", 2.0, 2.0, 0.2, 0.0),
    };
    ParamScoreOptions options;
    options.overrides.pairwise_neighbor_limit = 1e30;
    auto summary = score_backtest_parameters(records, options);
    ASSERT_EQ(summary.scored.size(), 2u);
    // Identical parameters are neighbors; the weaker one leans on the stronger.
    for (const auto& r : summary.scored) {
        EXPECT_DOUBLE_EQ(r.stability_score, r.record_index == 0 ? 1.0 : 0.0);
    }
}

TEST_F(ParamEligibilityTest, ReasonsInCheckOrder) {
    auto missing_metrics = make_record("m", 1.0, 1.0, 0.1, 1.0);
    missing_metrics.calmar_ratio = std::nan("");
    missing_metrics.parameters.clear();

    auto missing_params = make_record("p", 1.0, 1.0, 0.1, 1.0);
    missing_params.parameters.clear();
    missing_params.total_trades.reset();

    auto missing_trades = make_record("t", 1.0, 1.0, 0.1, 1.0);
    missing_trades.total_trades.reset();

    std::vector<BacktestCacheRecord> records = {missing_metrics, missing_params, missing_trades};
    auto summary = score_backtest_parameters(records);

    EXPECT_TRUE(summary.scored.empty());
    ASSERT_EQ(summary.availability_by_record.size(), 3u);
    EXPECT_EQ(summary.availability_by_record[0].reason_code,
              AvailabilityReason::MISSING_METRICS);
    EXPECT_EQ(summary.availability_by_record[0].reason,
              "Missing Sharpe, Calmar, or total return metrics.");
    EXPECT_EQ(summary.availability_by_record[1].reason_code,
              AvailabilityReason::MISSING_PARAMETERS);
    EXPECT_EQ(summary.availability_by_record[1].reason, "Parameter set is empty or invalid.");
    EXPECT_EQ(summary.availability_by_record[2].reason_code, AvailabilityReason::MISSING_TRADES);
    EXPECT_EQ(summary.availability_by_record[2].reason, "Total trade count is missing.");
    EXPECT_EQ(availability_reason_code(summary.availability_by_record[2].reason_code),
              "missing_trades");
}

TEST_F(ParamEligibilityTest, BlankIdsAreNotKeyed) {
    auto unnamed = make_record("", 1.0, 1.0, 0.1, 1.0);
    auto spaces = make_record("   ", 1.0, 1.0, 0.1, 2.0);
    auto none = make_record("x", 1.0, 1.0, 0.1, 3.0);
    none.id.reset();
    std::vector<BacktestCacheRecord> records = {unnamed, spaces, none};

    auto summary = score_backtest_parameters(records);
    EXPECT_TRUE(summary.availability_by_id.empty());
    EXPECT_EQ(summary.availability_by_record.size(), 3u);
    EXPECT_EQ(summary.scored.size(), 3u);
}

TEST_F(ParamEligibilityTest, EmptyInput) {
    auto summary = score_backtest_parameters({});
    EXPECT_TRUE(summary.scored.empty());
    EXPECT_TRUE(summary.availability_by_id.empty());
    EXPECT_TRUE(summary.availability_by_record.empty());
}

TEST_F(ParamEligibilityTest, AllIneligibleStillExplainsEveryRecord) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 1.0, 1.0, 0.1, 1.0, 3.0),
        make_record("b", 1.0, 1.0, 0.1, 2.0, 4.0),
    };
    auto summary = score_backtest_parameters(records);
    EXPECT_TRUE(summary.scored.empty());
    EXPECT_EQ(summary.availability_by_id.size(), 2u);
    for (const auto& a : summary.availability_by_record) EXPECT_FALSE(a.eligible);
}

// ===========================================================================
// 2. Core, drawdown and stability components
// ===========================================================================
class ParamComponentTest : public ::testing::Test {};

TEST_F(ParamComponentTest, HigherSharpeNeverRanksLowerInCore) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 0.5, 1.0, 0.1, 1.0),
        make_record("b", 1.5, 1.0, 0.1, 2.0),
    };
    auto summary = score_backtest_parameters(records);
    EXPECT_GT(find_by_x(summary, 2.0)->core_score, find_by_x(summary, 1.0)->core_score);
}

TEST_F(ParamComponentTest, IdenticalVerifyMetricsLeaveCoreUnchanged) {
    std::vector<BacktestCacheRecord> plain = {
        make_record("a", 0.5, 0.4, 0.1, 1.0),
        make_record("b", 1.5, 0.9, 0.3, 2.0),
        make_record("c", 1.0, 0.6, 0.2, 3.0),
    };
    auto verified = plain;
    for (auto& r : verified) {
        r.verify_sharpe_ratio = r.sharpe_ratio;
        r.verify_calmar_ratio = r.calmar_ratio;
        r.verify_total_return = r.total_return;
    }
    auto a = score_backtest_parameters(plain);
    auto b = score_backtest_parameters(verified);
    for (double x : {1.0, 2.0, 3.0}) {
        EXPECT_NEAR(find_by_x(a, x)->core_score, find_by_x(b, x)->core_score, 1e-12);
    }
}

TEST_F(ParamComponentTest, VerifyCagrStandsInForVerifyTotalReturn) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 0.5, 0.4, 0.1, 1.0),
        make_record("b", 1.5, 0.9, 0.3, 2.0),
    };
    // Verify metrics rank "a" first, the reverse of training.
    records[0].verify_sharpe_ratio = 2.0;
    records[0].verify_calmar_ratio = 2.0;
    records[0].verify_cagr = 0.5;
    records[1].verify_sharpe_ratio = 0.1;
    records[1].verify_calmar_ratio = 0.1;
    records[1].verify_cagr = 0.01;

    auto summary = score_backtest_parameters(records);
    auto a = find_by_x(summary, 1.0);
    auto b = find_by_x(summary, 2.0);
    // Blended: sqrt(core_train * core_verify) for both.
    EXPECT_NEAR(a->core_score, b->core_score, 1e-6);
}

TEST_F(ParamComponentTest, DrawdownPenaltyBlendsTrainingAndVerify) {
    std::vector<BacktestCacheRecord> records = {make_record("a", 1.0, 1.0, 0.1, 1.0)};
    records[0].max_drawdown_ratio = 0.2;
    auto summary = score_backtest_parameters(records);
    EXPECT_NEAR(summary.scored[0].dd_penalty, std::exp(-3.5 * 0.2), 1e-12);

    records[0].verify_max_drawdown_ratio = 0.4;
    summary = score_backtest_parameters(records);
    EXPECT_NEAR(summary.scored[0].dd_penalty,
                std::sqrt(std::exp(-3.5 * 0.2) * std::exp(-3.5 * 0.4)), 1e-12);
}

TEST_F(ParamComponentTest, SingleCandidateScoresCoreButNoStability) {
    std::vector<BacktestCacheRecord> records = {make_record("a", 1.0, 1.0, 0.1, 1.0)};
    auto summary = score_backtest_parameters(records);
    ASSERT_EQ(summary.scored.size(), 1u);
    const auto& r = summary.scored[0];
    EXPECT_NEAR(r.core_score, 1.0, 1e-8);
    EXPECT_DOUBLE_EQ(r.dd_penalty, 1.0);
    EXPECT_DOUBLE_EQ(r.stability_score, 0.0);
    EXPECT_DOUBLE_EQ(r.final_score, 0.0);
}

TEST_F(ParamComponentTest, EqualQualityNeighborsGetFullStability) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 1.0, 1.0, 0.1, 1.0),
        make_record("b", 1.0, 1.0, 0.1, 1.0),
    };
    auto summary = score_backtest_parameters(records);
    for (const auto& r : summary.scored) {
        EXPECT_DOUBLE_EQ(r.stability_score, 1.0);
        EXPECT_NEAR(r.final_score, r.core_score * r.dd_penalty, 1e-12);
    }
}

TEST_F(ParamComponentTest, ScoresStayInUnitInterval) {
    std::vector<BacktestCacheRecord> records;
    for (int i = 0; i < 12; ++i) {
        auto r = make_record("r" + std::to_string(i), std::sin(i) * 2.0, std::cos(i),
                             0.05 * i - 0.2, static_cast<double>(i % 4));
        r.max_drawdown_ratio = 0.05 * (i % 5);
        records.push_back(r);
    }
    auto summary = score_backtest_parameters(records);
    ASSERT_EQ(summary.scored.size(), records.size());
    for (const auto& r : summary.scored) {
        EXPECT_GE(r.stability_score, 0.0);
        EXPECT_LE(r.stability_score, 1.0);
        // The geometric core carries a 1e-9 lift per percentile.
        EXPECT_GE(r.core_score * r.dd_penalty, 0.0);
        EXPECT_LE(r.core_score * r.dd_penalty, 1.0 + 1e-8);
        EXPECT_GE(r.final_score, 0.0);
        EXPECT_LE(r.final_score, 1.0 + 1e-8);
    }
    for (size_t i = 1; i < summary.scored.size(); ++i) {
        EXPECT_GE(summary.scored[i - 1].final_score, summary.scored[i].final_score);
    }
}

TEST_F(ParamComponentTest, StabilityGammaOverride) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a", 1.0, 1.0, 0.1, 1.0),
        make_record("b", 2.0, 2.0, 0.2, 1.0),
    };
    ParamScoreOptions options;
    options.overrides.stability_gamma = 0.0;
    auto summary = score_backtest_parameters(records, options);
    for (const auto& r : summary.scored) {
        EXPECT_NEAR(r.final_score, r.core_score * r.dd_penalty, 1e-12);
    }
}

// ===========================================================================
// 3. End-to-end ranking
// ===========================================================================
class ParamRankingTest : public ::testing::Test {
protected:
    std::vector<BacktestCacheRecord> records;

    void SetUp() override {
        records = {
            make_record("c1", 1.0, 1.0, 0.20, 10.0, 100.0),
            make_record("c2", 1.2, 1.1, 0.25, 10.5, 100.0),
            make_record("c3", 0.3, 0.2, 0.05, 90.0, 100.0),
        };
        for (auto& r : records) {
            r.template_id = "t1";
            r.parameters = {{"p", numeric_param(r.parameters, "x").value()}};
        }
    }
};

TEST_F(ParamRankingTest, CloseCandidatesSupportEachOther) {
    // p spread (p90 - p10) is 0.5, so candidates 1 and 2 sit exactly one
    // scale apart.
    auto summary = score_backtest_parameters(records, with_threshold(1.0));
    ASSERT_EQ(summary.scored.size(), 3u);

    double stab[3] = {0.0, 0.0, 0.0};
    size_t rank_of[3] = {0, 0, 0};
    for (size_t i = 0; i < summary.scored.size(); ++i) {
        stab[summary.scored[i].record_index] = summary.scored[i].stability_score;
        rank_of[summary.scored[i].record_index] = i;
    }
    EXPECT_GT(stab[0], stab[2]);
    EXPECT_GT(stab[1], stab[2]);
    EXPECT_DOUBLE_EQ(stab[2], 0.0);
    EXPECT_LT(rank_of[1], rank_of[2]);
    EXPECT_LT(rank_of[0], rank_of[2]);
}

TEST_F(ParamRankingTest, DefaultThresholdLeavesAllIsolated) {
    auto summary = score_backtest_parameters(records);
    for (const auto& r : summary.scored) {
        EXPECT_DOUBLE_EQ(r.stability_score, 0.0);
        EXPECT_DOUBLE_EQ(r.final_score, 0.0);
    }
    // Stable order on equal final scores.
    EXPECT_EQ(summary.scored[0].record_index, 0u);
    EXPECT_EQ(summary.scored[1].record_index, 1u);
    EXPECT_EQ(summary.scored[2].record_index, 2u);
}

TEST_F(ParamRankingTest, ThresholdFromSettingsLookup) {
    InMemorySettingsLookup lookup;
    lookup.set("PARAM_SCORE_NEIGHBOR_THRESHOLD", "1.0");
    ParamScoreOptions options;
    options.settings_lookup = &lookup;
    auto summary = score_backtest_parameters(records, options);
    EXPECT_GT(summary.scored[0].final_score, 0.0);
}

// ===========================================================================
// 4. Best parameter set per template
// ===========================================================================
class BestParamsByTemplateTest : public ::testing::Test {};

TEST_F(BestParamsByTemplateTest, TopRankedPerTemplateWithGlobalIndex) {
    std::vector<BacktestCacheRecord> records = {
        make_record("a1", 1.0, 1.0, 0.1, 1.0),
        make_record("b1", 1.0, 1.0, 0.1, 1.0),
        make_record("a2", 2.0, 2.0, 0.2, 1.0),
        make_record("b2", 0.5, 0.5, 0.05, 1.0),
        make_record("c1", 2.0, 2.0, 0.2, 1.0, 1.0),
    };
    records[0].template_id = "A";
    records[2].template_id = "A";
    records[1].template_id = "B";
    records[3].template_id = "B";
    records[4].template_id = "C";  // ineligible

    // Rank on core x drawdown alone.
    ParamScoreOptions options;
    options.overrides.stability_gamma = 0.0;
    auto best = best_params_by_template(records, options);
    ASSERT_EQ(best.size(), 2u);
    EXPECT_EQ(best.at("A").record_index, 2u);
    EXPECT_EQ(best.at("B").record_index, 1u);
    EXPECT_EQ(best.count("C"), 0u);
}
