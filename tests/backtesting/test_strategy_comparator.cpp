#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "../core/test_base.hpp"
#include "scripted_provider.hpp"
#include "stratlab/backtest/strategy_comparator.hpp"

using namespace stratlab;
using namespace stratlab::backtest;
using namespace stratlab::testing;

class StrategyComparatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_.risk_free_rate = 0.0;
        bars_ = make_bars(geometric_closes(40 * 24, 100.0, 0.0005));
    }

    StrategyDefinition periodic_strategy(const std::string& name, SignalDirection direction) {
        StrategyDefinition strategy;
        strategy.name = name;
        strategy.providers.push_back(
            {std::make_shared<PeriodicProvider>(name, direction, 10, 90.0, 0.02, 0.03), 1.0});
        return strategy;
    }

    std::vector<StrategyDefinition> both_directions() {
        return {periodic_strategy("short_fade", SignalDirection::SELL),
                periodic_strategy("long_trend", SignalDirection::BUY)};
    }

    static StrategyResult named_result(const std::string& name, double consistency) {
        StrategyResult result;
        result.strategy_name = name;
        result.consistency = consistency;
        return result;
    }

    BacktestConfig config_;
    std::vector<Bar> bars_;
    const std::vector<int> windows_ = {10, 30};
};

TEST_F(StrategyComparatorTest, RanksLongTrendFirstInUptrend) {
    StrategyComparator comparator(config_);
    auto report = comparator.compare(both_directions(), bars_, windows_);
    ASSERT_TRUE(report.is_ok()) << report.error()->to_string();

    const auto& ranked = report.value().strategies;
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].strategy_name, "long_trend");
    EXPECT_EQ(ranked[1].strategy_name, "short_fade");
    EXPECT_GT(ranked[0].composite_score, ranked[1].composite_score);
    EXPECT_EQ(report.value().convention, RankingConvention::HIGHER_IS_BETTER);
    EXPECT_EQ(report.value().summary.best_return, "long_trend");
    EXPECT_FALSE(report.value().recommendations.empty());
}

TEST_F(StrategyComparatorTest, LegacyConventionKeepsOrderWithNegatedScores) {
    StrategyComparator higher(config_);
    StrategyComparator legacy(config_, RankingConvention::LEGACY_LOWER_IS_BETTER);

    auto higher_report = higher.compare(both_directions(), bars_, windows_);
    auto legacy_report = legacy.compare(both_directions(), bars_, windows_);
    ASSERT_TRUE(higher_report.is_ok());
    ASSERT_TRUE(legacy_report.is_ok());

    const auto& a = higher_report.value().strategies;
    const auto& b = legacy_report.value().strategies;
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].strategy_name, b[i].strategy_name);
        EXPECT_DOUBLE_EQ(a[i].composite_score, -b[i].composite_score);
    }
    EXPECT_LT(b[0].composite_score, b[1].composite_score);
    EXPECT_TRUE(ranks_before(b[0], b[1], RankingConvention::LEGACY_LOWER_IS_BETTER));
    EXPECT_TRUE(ranks_before(a[0], a[1], RankingConvention::HIGHER_IS_BETTER));
}

TEST_F(StrategyComparatorTest, OnePeriodPerWindow) {
    StrategyComparator comparator(config_);
    auto result =
        comparator.evaluate_strategy(periodic_strategy("long_trend", SignalDirection::BUY), bars_,
                                     windows_);
    ASSERT_TRUE(result.is_ok());

    const auto& periods = result.value().periods;
    ASSERT_EQ(periods.size(), 2u);
    EXPECT_EQ(periods[0].period, "10D");
    EXPECT_EQ(periods[1].period, "30D");
    EXPECT_EQ(periods[1].days, 30);
    EXPECT_GT(periods[1].total_trades, periods[0].total_trades);
    EXPECT_GE(periods[0].annualized_volatility, 0.0);
    EXPECT_EQ(result.value().regime_performance.size(), 5u);
    EXPECT_GE(result.value().consistency, 0.0);
    EXPECT_LE(result.value().consistency, 1.0);
    // Returns of the 30 day window: 721 bars
    EXPECT_EQ(result.value().equity_returns.size(), 720u);
}

TEST_F(StrategyComparatorTest, ShortWindowRunsWithoutTrades) {
    StrategyComparator comparator(config_);
    auto result = comparator.evaluate_strategy(
        periodic_strategy("long_trend", SignalDirection::BUY), bars_, {1});
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().periods.size(), 1u);
    EXPECT_EQ(result.value().periods[0].total_trades, 0);
}

TEST_F(StrategyComparatorTest, RejectsEmptyInputs) {
    StrategyComparator comparator(config_);

    auto no_strategies = comparator.compare({}, bars_, windows_);
    ASSERT_TRUE(no_strategies.is_error());
    EXPECT_EQ(no_strategies.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto no_windows = comparator.evaluate_strategy(
        periodic_strategy("long_trend", SignalDirection::BUY), bars_, {});
    ASSERT_TRUE(no_windows.is_error());
    EXPECT_EQ(no_windows.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto negative_window = comparator.evaluate_strategy(
        periodic_strategy("long_trend", SignalDirection::BUY), bars_, {30, -5});
    ASSERT_TRUE(negative_window.is_error());
    EXPECT_EQ(negative_window.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StrategyComparatorTest, SimulationErrorsPropagate) {
    StrategyComparator comparator(config_);
    auto result = comparator.compare(both_directions(), {}, windows_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(StrategyComparatorTest, SliceWindowKeepsTrailingDays) {
    auto slice = StrategyComparator::slice_window(bars_, 1);
    ASSERT_EQ(slice.size(), 25u);
    EXPECT_EQ(slice.back().timestamp, bars_.back().timestamp);
    EXPECT_TRUE(StrategyComparator::slice_window(bars_, 0).empty());
    EXPECT_EQ(StrategyComparator::slice_window(bars_, 365).size(), bars_.size());
}

TEST_F(StrategyComparatorTest, RegimePerformanceMapsConditionLabels) {
    Trade bull;
    bull.entry_price = 100.0;
    bull.quantity = 1.0;
    bull.pnl = 10.0;
    bull.market_conditions = {"strong_uptrend", "low_volatility", "high_volume"};

    Trade bear;
    bear.entry_price = 50.0;
    bear.quantity = 2.0;
    bear.pnl = -5.0;
    bear.market_conditions = {"downtrend", "high_volatility"};

    auto regimes = StrategyComparator::calculate_regime_performance({bull, bear});
    ASSERT_EQ(regimes.size(), 5u);

    auto find = [&regimes](const std::string& name) {
        for (const auto& regime : regimes) {
            if (regime.regime == name)
                return regime.performance;
        }
        return std::nan("");
    };
    EXPECT_NEAR(find("bull_market"), 0.10, 1e-12);
    EXPECT_NEAR(find("low_volatility"), 0.10, 1e-12);
    EXPECT_NEAR(find("bear_market"), -0.05, 1e-12);
    EXPECT_NEAR(find("high_volatility"), -0.05, 1e-12);
    EXPECT_DOUBLE_EQ(find("sideways"), 0.0);
}

TEST_F(StrategyComparatorTest, ConsistencyAndRiskAdjustedPerformance) {
    PeriodResult a;
    a.annualized_return = 0.2;
    a.sharpe_ratio = 1.0;
    a.max_drawdown = 0.1;
    PeriodResult b = a;
    b.sharpe_ratio = 2.0;
    b.max_drawdown = 0.25;

    EXPECT_DOUBLE_EQ(StrategyComparator::calculate_consistency({a, b}), 1.0);
    // (1 + 2 + 0.2) / (1 + 0.25)
    EXPECT_NEAR(StrategyComparator::calculate_risk_adjusted_performance({a, b}), 3.2 / 1.25,
                1e-12);

    b.annualized_return = 1.2;
    // Standard deviation of {0.2, 1.2} is 0.5
    EXPECT_NEAR(StrategyComparator::calculate_consistency({a, b}), 1.0 / 1.25, 1e-12);
}

TEST_F(StrategyComparatorTest, CompositeWeightsComponents) {
    StrategyResult result;
    result.risk_adjusted_performance = 2.0;
    result.consistency = 0.5;
    result.regime_performance = {{"bull_market", 0.5}, {"bear_market", -0.25},
                                 {"sideways", 0.0},    {"high_volatility", 0.0},
                                 {"low_volatility", 0.0}};
    EXPECT_NEAR(StrategyComparator::calculate_composite(result), 1.0 + 0.15 + 0.2 * 0.05, 1e-12);
}

TEST_F(StrategyComparatorTest, CorrelationMatrix) {
    auto a = named_result("a", 1.0);
    a.equity_returns = {0.01, -0.02, 0.03, 0.0};
    auto b = named_result("b", 1.0);
    b.equity_returns = {0.02, -0.04, 0.06, 0.0};
    auto c = named_result("c", 1.0);
    c.equity_returns = {-0.01, 0.02, -0.03, 0.0};
    auto flat = named_result("flat", 1.0);
    flat.equity_returns = {0.0, 0.0, 0.0, 0.0};

    auto matrix = StrategyComparator::calculate_correlation_matrix({a, b, c, flat});
    ASSERT_EQ(matrix.rows(), 4);
    ASSERT_EQ(matrix.cols(), 4);
    for (int i = 0; i < 4; ++i) {
        EXPECT_DOUBLE_EQ(matrix(i, i), 1.0);
    }
    EXPECT_NEAR(matrix(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(matrix(0, 2), -1.0, 1e-12);
    EXPECT_NEAR(matrix(1, 0), matrix(0, 1), 1e-12);
    EXPECT_DOUBLE_EQ(matrix(0, 3), 0.0);

    // Mismatched lengths fall back to identity
    c.equity_returns.pop_back();
    auto fallback = StrategyComparator::calculate_correlation_matrix({a, c});
    EXPECT_TRUE(fallback.isApprox(Eigen::MatrixXd::Identity(2, 2)));
}

TEST_F(StrategyComparatorTest, RecommendationsFollowRanking) {
    std::vector<StrategyResult> ranked = {named_result("first", 0.9), named_result("second", 0.8),
                                          named_result("third", 0.3)};
    auto recommendations = StrategyComparator::recommend(ranked);

    ASSERT_EQ(recommendations.size(), 4u);
    EXPECT_NE(recommendations[0].find("40-60% to first"), std::string::npos);
    EXPECT_NE(recommendations[1].find("Diversify with second"), std::string::npos);
    EXPECT_NE(recommendations[2].find("third"), std::string::npos);
    EXPECT_NE(recommendations[3].find("caution with third"), std::string::npos);

    EXPECT_TRUE(StrategyComparator::recommend({}).empty());
}

TEST_F(StrategyComparatorTest, SummaryPicksLeaders) {
    auto steady = named_result("steady", 0.95);
    steady.max_drawdown = 0.05;
    steady.mean_annualized_return = 0.1;
    steady.mean_win_rate = 0.7;
    steady.risk_adjusted_performance = 1.0;

    auto aggressive = named_result("aggressive", 0.4);
    aggressive.max_drawdown = 0.3;
    aggressive.mean_annualized_return = 0.5;
    aggressive.mean_win_rate = 0.5;
    aggressive.risk_adjusted_performance = 1.5;

    auto summary = StrategyComparator::summarize({aggressive, steady});
    EXPECT_EQ(summary.best_risk_adjusted, "aggressive");
    EXPECT_EQ(summary.best_return, "aggressive");
    EXPECT_EQ(summary.best_win_rate, "steady");
    EXPECT_EQ(summary.lowest_drawdown, "steady");
    EXPECT_EQ(summary.most_consistent, "steady");
}
