// include/stratlab/backtest/strategy_comparator.hpp
#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "stratlab/backtest/backtest_config.hpp"
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief One strategy's results over one lookback window
 */
struct PeriodResult {
    std::string period;  // e.g. "30D"
    int days = 0;
    double total_return = 0.0;  // Fraction of initial capital
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double average_win = 0.0;
    double average_loss = 0.0;
    int total_trades = 0;
    double expectancy = 0.0;
    double calmar_ratio = 0.0;
    RatioValue sortino_ratio;
    double annualized_return = 0.0;
    double annualized_volatility = 0.0;
};

struct RegimePerformance {
    std::string regime;
    double performance = 0.0;  // Sum of trade return fractions
};

/**
 * @brief Aggregated results of one strategy across all windows
 */
struct StrategyResult {
    std::string strategy_name;
    std::vector<PeriodResult> periods;
    double risk_adjusted_performance = 0.0;
    double consistency = 0.0;
    std::vector<RegimePerformance> regime_performance;
    double composite_score = 0.0;  // Stored under the active ranking convention

    double mean_annualized_return = 0.0;
    double mean_volatility = 0.0;
    double max_drawdown = 0.0;  // Worst across windows
    double mean_win_rate = 0.0;

    // Bar-over-bar equity returns of the longest window
    std::vector<double> equity_returns;
};

/**
 * @brief Direction of the stored composite score
 *
 * Both conventions produce the same ordering; LEGACY_LOWER_IS_BETTER stores
 * the negated composite for consumers that expect ascending scores.
 */
enum class RankingConvention { HIGHER_IS_BETTER, LEGACY_LOWER_IS_BETTER };

/**
 * @brief True when `a` should be ranked ahead of `b`
 */
bool ranks_before(const StrategyResult& a, const StrategyResult& b,
                  RankingConvention convention);

struct ComparisonSummary {
    std::string best_risk_adjusted;
    std::string best_return;
    std::string best_win_rate;
    std::string lowest_drawdown;
    std::string most_consistent;
};

/**
 * @brief Ranked comparison of a set of strategies
 */
struct ComparisonReport {
    std::vector<StrategyResult> strategies;  // Best first
    ComparisonSummary summary;
    std::vector<std::string> recommendations;
    Eigen::MatrixXd correlation_matrix;  // Same order as strategies
    RankingConvention convention = RankingConvention::HIGHER_IS_BETTER;
};

/**
 * @brief Runs each strategy over several lookback windows and ranks them
 *
 * composite = 0.5 * risk-adjusted performance + 0.3 * consistency
 *           + 0.2 * mean regime performance
 */
class StrategyComparator {
public:
    static const std::vector<int>& default_windows();

    explicit StrategyComparator(BacktestConfig config,
                                RankingConvention convention = RankingConvention::HIGHER_IS_BETTER);

    /**
     * @brief Evaluate and rank all strategies
     * @param strategies Strategies to compare, at least one
     * @param bars Full bar series; each window is cut from its end
     * @param windows Lookback windows in days
     * @return The ranked report, or the first run error
     */
    Result<ComparisonReport> compare(const std::vector<StrategyDefinition>& strategies,
                                     const std::vector<Bar>& bars,
                                     const std::vector<int>& windows = default_windows()) const;

    /**
     * @brief Evaluate one strategy over every window
     */
    Result<StrategyResult> evaluate_strategy(const StrategyDefinition& strategy,
                                             const std::vector<Bar>& bars,
                                             const std::vector<int>& windows) const;

    /**
     * @brief Bars whose timestamp lies within `days` of the final bar
     */
    static std::vector<Bar> slice_window(const std::vector<Bar>& bars, int days);

    /**
     * @brief Sum of trade return fractions per market regime
     *
     * Regimes: bull_market, bear_market, sideways, high_volatility, low_volatility.
     */
    static std::vector<RegimePerformance> calculate_regime_performance(
        const std::vector<Trade>& trades);

    static double calculate_risk_adjusted_performance(const std::vector<PeriodResult>& periods);

    static double calculate_consistency(const std::vector<PeriodResult>& periods);

    /**
     * @brief Composite score with the higher-is-better sign
     */
    static double calculate_composite(const StrategyResult& result);

    /**
     * @brief Pearson correlation of the strategies' equity returns
     *
     * Falls back to the identity matrix when the series differ in length or
     * have fewer than two points.
     */
    static Eigen::MatrixXd calculate_correlation_matrix(
        const std::vector<StrategyResult>& strategies);

    static ComparisonSummary summarize(const std::vector<StrategyResult>& ranked);

    static std::vector<std::string> recommend(const std::vector<StrategyResult>& ranked);

    RankingConvention convention() const {
        return convention_;
    }

private:
    double periods_per_year() const;

    BacktestConfig config_;
    RankingConvention convention_;
};

}  // namespace backtest
}  // namespace stratlab
