// include/stratlab/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <utility>
#include <vector>
#include "stratlab/backtest/backtest_types.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * Works from the closed trades and the per-bar equity curve of a run.
 * All methods are const and have no side effects; no logging.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    /**
     * @brief Fill every metric field of a result from its trades and equity curve
     * @param result Result whose closed_trades and equity_curve are already set
     * @param initial_capital Starting capital of the run
     * @param risk_free_rate Annual risk-free rate
     */
    void calculate_metrics(BacktestResult& result, double initial_capital,
                           double risk_free_rate) const;

    // ========== Return Calculations ==========

    /**
     * @brief Bar-over-bar percentage changes of equity
     * @return Empty for fewer than two points
     */
    std::vector<double> calculate_returns_from_equity(
        const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Compound annual growth rate over the curve's time span
     * @return 0 when the span is zero or the final equity is not positive
     */
    double calculate_annualized_return(double initial_capital,
                                       const std::vector<EquityPoint>& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief Per-period Sharpe ratio: (mean - rf / 252) / stdev
     * @return 0 when the standard deviation is zero
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double risk_free_rate) const;

    /**
     * @brief Mean return over the deviation of negative returns
     */
    RatioValue calculate_sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Return on initial capital over max drawdown, 0 without drawdown
     */
    double calculate_calmar_ratio(double total_return, double initial_capital,
                                  double max_drawdown) const;

    // ========== Drawdown and Tail Risk ==========

    double calculate_max_drawdown(const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Historical 95% VaR: the return at index floor(n * 0.05) of the sorted returns
     */
    double calculate_var_95(const std::vector<double>& returns) const;

    /**
     * @brief Mean of the sorted returns up to and including the VaR index
     */
    double calculate_cvar_95(const std::vector<double>& returns) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        int push_trades = 0;
        int partial_wins = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;
        double total_profit = 0.0;
        double total_loss = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double avg_duration_hours = 0.0;
        double total_commission = 0.0;
        double total_slippage = 0.0;
        double total_costs = 0.0;
    };

    /**
     * @brief Win/loss counts and sums; pushes are excluded from wins and losses
     */
    TradeStatistics calculate_trade_statistics(const std::vector<Trade>& trades) const;

    /**
     * @brief p - (1 - p) * avgLoss / avgWin, 0 without both wins and losses
     */
    double calculate_kelly_criterion(const TradeStatistics& stats) const;

    /**
     * @brief Longest win streak and loss streak; a push resets both
     * @return (max wins, max losses)
     */
    std::pair<int, int> calculate_consecutive_streaks(const std::vector<Trade>& trades) const;

    /**
     * @brief Return and volatility per UTC calendar month
     *
     * Volatility is the stdev of intra-month returns scaled by sqrt(21).
     * Months with fewer than two points are skipped.
     */
    std::vector<MonthlyReturn> calculate_monthly_returns(
        const std::vector<EquityPoint>& equity_curve) const;

    // ========== Helpers ==========

    static double calculate_mean(const std::vector<double>& values);

    /**
     * @brief Population standard deviation, 0 for fewer than two values
     */
    static double calculate_std_dev(const std::vector<double>& values);
};

}  // namespace backtest
}  // namespace stratlab
