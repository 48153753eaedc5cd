// include/stratlab/backtest/trade_simulator.hpp
#pragma once

#include <string>
#include <vector>
#include "stratlab/backtest/backtest_config.hpp"
#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/backtest/position_sizer.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/transaction_cost/cost_model.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Sequential per-bar simulation of one strategy over one bar series
 *
 * Each bar, in order:
 * 1. Solicit signals (once warm-up is complete)
 * 2. Close open trades: stop-loss, take-profit, opposing signal, time exit
 * 3. Open trades from filtered signals while below the position limit
 * 4. Mark open trades to market and append an equity point
 * 5. Flag a margin event if equity is below the margin requirement
 *
 * Trades still open on the last bar are closed at its close. The simulator
 * never reads a bar beyond the one being processed.
 */
class TradeSimulator {
public:
    TradeSimulator(BacktestConfig config, StrategyDefinition strategy);

    /**
     * @brief Run the simulation
     * @param bars Chronologically ordered bars; not modified
     * @return The full report, or an error for invalid configuration or data,
     *         or a provider exceeding its time budget
     */
    Result<BacktestResult> run(const std::vector<Bar>& bars) const;

    /**
     * @brief Check that the series is non-empty with strictly increasing timestamps
     */
    static Result<void> validate_bars(const std::vector<Bar>& bars);

    /**
     * @brief Trend, volatility and volume labels for the bar at `index`
     *
     * Looks at up to 20 preceding bars; returns no labels with fewer than 10.
     */
    static std::vector<std::string> analyze_market_conditions(const std::vector<Bar>& bars,
                                                              size_t index);

    const BacktestConfig& config() const {
        return config_;
    }

    const StrategyDefinition& strategy() const {
        return strategy_;
    }

private:
    /**
     * @brief Ask every provider for signals on the current window
     *
     * Confidence is scaled by the provider weight. A throwing provider is
     * logged and counted in `failures`.
     */
    Result<std::vector<signals::CandidateSignal>> collect_signals(const std::vector<Bar>& window,
                                                                  int& failures) const;

    std::optional<ExitReason> check_exit(const Trade& trade, const Bar& bar,
                                         const std::vector<signals::CandidateSignal>& signals) const;

    bool passes_filters(const signals::CandidateSignal& signal, Price entry_price) const;

    bool sizing_period_changed(const Timestamp& previous, const Timestamp& current) const;

    BacktestConfig config_;
    StrategyDefinition strategy_;
    transaction_cost::CostModel cost_model_;
    PositionSizer sizer_;
    BacktestMetricsCalculator metrics_calculator_;
};

}  // namespace backtest
}  // namespace stratlab
