// include/stratlab/backtest/backtest_coordinator.hpp
#pragma once

#include <memory>
#include <vector>
#include "stratlab/backtest/backtest_config.hpp"
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/backtest/monte_carlo_simulator.hpp"
#include "stratlab/backtest/strategy_comparator.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/optimization/portfolio_optimizer.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Ranked strategy comparison together with the suggested allocation
 */
struct ComparativeBacktestResult {
    ComparisonReport comparison;
    OptimalPortfolio optimal_portfolio;
};

/**
 * @brief Central orchestrator for backtest components
 *
 * Owns the simulator configuration and wires the layers together:
 * - TradeSimulator: single runs
 * - StrategyComparator: multi-window runs and ranking
 * - PortfolioOptimizer: allocation over the comparison results
 * - MonteCarloSimulator: cost perturbation batches
 *
 * Lower layers never call back into this class.
 */
class BacktestCoordinator {
public:
    explicit BacktestCoordinator(BacktestConfig config,
                                 PortfolioOptConfig optimizer_config = PortfolioOptConfig(),
                                 RankingConvention convention = RankingConvention::HIGHER_IS_BETTER);

    /**
     * @brief Run one strategy over the full series
     */
    Result<BacktestResult> run_backtest(const StrategyDefinition& strategy,
                                        const std::vector<Bar>& bars) const;

    /**
     * @brief Compare strategies, then allocate across them
     *
     * The optimizer receives each strategy's mean annualized return and
     * volatility across windows and the comparison's correlation matrix.
     */
    Result<ComparativeBacktestResult> run_comparison(
        const std::vector<StrategyDefinition>& strategies, const std::vector<Bar>& bars,
        const std::vector<int>& windows = StrategyComparator::default_windows()) const;

    Result<SimulationResult> run_monte_carlo(const StrategyDefinition& strategy,
                                             const std::vector<Bar>& bars,
                                             const MonteCarloConfig& config) const;

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestConfig config_;
    std::unique_ptr<StrategyComparator> comparator_;
    std::unique_ptr<PortfolioOptimizer> optimizer_;
};

}  // namespace backtest
}  // namespace stratlab
