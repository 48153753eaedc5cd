// src/backtest/backtest_coordinator.cpp

#include "stratlab/backtest/backtest_coordinator.hpp"

#include <utility>
#include "stratlab/backtest/trade_simulator.hpp"
#include "stratlab/core/logger.hpp"

namespace stratlab {
namespace backtest {

BacktestCoordinator::BacktestCoordinator(BacktestConfig config,
                                         PortfolioOptConfig optimizer_config,
                                         RankingConvention convention)
    : config_(std::move(config)),
      comparator_(std::make_unique<StrategyComparator>(config_, convention)),
      optimizer_(std::make_unique<PortfolioOptimizer>(std::move(optimizer_config))) {}

Result<BacktestResult> BacktestCoordinator::run_backtest(const StrategyDefinition& strategy,
                                                         const std::vector<Bar>& bars) const {
    TradeSimulator simulator(config_, strategy);
    return simulator.run(bars);
}

Result<ComparativeBacktestResult> BacktestCoordinator::run_comparison(
    const std::vector<StrategyDefinition>& strategies, const std::vector<Bar>& bars,
    const std::vector<int>& windows) const {
    Logger::register_component("BacktestCoordinator");

    auto comparison = comparator_->compare(strategies, bars, windows);
    if (comparison.is_error()) {
        return make_error<ComparativeBacktestResult>(comparison.error()->code(),
                                                     comparison.error()->what(),
                                                     "BacktestCoordinator");
    }

    ComparativeBacktestResult result;
    result.comparison = comparison.take_value();

    const auto& ranked = result.comparison.strategies;
    std::vector<StrategyEstimate> estimates;
    estimates.reserve(ranked.size());
    for (const auto& strategy : ranked) {
        StrategyEstimate estimate;
        estimate.name = strategy.strategy_name;
        estimate.expected_return = strategy.mean_annualized_return;
        estimate.volatility = strategy.mean_volatility;
        estimate.max_drawdown = strategy.max_drawdown;
        estimates.push_back(estimate);
    }

    const auto& matrix = result.comparison.correlation_matrix;
    std::vector<std::vector<double>> correlation(static_cast<size_t>(matrix.rows()),
                                                 std::vector<double>(static_cast<size_t>(matrix.cols())));
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            correlation[static_cast<size_t>(i)][static_cast<size_t>(j)] = matrix(i, j);
        }
    }

    auto portfolio = optimizer_->optimize(estimates, correlation);
    if (portfolio.is_error()) {
        ERROR("Portfolio optimization failed: " << portfolio.error()->to_string());
        return make_error<ComparativeBacktestResult>(portfolio.error()->code(),
                                                     portfolio.error()->what(),
                                                     "BacktestCoordinator");
    }
    result.optimal_portfolio = portfolio.take_value();

    INFO("Optimal portfolio: expected return " << result.optimal_portfolio.expected_return
                                               << ", volatility "
                                               << result.optimal_portfolio.expected_volatility
                                               << ", Sharpe "
                                               << result.optimal_portfolio.sharpe_ratio);
    return result;
}

Result<SimulationResult> BacktestCoordinator::run_monte_carlo(const StrategyDefinition& strategy,
                                                              const std::vector<Bar>& bars,
                                                              const MonteCarloConfig& config) const {
    MonteCarloSimulator simulator(config_, config);
    return simulator.run(strategy, bars);
}

}  // namespace backtest
}  // namespace stratlab
