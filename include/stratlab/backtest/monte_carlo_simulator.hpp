// include/stratlab/backtest/monte_carlo_simulator.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "stratlab/backtest/backtest_config.hpp"
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/error.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Configuration for Monte Carlo cost perturbation
 */
struct MonteCarloConfig : public ConfigBase {
    int num_simulations{1000};
    double variation{0.2};      // Factors drawn from 1 +/- variation / 2
    uint32_t seed{42};
    int max_concurrency{4};     // Trials in flight at once

    std::string version{"1.0.0"};

    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Outcome distribution of a Monte Carlo batch
 *
 * Return statistics are in percent of initial capital.
 */
struct SimulationResult {
    int requested_simulations = 0;
    int total_simulations = 0;  // Trials that completed
    int failed_simulations = 0;

    double mean_return = 0.0;
    double std_return = 0.0;
    double percentile_5 = 0.0;
    double percentile_95 = 0.0;
    double success_rate = 0.0;  // Fraction of trials with positive return
    double mean_sharpe = 0.0;
    double worst_drawdown = 0.0;

    int best_index = -1;
    int worst_index = -1;
    std::optional<BacktestResult> best_simulation;
    std::optional<BacktestResult> worst_simulation;
};

/**
 * @brief Re-runs a strategy with randomly perturbed slippage and commission
 *
 * All perturbation factors are drawn up front from a seeded std::mt19937 in
 * trial order, so the outcome does not depend on how trials are scheduled.
 * Trials run on worker threads in batches of at most max_concurrency.
 */
class MonteCarloSimulator {
public:
    MonteCarloSimulator(BacktestConfig backtest_config, MonteCarloConfig config);

    /**
     * @brief Run the batch
     * @return Aggregates over the successful trials; STRATEGY_ERROR if none succeeded
     */
    Result<SimulationResult> run(const StrategyDefinition& strategy,
                                 const std::vector<Bar>& bars) const;

    /**
     * @brief (slippage factor, commission factor) for every trial
     */
    std::vector<std::pair<double, double>> draw_factors() const;

    /**
     * @brief Score used to pick the best and worst trial
     */
    double objective(const BacktestResult& result) const;

private:
    BacktestConfig backtest_config_;
    MonteCarloConfig config_;
};

}  // namespace backtest
}  // namespace stratlab
