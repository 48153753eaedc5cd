// src/backtest/monte_carlo_simulator.cpp

#include "stratlab/backtest/monte_carlo_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include "stratlab/backtest/trade_simulator.hpp"
#include "stratlab/core/logger.hpp"

namespace stratlab {
namespace backtest {

namespace {

// Summary kept per trial; full results only for the best and worst
struct TrialOutcome {
    int index = 0;
    double return_pct = 0.0;
    double sharpe = 0.0;
    double max_drawdown = 0.0;
    double objective = 0.0;
};

// Written by exactly one worker thread, read after join
struct TrialSlot {
    std::optional<BacktestResult> result;
    std::string error;
};

}  // namespace

Result<void> MonteCarloConfig::validate() const {
    if (num_simulations < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "num_simulations must be at least 1", "MonteCarloConfig");
    }
    if (variation < 0.0 || variation > 2.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "variation must be in [0, 2]",
                                "MonteCarloConfig");
    }
    if (max_concurrency < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_concurrency must be at least 1", "MonteCarloConfig");
    }
    return Result<void>();
}

nlohmann::json MonteCarloConfig::to_json() const {
    nlohmann::json j;
    j["num_simulations"] = num_simulations;
    j["variation"] = variation;
    j["seed"] = seed;
    j["max_concurrency"] = max_concurrency;
    j["version"] = version;
    return j;
}

void MonteCarloConfig::from_json(const nlohmann::json& j) {
    if (j.contains("num_simulations"))
        num_simulations = j.at("num_simulations").get<int>();
    if (j.contains("variation"))
        variation = j.at("variation").get<double>();
    if (j.contains("seed"))
        seed = j.at("seed").get<uint32_t>();
    if (j.contains("max_concurrency"))
        max_concurrency = j.at("max_concurrency").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

MonteCarloSimulator::MonteCarloSimulator(BacktestConfig backtest_config, MonteCarloConfig config)
    : backtest_config_(std::move(backtest_config)), config_(std::move(config)) {}

std::vector<std::pair<double, double>> MonteCarloSimulator::draw_factors() const {
    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<std::pair<double, double>> factors;
    factors.reserve(static_cast<size_t>(std::max(0, config_.num_simulations)));
    for (int i = 0; i < config_.num_simulations; ++i) {
        double slippage_factor = 1.0 + (uniform(rng) - 0.5) * config_.variation;
        double commission_factor = 1.0 + (uniform(rng) - 0.5) * config_.variation;
        factors.emplace_back(slippage_factor, commission_factor);
    }
    return factors;
}

double MonteCarloSimulator::objective(const BacktestResult& result) const {
    switch (backtest_config_.optimization_target) {
        case OptimizationTarget::SHARPE:
            return result.sharpe_ratio;
        case OptimizationTarget::SORTINO:
            if (result.sortino_ratio.state == RatioState::NO_DOWNSIDE) {
                return std::numeric_limits<double>::infinity();
            }
            if (result.sortino_ratio.state == RatioState::INSUFFICIENT_DATA) {
                return -std::numeric_limits<double>::infinity();
            }
            return result.sortino_ratio.value;
        default:
            return result.total_return_percent;
    }
}

Result<SimulationResult> MonteCarloSimulator::run(const StrategyDefinition& strategy,
                                                  const std::vector<Bar>& bars) const {
    Logger::register_component("MonteCarloSimulator");

    auto valid = config_.validate();
    if (valid.is_error()) {
        return make_error<SimulationResult>(valid.error()->code(), valid.error()->what(),
                                            "MonteCarloSimulator");
    }

    const double base_slippage = strategy.slippage.value_or(backtest_config_.costs.slippage);
    const double base_commission =
        strategy.commission.value_or(backtest_config_.costs.commission_rate);
    const auto factors = draw_factors();

    SimulationResult summary;
    summary.requested_simulations = config_.num_simulations;

    std::vector<TrialOutcome> outcomes;
    outcomes.reserve(factors.size());

    auto run_trial = [&](int index) -> Result<BacktestResult> {
        StrategyDefinition varied = strategy;
        varied.name = strategy.name + "_sim_" + std::to_string(index);
        varied.slippage = base_slippage * factors[static_cast<size_t>(index)].first;
        varied.commission = base_commission * factors[static_cast<size_t>(index)].second;
        TradeSimulator simulator(backtest_config_, std::move(varied));
        return simulator.run(bars);
    };

    const int total = config_.num_simulations;
    for (int batch_start = 0; batch_start < total; batch_start += config_.max_concurrency) {
        int batch_end = std::min(total, batch_start + config_.max_concurrency);

        std::vector<TrialSlot> slots(static_cast<size_t>(batch_end - batch_start));
        std::vector<std::thread> workers;
        workers.reserve(slots.size());
        for (int i = batch_start; i < batch_end; ++i) {
            workers.emplace_back([&, i]() {
                TrialSlot& slot = slots[static_cast<size_t>(i - batch_start)];
                try {
                    auto trial = run_trial(i);
                    if (trial.is_error()) {
                        slot.error = trial.error()->what();
                    } else {
                        slot.result = trial.take_value();
                    }
                } catch (const std::exception& e) {
                    slot.error = std::string("threw: ") + e.what();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        // Collected in trial order so best/worst ties resolve deterministically
        for (int i = batch_start; i < batch_end; ++i) {
            TrialSlot& slot = slots[static_cast<size_t>(i - batch_start)];
            if (!slot.result) {
                summary.failed_simulations++;
                WARN("Monte Carlo trial " << i << " failed: " << slot.error);
                continue;
            }

            BacktestResult& result = *slot.result;
            TrialOutcome outcome;
            outcome.index = i;
            outcome.return_pct = result.total_return_percent;
            outcome.sharpe = result.sharpe_ratio;
            outcome.max_drawdown = result.max_drawdown;
            outcome.objective = objective(result);

            if (!summary.best_simulation || outcome.objective > objective(*summary.best_simulation)) {
                summary.best_index = i;
                summary.best_simulation = result;
            }
            if (!summary.worst_simulation ||
                outcome.objective < objective(*summary.worst_simulation)) {
                summary.worst_index = i;
                summary.worst_simulation = std::move(result);
            }
            outcomes.push_back(outcome);
        }
    }

    if (outcomes.empty()) {
        return make_error<SimulationResult>(
            ErrorCode::STRATEGY_ERROR,
            "All " + std::to_string(total) + " Monte Carlo trials of " + strategy.name + " failed",
            "MonteCarloSimulator");
    }

    std::vector<double> returns;
    std::vector<double> sharpes;
    returns.reserve(outcomes.size());
    sharpes.reserve(outcomes.size());
    int positive = 0;
    for (const auto& outcome : outcomes) {
        returns.push_back(outcome.return_pct);
        sharpes.push_back(outcome.sharpe);
        summary.worst_drawdown = std::max(summary.worst_drawdown, outcome.max_drawdown);
        if (outcome.return_pct > 0.0) {
            ++positive;
        }
    }

    const size_t n = returns.size();
    summary.total_simulations = static_cast<int>(n);
    summary.mean_return = BacktestMetricsCalculator::calculate_mean(returns);
    summary.std_return = BacktestMetricsCalculator::calculate_std_dev(returns);
    summary.mean_sharpe = BacktestMetricsCalculator::calculate_mean(sharpes);
    summary.success_rate = static_cast<double>(positive) / static_cast<double>(n);

    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());
    summary.percentile_5 =
        sorted_returns[std::min(static_cast<size_t>(std::floor(n * 0.05)), n - 1)];
    summary.percentile_95 =
        sorted_returns[std::min(static_cast<size_t>(std::floor(n * 0.95)), n - 1)];

    INFO("Monte Carlo for " << strategy.name << ": " << summary.total_simulations << "/"
                            << total << " trials, mean return " << summary.mean_return
                            << "%, success rate " << summary.success_rate);
    return summary;
}

}  // namespace backtest
}  // namespace stratlab
