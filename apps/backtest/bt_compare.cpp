// apps/backtest/bt_compare.cpp
//
// Compares the reference strategies on a synthetic hourly series, allocates
// across them and stress-tests the top-ranked one.
//
// Usage: bt_compare [backtest_config.json] [monte_carlo_config.json]

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <vector>
#include "stratlab/backtest/backtest_coordinator.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"
#include "stratlab/signals/ema_crossover_provider.hpp"
#include "stratlab/signals/zscore_reversion_provider.hpp"

using namespace stratlab;
using namespace stratlab::backtest;

namespace {

std::vector<Bar> synthesize_bars(size_t count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 0.004);

    std::vector<Bar> bars;
    bars.reserve(count);
    auto start = std::chrono::system_clock::from_time_t(1704067200);  // 2024-01-01 UTC
    double price = 100.0;

    for (size_t i = 0; i < count; ++i) {
        // Slow regime cycle on top of a random walk
        double drift = 0.0004 * std::sin(static_cast<double>(i) / 400.0);
        double open = price;
        price = std::max(1.0, price * (1.0 + drift + noise(rng)));
        double high = std::max(open, price) * (1.0 + std::abs(noise(rng)) / 2.0);
        double low = std::min(open, price) * (1.0 - std::abs(noise(rng)) / 2.0);
        double volume = 50000.0 * (1.0 + std::abs(noise(rng)) * 100.0);

        bars.emplace_back(start + std::chrono::hours(i), open, high, low, price, volume, "SYNTH");
    }
    return bars;
}

std::vector<StrategyDefinition> reference_strategies() {
    auto ema = std::make_shared<signals::EmaCrossoverProvider>();
    auto zscore = std::make_shared<signals::ZScoreReversionProvider>();

    StrategyDefinition trend;
    trend.name = "ema_trend";
    trend.description = "Fast/slow EMA crossover";
    trend.providers.push_back({ema, 1.0});

    StrategyDefinition reversion;
    reversion.name = "zscore_reversion";
    reversion.description = "Z-score mean reversion to the 20-bar average";
    reversion.min_risk_reward = 0.5;
    reversion.providers.push_back({zscore, 1.0});

    StrategyDefinition blended;
    blended.name = "blended";
    blended.description = "Trend and reversion signals with reduced confidence";
    blended.min_risk_reward = 0.5;
    blended.providers.push_back({ema, 0.95});
    blended.providers.push_back({zscore, 0.9});

    return {trend, reversion, blended};
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "bt_compare";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_compare");

        BacktestConfig config;
        if (argc > 1) {
            auto loaded = config.load_from_file(argv[1]);
            if (loaded.is_error()) {
                ERROR("Failed to load backtest config: " << loaded.error()->to_string());
                return 1;
            }
            INFO("Loaded backtest config from " << argv[1]);
        }
        auto valid = config.validate();
        if (valid.is_error()) {
            ERROR("Invalid backtest config: " << valid.error()->to_string());
            return 1;
        }

        MonteCarloConfig mc_config;
        mc_config.num_simulations = 200;
        if (argc > 2) {
            auto loaded = mc_config.load_from_file(argv[2]);
            if (loaded.is_error()) {
                ERROR("Failed to load Monte Carlo config: " << loaded.error()->to_string());
                return 1;
            }
        }

        auto bars = synthesize_bars(400 * 24, 2024);
        INFO("Synthesized " << bars.size() << " hourly bars from "
                            << core::format_timestamp(bars.front().timestamp) << " to "
                            << core::format_timestamp(bars.back().timestamp));

        BacktestCoordinator coordinator(config);
        auto strategies = reference_strategies();

        auto comparison = coordinator.run_comparison(strategies, bars);
        if (comparison.is_error()) {
            ERROR("Strategy comparison failed: " << comparison.error()->to_string());
            return 1;
        }
        const auto& result = comparison.value();

        INFO("===== Strategy ranking =====");
        int rank = 1;
        for (const auto& strategy : result.comparison.strategies) {
            INFO(rank++ << ". " << strategy.strategy_name << " composite "
                        << strategy.composite_score << ", risk-adjusted "
                        << strategy.risk_adjusted_performance << ", consistency "
                        << strategy.consistency);
            for (const auto& period : strategy.periods) {
                INFO("   " << period.period << ": return " << period.total_return * 100.0
                           << "%, Sharpe " << period.sharpe_ratio << ", max DD "
                           << period.max_drawdown * 100.0 << "%, trades " << period.total_trades
                           << ", win rate " << period.win_rate * 100.0 << "%");
            }
        }

        const auto& summary = result.comparison.summary;
        INFO("Best risk-adjusted: " << summary.best_risk_adjusted);
        INFO("Best return: " << summary.best_return);
        INFO("Best win rate: " << summary.best_win_rate);
        INFO("Lowest drawdown: " << summary.lowest_drawdown);
        INFO("Most consistent: " << summary.most_consistent);
        for (const auto& recommendation : result.comparison.recommendations) {
            INFO("Recommendation: " << recommendation);
        }

        INFO("===== Optimal portfolio =====");
        for (const auto& weight : result.optimal_portfolio.weights) {
            INFO(weight.strategy << ": weight " << weight.weight << ", expected return "
                                 << weight.expected_return << ", risk contribution "
                                 << weight.risk_contribution);
        }
        INFO("Portfolio VaR95 " << result.optimal_portfolio.var_95 << ", frontier optimum Sharpe "
                                << result.optimal_portfolio.efficient_frontier.optimal_point.sharpe);

        const std::string& top_name = result.comparison.strategies.front().strategy_name;
        for (const auto& strategy : strategies) {
            if (strategy.name != top_name) {
                continue;
            }
            auto simulation = coordinator.run_monte_carlo(strategy, bars, mc_config);
            if (simulation.is_error()) {
                ERROR("Monte Carlo failed: " << simulation.error()->to_string());
                return 1;
            }
            const auto& mc = simulation.value();
            INFO("===== Monte Carlo: " << top_name << " =====");
            INFO("Trials " << mc.total_simulations << "/" << mc.requested_simulations
                           << ", mean return " << mc.mean_return << "% (std " << mc.std_return
                           << "), 5th/95th percentile " << mc.percentile_5 << "% / "
                           << mc.percentile_95 << "%");
            INFO("Success rate " << mc.success_rate * 100.0 << "%, mean Sharpe " << mc.mean_sharpe
                                 << ", worst drawdown " << mc.worst_drawdown * 100.0 << "%");
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
