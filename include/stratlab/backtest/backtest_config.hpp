// include/stratlab/backtest/backtest_config.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/signals/signal_provider.hpp"
#include "stratlab/transaction_cost/cost_model.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief How often the capital used for position sizing is refreshed
 */
enum class CompoundingMode {
    NONE,       // Always size from initial capital
    PER_TRADE,  // Size from current realized capital
    DAILY,      // Refresh on each new UTC day
    WEEKLY,     // Refresh on each new ISO week
    MONTHLY     // Refresh on each new UTC month
};

enum class OptimizationTarget { PROFIT, SHARPE, SORTINO };

std::string compounding_to_string(CompoundingMode mode);
CompoundingMode compounding_from_string(const std::string& label);
std::string optimization_target_to_string(OptimizationTarget target);
OptimizationTarget optimization_target_from_string(const std::string& label);

/**
 * @brief Immutable parameters of a simulation run
 */
struct BacktestConfig : public ConfigBase {
    transaction_cost::CostModelConfig costs;
    std::string timeframe{"1h"};

    double initial_capital{100000.0};
    double risk_per_trade{0.02};        // Fraction of capital risked per trade, (0, 1]
    double max_drawdown_limit{0.25};    // Stop opening trades beyond this drawdown, 0 disables
    int max_open_positions{5};

    bool use_leverage{false};
    bool enable_margin_trading{false};
    double margin_requirement{0.5};

    CompoundingMode compounding{CompoundingMode::NONE};
    OptimizationTarget optimization_target{OptimizationTarget::PROFIT};
    double risk_free_rate{0.02};  // Annual

    int warmup_bars{50};
    int max_holding_hours{168};          // 7 days of bar time
    double signal_exit_confidence{0.8};  // Opposing signal confidence (0-1) that forces an exit
    double default_stop_pct{0.02};
    double default_target_pct{0.02};
    int volatility_window{20};
    int volume_window{20};
    int provider_timeout_ms{0};  // 0 disables the check

    std::string version{"1.0.0"};

    /**
     * @brief Check every parameter is in range
     * @return INVALID_ARGUMENT naming the first offending field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief A strategy under test: its providers, filters and cost overrides
 */
struct StrategyDefinition {
    std::string name;
    std::string description;

    double min_confidence{0.7};   // On a 0-1 scale, compared to confidence / 100
    double min_strength{0.6};
    double min_risk_reward{1.0};

    std::optional<double> slippage;    // Overrides the cost model slippage coefficient
    std::optional<double> commission;  // Overrides the cost model commission rate
    bool enable_leverage{false};

    std::vector<signals::ProviderRegistration> providers;

    Result<void> validate() const;
};

}  // namespace backtest
}  // namespace stratlab
