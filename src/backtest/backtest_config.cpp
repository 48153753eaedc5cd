// src/backtest/backtest_config.cpp

#include "stratlab/backtest/backtest_config.hpp"

namespace stratlab {
namespace backtest {

namespace {
const std::string COMPONENT = "BacktestConfig";
}

std::string compounding_to_string(CompoundingMode mode) {
    switch (mode) {
        case CompoundingMode::PER_TRADE:
            return "per_trade";
        case CompoundingMode::DAILY:
            return "daily";
        case CompoundingMode::WEEKLY:
            return "weekly";
        case CompoundingMode::MONTHLY:
            return "monthly";
        default:
            return "none";
    }
}

CompoundingMode compounding_from_string(const std::string& label) {
    if (label == "per_trade")
        return CompoundingMode::PER_TRADE;
    if (label == "daily")
        return CompoundingMode::DAILY;
    if (label == "weekly")
        return CompoundingMode::WEEKLY;
    if (label == "monthly")
        return CompoundingMode::MONTHLY;
    return CompoundingMode::NONE;
}

std::string optimization_target_to_string(OptimizationTarget target) {
    switch (target) {
        case OptimizationTarget::SHARPE:
            return "sharpe";
        case OptimizationTarget::SORTINO:
            return "sortino";
        default:
            return "profit";
    }
}

OptimizationTarget optimization_target_from_string(const std::string& label) {
    if (label == "sharpe")
        return OptimizationTarget::SHARPE;
    if (label == "sortino")
        return OptimizationTarget::SORTINO;
    return OptimizationTarget::PROFIT;
}

Result<void> BacktestConfig::validate() const {
    if (!(initial_capital > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "initial_capital must be positive", COMPONENT);
    }
    if (frequency_to_string(frequency_from_string(timeframe)) != timeframe) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "timeframe '" + timeframe + "' is not one of 1d, 1h, 15m, 5m, 1m",
                                COMPONENT);
    }
    if (!(risk_per_trade > 0.0) || risk_per_trade > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "risk_per_trade must be in (0, 1]", COMPONENT);
    }
    if (max_drawdown_limit < 0.0 || max_drawdown_limit > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_drawdown_limit must be in [0, 1]", COMPONENT);
    }
    if (max_open_positions < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_open_positions must be at least 1", COMPONENT);
    }
    if (!(margin_requirement > 0.0) || margin_requirement > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "margin_requirement must be in (0, 1]", COMPONENT);
    }
    if (warmup_bars < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "warmup_bars cannot be negative", COMPONENT);
    }
    if (max_holding_hours <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_holding_hours must be positive", COMPONENT);
    }
    if (default_stop_pct <= 0.0 || default_stop_pct >= 1.0 || default_target_pct <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "default stop and target fractions must be positive",
                                COMPONENT);
    }
    if (volatility_window < 2 || volume_window < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "volatility_window must be >= 2 and volume_window >= 1",
                                COMPONENT);
    }
    if (provider_timeout_ms < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "provider_timeout_ms cannot be negative", COMPONENT);
    }
    if (costs.commission_rate < 0.0 || costs.slippage < 0.0 || costs.price_impact < 0.0 ||
        costs.liquidity_cost < 0.0 || costs.latency_ms < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "cost coefficients cannot be negative", COMPONENT);
    }
    return Result<void>();
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["costs"] = costs.to_json();
    j["timeframe"] = timeframe;
    j["initial_capital"] = initial_capital;
    j["risk_per_trade"] = risk_per_trade;
    j["max_drawdown_limit"] = max_drawdown_limit;
    j["max_open_positions"] = max_open_positions;
    j["use_leverage"] = use_leverage;
    j["enable_margin_trading"] = enable_margin_trading;
    j["margin_requirement"] = margin_requirement;
    j["compounding"] = compounding_to_string(compounding);
    j["optimization_target"] = optimization_target_to_string(optimization_target);
    j["risk_free_rate"] = risk_free_rate;
    j["warmup_bars"] = warmup_bars;
    j["max_holding_hours"] = max_holding_hours;
    j["signal_exit_confidence"] = signal_exit_confidence;
    j["default_stop_pct"] = default_stop_pct;
    j["default_target_pct"] = default_target_pct;
    j["volatility_window"] = volatility_window;
    j["volume_window"] = volume_window;
    j["provider_timeout_ms"] = provider_timeout_ms;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("costs"))
        costs.from_json(j.at("costs"));
    if (j.contains("timeframe"))
        timeframe = j.at("timeframe").get<std::string>();
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("risk_per_trade"))
        risk_per_trade = j.at("risk_per_trade").get<double>();
    if (j.contains("max_drawdown_limit"))
        max_drawdown_limit = j.at("max_drawdown_limit").get<double>();
    if (j.contains("max_open_positions"))
        max_open_positions = j.at("max_open_positions").get<int>();
    if (j.contains("use_leverage"))
        use_leverage = j.at("use_leverage").get<bool>();
    if (j.contains("enable_margin_trading"))
        enable_margin_trading = j.at("enable_margin_trading").get<bool>();
    if (j.contains("margin_requirement"))
        margin_requirement = j.at("margin_requirement").get<double>();
    if (j.contains("compounding"))
        compounding = compounding_from_string(j.at("compounding").get<std::string>());
    if (j.contains("optimization_target"))
        optimization_target =
            optimization_target_from_string(j.at("optimization_target").get<std::string>());
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("warmup_bars"))
        warmup_bars = j.at("warmup_bars").get<int>();
    if (j.contains("max_holding_hours"))
        max_holding_hours = j.at("max_holding_hours").get<int>();
    if (j.contains("signal_exit_confidence"))
        signal_exit_confidence = j.at("signal_exit_confidence").get<double>();
    if (j.contains("default_stop_pct"))
        default_stop_pct = j.at("default_stop_pct").get<double>();
    if (j.contains("default_target_pct"))
        default_target_pct = j.at("default_target_pct").get<double>();
    if (j.contains("volatility_window"))
        volatility_window = j.at("volatility_window").get<int>();
    if (j.contains("volume_window"))
        volume_window = j.at("volume_window").get<int>();
    if (j.contains("provider_timeout_ms"))
        provider_timeout_ms = j.at("provider_timeout_ms").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> StrategyDefinition::validate() const {
    if (name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Strategy name cannot be empty",
                                "StrategyDefinition");
    }
    for (const auto& registration : providers) {
        if (!registration.provider) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Strategy " + name + " has a null signal provider",
                                    "StrategyDefinition");
        }
        if (registration.confidence_weight < 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Strategy " + name + " has a negative confidence weight",
                                    "StrategyDefinition");
        }
    }
    if ((slippage && *slippage < 0.0) || (commission && *commission < 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Strategy " + name + " has a negative cost override",
                                "StrategyDefinition");
    }
    return Result<void>();
}

}  // namespace backtest
}  // namespace stratlab
