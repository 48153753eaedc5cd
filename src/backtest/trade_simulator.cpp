// src/backtest/trade_simulator.cpp

#include "stratlab/backtest/trade_simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"

namespace stratlab {
namespace backtest {

namespace {

transaction_cost::CostModelConfig effective_cost_config(const BacktestConfig& config,
                                                        const StrategyDefinition& strategy) {
    transaction_cost::CostModelConfig costs = config.costs;
    if (strategy.slippage) {
        costs.slippage = *strategy.slippage;
    }
    if (strategy.commission) {
        costs.commission_rate = *strategy.commission;
    }
    return costs;
}

bool is_opposing(Side side, signals::SignalDirection direction) {
    return (side == Side::BUY && direction == signals::SignalDirection::SELL) ||
           (side == Side::SELL && direction == signals::SignalDirection::BUY);
}

}  // namespace

TradeSimulator::TradeSimulator(BacktestConfig config, StrategyDefinition strategy)
    : config_(std::move(config)),
      strategy_(std::move(strategy)),
      cost_model_(effective_cost_config(config_, strategy_)),
      sizer_(config_.risk_per_trade) {}

Result<void> TradeSimulator::validate_bars(const std::vector<Bar>& bars) {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Bar series is empty",
                                "TradeSimulator");
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (!(bar.open > 0.0) || !(bar.high > 0.0) || !(bar.low > 0.0) || !(bar.close > 0.0)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-positive price at bar " + std::to_string(i),
                                    "TradeSimulator");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Timestamps are not strictly increasing at bar " +
                                        std::to_string(i),
                                    "TradeSimulator");
        }
    }
    return Result<void>();
}

std::vector<std::string> TradeSimulator::analyze_market_conditions(const std::vector<Bar>& bars,
                                                                   size_t index) {
    std::vector<std::string> conditions;
    if (index >= bars.size()) {
        return conditions;
    }
    size_t start = index >= 20 ? index - 20 : 0;
    size_t count = index - start;
    if (count < 10) {
        return conditions;
    }

    const Bar& current = bars[index];
    double first_close = bars[start].close;
    double price_change = (current.close - first_close) / first_close;

    if (price_change > 0.02)
        conditions.push_back("strong_uptrend");
    else if (price_change > 0.005)
        conditions.push_back("uptrend");
    else if (price_change < -0.02)
        conditions.push_back("strong_downtrend");
    else if (price_change < -0.005)
        conditions.push_back("downtrend");
    else
        conditions.push_back("sideways");

    // Per-bar volatility of the preceding window
    std::vector<double> returns;
    for (size_t i = start + 1; i < index; ++i) {
        returns.push_back((bars[i].close - bars[i - 1].close) / bars[i - 1].close);
    }
    double volatility = BacktestMetricsCalculator::calculate_std_dev(returns);

    if (volatility > 0.03)
        conditions.push_back("high_volatility");
    else if (volatility > 0.015)
        conditions.push_back("moderate_volatility");
    else
        conditions.push_back("low_volatility");

    double volume_sum = 0.0;
    for (size_t i = start; i < index; ++i) {
        volume_sum += bars[i].volume;
    }
    double avg_volume = volume_sum / static_cast<double>(count);
    if (current.volume > avg_volume * 1.5)
        conditions.push_back("high_volume");
    else if (current.volume < avg_volume * 0.7)
        conditions.push_back("low_volume");

    return conditions;
}

Result<std::vector<signals::CandidateSignal>> TradeSimulator::collect_signals(
    const std::vector<Bar>& window, int& failures) const {
    std::vector<signals::CandidateSignal> collected;

    for (const auto& registration : strategy_.providers) {
        const auto& provider = registration.provider;
        auto started = std::chrono::steady_clock::now();

        std::vector<signals::CandidateSignal> produced;
        try {
            produced = provider->provide(window);
        } catch (const std::exception& e) {
            ++failures;
            WARN("Signal provider " << provider->name() << " failed at "
                                    << core::format_timestamp(window.back().timestamp) << ": "
                                    << e.what());
            continue;
        }

        if (config_.provider_timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (elapsed.count() > config_.provider_timeout_ms) {
                return make_error<std::vector<signals::CandidateSignal>>(
                    ErrorCode::TIMEOUT_ERROR,
                    "Signal provider " + provider->name() + " took " +
                        std::to_string(elapsed.count()) + "ms, budget is " +
                        std::to_string(config_.provider_timeout_ms) + "ms",
                    "TradeSimulator");
            }
        }

        for (auto& signal : produced) {
            signal.confidence =
                std::min(100.0, std::max(0.0, signal.confidence * registration.confidence_weight));
            if (signal.source.empty()) {
                signal.source = provider->name();
            }
            collected.push_back(std::move(signal));
        }
    }

    // Highest confidence is considered first when slots are limited
    std::stable_sort(collected.begin(), collected.end(),
                     [](const signals::CandidateSignal& a, const signals::CandidateSignal& b) {
                         return a.confidence > b.confidence;
                     });
    return collected;
}

std::optional<ExitReason> TradeSimulator::check_exit(
    const Trade& trade, const Bar& bar,
    const std::vector<signals::CandidateSignal>& signals) const {
    Price price = bar.close;
    bool is_long = trade.side == Side::BUY;

    if (is_long ? price <= trade.stop_loss : price >= trade.stop_loss) {
        return ExitReason::STOP_LOSS;
    }

    if (trade.take_profit &&
        (is_long ? price >= *trade.take_profit : price <= *trade.take_profit)) {
        return ExitReason::TAKE_PROFIT;
    }

    for (const auto& signal : signals) {
        if (is_opposing(trade.side, signal.direction) &&
            signal.confidence / 100.0 > config_.signal_exit_confidence) {
            return ExitReason::SIGNAL_EXIT;
        }
    }

    if (bar.timestamp - trade.entry_time > std::chrono::hours(config_.max_holding_hours)) {
        return ExitReason::TIME_EXIT;
    }

    return std::nullopt;
}

bool TradeSimulator::passes_filters(const signals::CandidateSignal& signal,
                                    Price entry_price) const {
    if (!signal.is_actionable()) {
        return false;
    }
    auto levels = signal.check_levels(entry_price);
    if (levels.is_error()) {
        DEBUG("Rejected signal from " << signal.source << ": " << levels.error()->what());
        return false;
    }
    if (signal.confidence / 100.0 < strategy_.min_confidence) {
        return false;
    }
    if (signal.strength < strategy_.min_strength) {
        return false;
    }
    auto risk_reward = signal.effective_risk_reward(entry_price);
    return risk_reward && *risk_reward >= strategy_.min_risk_reward;
}

bool TradeSimulator::sizing_period_changed(const Timestamp& previous,
                                           const Timestamp& current) const {
    switch (config_.compounding) {
        case CompoundingMode::DAILY:
            return core::utc_day_index(previous) != core::utc_day_index(current);
        case CompoundingMode::WEEKLY:
            return core::utc_week_index(previous) != core::utc_week_index(current);
        case CompoundingMode::MONTHLY:
            return core::utc_month_index(previous) != core::utc_month_index(current);
        default:
            return false;
    }
}

Result<BacktestResult> TradeSimulator::run(const std::vector<Bar>& bars) const {
    Logger::register_component("TradeSimulator");

    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return make_error<BacktestResult>(config_check.error()->code(),
                                          config_check.error()->what(), "TradeSimulator");
    }
    auto strategy_check = strategy_.validate();
    if (strategy_check.is_error()) {
        return make_error<BacktestResult>(strategy_check.error()->code(),
                                          strategy_check.error()->what(), "TradeSimulator");
    }
    auto bars_check = validate_bars(bars);
    if (bars_check.is_error()) {
        return make_error<BacktestResult>(bars_check.error()->code(),
                                          bars_check.error()->what(), "TradeSimulator");
    }

    BacktestResult result;
    result.strategy_name = strategy_.name;
    result.equity_curve.reserve(bars.size());

    const size_t last_index = bars.size() - 1;
    const size_t warmup = static_cast<size_t>(config_.warmup_bars);
    const bool margin_checks =
        (config_.use_leverage || strategy_.enable_leverage) && config_.enable_margin_trading;

    double capital = config_.initial_capital;
    double sizing_capital = config_.initial_capital;
    double peak_equity = config_.initial_capital;
    std::vector<Trade> open_trades;
    std::vector<Bar> window;
    window.reserve(bars.size());
    int next_trade_id = 1;

    auto close_trade = [&](Trade& trade, const Bar& bar, ExitReason reason) -> Result<void> {
        auto realized = trade.close(bar.close, bar.timestamp, reason);
        if (realized.is_error()) {
            return make_error<void>(realized.error()->code(), realized.error()->what(),
                                    "TradeSimulator");
        }
        capital += realized.value();
        DEBUG("Closed trade " << trade.id << " " << side_to_string(trade.side) << " at "
                              << bar.close << " (" << exit_reason_to_string(reason)
                              << "), pnl " << realized.value());
        result.closed_trades.push_back(trade);
        return Result<void>();
    };

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        window.push_back(bar);

        if (i > 0 && sizing_period_changed(bars[i - 1].timestamp, bar.timestamp)) {
            sizing_capital = capital;
        }

        std::vector<signals::CandidateSignal> bar_signals;
        if (i >= warmup) {
            auto collected = collect_signals(window, result.provider_failures);
            if (collected.is_error()) {
                ERROR("Run of " << strategy_.name << " aborted: " << collected.error()->what());
                return make_error<BacktestResult>(collected.error()->code(),
                                                  collected.error()->what(), "TradeSimulator");
            }
            bar_signals = collected.take_value();
        }

        // Exits, first matching reason wins
        std::vector<Trade> still_open;
        still_open.reserve(open_trades.size());
        for (auto& trade : open_trades) {
            auto reason = check_exit(trade, bar, bar_signals);
            if (!reason && i == last_index) {
                reason = ExitReason::END_OF_RUN;
            }
            if (reason) {
                auto closed = close_trade(trade, bar, *reason);
                if (closed.is_error()) {
                    return make_error<BacktestResult>(closed.error()->code(),
                                                      closed.error()->what(), "TradeSimulator");
                }
            } else {
                still_open.push_back(std::move(trade));
            }
        }
        open_trades = std::move(still_open);

        // Entries
        if (i >= warmup && i < last_index && !result.drawdown_limit_breached) {
            std::optional<double> volatility = transaction_cost::CostModel::trailing_volatility(
                bars, i, static_cast<size_t>(config_.volatility_window));
            std::optional<double> average_volume =
                transaction_cost::CostModel::trailing_average_volume(
                    bars, i, static_cast<size_t>(config_.volume_window));

            for (const auto& signal : bar_signals) {
                if (open_trades.size() >= static_cast<size_t>(config_.max_open_positions)) {
                    break;
                }

                Side side = signals::to_side(signal.direction);
                if (side == Side::NONE) {
                    continue;
                }

                Price price = bar.close;
                signals::CandidateSignal candidate = signal;
                if (!candidate.stop_loss) {
                    candidate.stop_loss = side == Side::BUY
                                              ? price * (1.0 - config_.default_stop_pct)
                                              : price * (1.0 + config_.default_stop_pct);
                }
                if (!candidate.take_profit) {
                    candidate.take_profit = side == Side::BUY
                                                ? price * (1.0 + config_.default_target_pct)
                                                : price * (1.0 - config_.default_target_pct);
                }
                if (!passes_filters(candidate, price)) {
                    continue;
                }

                double base = config_.compounding == CompoundingMode::PER_TRADE ? capital
                                                                                 : sizing_capital;
                Quantity quantity =
                    sizer_.calculate_quantity(base, candidate, price, *candidate.stop_loss);
                if (quantity <= 0.0) {
                    continue;
                }

                Trade trade;
                trade.id = next_trade_id++;
                trade.side = side;
                trade.entry_price = price;
                trade.entry_time = bar.timestamp;
                trade.quantity = quantity;
                trade.stop_loss = *candidate.stop_loss;
                trade.take_profit = candidate.take_profit;
                trade.costs =
                    cost_model_.calculate_costs(quantity, price, average_volume, volatility);
                trade.confidence = candidate.confidence;
                trade.source = candidate.source;
                trade.market_conditions = analyze_market_conditions(bars, i);

                DEBUG("Opened trade " << trade.id << " " << side_to_string(side) << " "
                                      << quantity << " @ " << price << " from " << trade.source
                                      << ", costs " << trade.costs.total());
                open_trades.push_back(std::move(trade));
            }
        }

        // Mark to market
        double unrealized = 0.0;
        for (const auto& trade : open_trades) {
            unrealized += trade.unrealized_pnl(bar.close);
        }
        double equity = capital + unrealized;

        peak_equity = std::max(peak_equity, equity);
        double drawdown = 0.0;
        if (peak_equity > 0.0) {
            drawdown = std::clamp((peak_equity - equity) / peak_equity, 0.0, 1.0);
        }
        result.equity_curve.push_back(EquityPoint{bar.timestamp, equity, drawdown});

        if (config_.max_drawdown_limit > 0.0 && drawdown > config_.max_drawdown_limit &&
            !result.drawdown_limit_breached) {
            result.drawdown_limit_breached = true;
            WARN("Strategy " << strategy_.name << " breached max drawdown limit "
                             << config_.max_drawdown_limit << " at "
                             << core::format_timestamp(bar.timestamp) << " (drawdown "
                             << drawdown << "), no further entries");
        }

        if (margin_checks) {
            double required = capital * config_.margin_requirement;
            if (equity < required) {
                result.margin_events.push_back(MarginEvent{bar.timestamp, equity, capital, required});
                WARN("Margin call for " << strategy_.name << " at "
                                        << core::format_timestamp(bar.timestamp) << ": equity "
                                        << equity << " below required " << required);
            }
        }
    }

    metrics_calculator_.calculate_metrics(result, config_.initial_capital, config_.risk_free_rate);

    INFO("Backtest of " << strategy_.name << " over " << bars.size() << " bars: "
                        << result.total_trades << " trades, return "
                        << result.total_return_percent << "%, Sharpe " << result.sharpe_ratio
                        << ", max drawdown " << result.max_drawdown);
    if (result.provider_failures > 0) {
        WARN(result.provider_failures << " signal provider failures during run of "
                                      << strategy_.name);
    }

    return result;
}

}  // namespace backtest
}  // namespace stratlab
