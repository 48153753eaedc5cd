#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include "../core/test_base.hpp"
#include "scripted_provider.hpp"
#include "stratlab/backtest/trade_simulator.hpp"

using namespace stratlab;
using namespace stratlab::backtest;
using namespace stratlab::testing;

class TradeSimulatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_ = BacktestConfig();
        config_.initial_capital = 100000.0;
        config_.warmup_bars = 50;
    }

    StrategyDefinition make_strategy(std::shared_ptr<const signals::SignalProvider> provider,
                                     double weight = 1.0) {
        StrategyDefinition strategy;
        strategy.name = "scripted_strategy";
        strategy.providers.push_back({std::move(provider), weight});
        return strategy;
    }

    BacktestResult run_ok(const StrategyDefinition& strategy, const std::vector<Bar>& bars) {
        TradeSimulator simulator(config_, strategy);
        auto result = simulator.run(bars);
        EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error()->to_string() : "");
        return result.is_ok() ? result.take_value() : BacktestResult();
    }

    static double sum_pnl(const BacktestResult& result) {
        double total = 0.0;
        for (const auto& trade : result.closed_trades) {
            total += trade.pnl.value_or(0.0);
        }
        return total;
    }

    BacktestConfig config_;
};

TEST_F(TradeSimulatorTest, UptrendLongHitsTakeProfit) {
    auto bars = make_bars(geometric_closes(200, 100.0, 0.01));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, bars[60].close, 0.02, 0.05));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    const Trade& trade = result.closed_trades.front();
    EXPECT_EQ(trade.side, Side::BUY);
    EXPECT_EQ(trade.exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_EQ(trade.entry_time, bars[60].timestamp);
    ASSERT_TRUE(trade.exit_time.has_value());
    EXPECT_EQ(*trade.exit_time, bars[65].timestamp);
    ASSERT_TRUE(trade.pnl.has_value());
    EXPECT_GT(*trade.pnl, 0.0);
    EXPECT_TRUE(trade.is_win);
    EXPECT_EQ(trade.source, "scripted");
    EXPECT_FALSE(trade.market_conditions.empty());

    // The 20% notional ceiling binds before the 2% risk budget
    double expected_quantity = std::floor(100000.0 * 0.20 / bars[60].close * 100.0) / 100.0;
    EXPECT_NEAR(trade.quantity, expected_quantity, 1e-9);

    EXPECT_EQ(result.winning_trades, 1);
    EXPECT_DOUBLE_EQ(result.win_rate, 1.0);
    EXPECT_GT(result.total_return, 0.0);
}

TEST_F(TradeSimulatorTest, DowntrendShortHitsTakeProfit) {
    auto bars = make_bars(geometric_closes(200, 100.0, -0.01));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::SELL, 90.0, bars[60].close, 0.02, 0.05));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    const Trade& trade = result.closed_trades.front();
    EXPECT_EQ(trade.side, Side::SELL);
    EXPECT_EQ(trade.exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_EQ(*trade.exit_time, bars[66].timestamp);
    EXPECT_GT(*trade.pnl, 0.0);
}

TEST_F(TradeSimulatorTest, FlatMarketWithoutSignalsKeepsCapital) {
    auto bars = make_bars(flat_closes(120, 50.0));
    auto result = run_ok(make_strategy(std::make_shared<ScriptedProvider>()), bars);

    EXPECT_EQ(result.total_trades, 0);
    EXPECT_DOUBLE_EQ(result.total_return, 0.0);
    EXPECT_DOUBLE_EQ(result.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(result.sharpe_ratio, 0.0);
    EXPECT_EQ(result.sortino_ratio.state, RatioState::NO_DOWNSIDE);
    ASSERT_EQ(result.equity_curve.size(), bars.size());
    for (const auto& point : result.equity_curve) {
        EXPECT_DOUBLE_EQ(point.equity, 100000.0);
    }
}

TEST_F(TradeSimulatorTest, FlatMarketTradesLoseExactlyTheirCosts) {
    auto bars = make_bars(flat_closes(300, 50.0));
    auto strategy = make_strategy(
        std::make_shared<PeriodicProvider>("periodic", SignalDirection::BUY, 20, 90.0, 0.02, 0.03));

    auto result = run_ok(strategy, bars);

    ASSERT_GT(result.total_trades, 0);
    for (const auto& trade : result.closed_trades) {
        ASSERT_TRUE(trade.pnl.has_value());
        EXPECT_GT(trade.total_cost(), 0.0);
        EXPECT_NEAR(*trade.pnl, -trade.total_cost(), 1e-9);
        EXPECT_FALSE(trade.is_win);
    }
    EXPECT_LT(result.total_return, 0.0);
    EXPECT_NEAR(result.total_return, sum_pnl(result), 1e-6);
}

TEST_F(TradeSimulatorTest, StopLossTakesPriorityOverSignalExit) {
    auto closes = flat_closes(100, 100.0);
    closes[61] = 97.0;
    auto bars = make_bars(closes);

    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.02, 0.10));
    // Weak strength keeps it from opening a short; it still qualifies as an exit signal
    provider->add(61, make_signal(SignalDirection::SELL, 95.0, 97.0, 0.02, 0.10, 0.1));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    EXPECT_EQ(result.closed_trades.front().exit_reason, ExitReason::STOP_LOSS);
    EXPECT_EQ(*result.closed_trades.front().exit_time, bars[61].timestamp);
    EXPECT_LT(*result.closed_trades.front().pnl, 0.0);
}

TEST_F(TradeSimulatorTest, OpposingHighConfidenceSignalClosesTrade) {
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.10, 0.20));
    provider->add(70, make_signal(SignalDirection::SELL, 90.0, 100.0, 0.10, 0.20, 0.1));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    EXPECT_EQ(result.closed_trades.front().exit_reason, ExitReason::SIGNAL_EXIT);
    EXPECT_EQ(*result.closed_trades.front().exit_time, bars[70].timestamp);
}

TEST_F(TradeSimulatorTest, OpposingSignalAtThresholdDoesNotCloseTrade) {
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.10, 0.20));
    provider->add(70, make_signal(SignalDirection::SELL, 80.0, 100.0, 0.10, 0.20, 0.1));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    EXPECT_EQ(result.closed_trades.front().exit_reason, ExitReason::END_OF_RUN);
    EXPECT_EQ(*result.closed_trades.front().exit_time, bars.back().timestamp);
}

TEST_F(TradeSimulatorTest, HoldingPeriodForcesTimeExit) {
    auto bars = make_bars(flat_closes(400, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(50, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.10, 0.20));

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 1);
    const Trade& trade = result.closed_trades.front();
    EXPECT_EQ(trade.exit_reason, ExitReason::TIME_EXIT);
    EXPECT_EQ(*trade.exit_time - trade.entry_time, std::chrono::hours(169));
}

TEST_F(TradeSimulatorTest, PositionLimitKeepsHighestConfidence) {
    config_.max_open_positions = 2;
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    auto low = make_signal(SignalDirection::BUY, 75.0, 100.0, 0.10, 0.20);
    low.source = "low";
    auto high = make_signal(SignalDirection::BUY, 95.0, 100.0, 0.10, 0.20);
    high.source = "high";
    auto mid = make_signal(SignalDirection::BUY, 85.0, 100.0, 0.10, 0.20);
    mid.source = "mid";
    provider->add(60, low);
    provider->add(60, high);
    provider->add(60, mid);

    auto result = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(result.total_trades, 2);
    EXPECT_EQ(result.closed_trades[0].source, "high");
    EXPECT_EQ(result.closed_trades[1].source, "mid");
}

TEST_F(TradeSimulatorTest, ProviderWeightScalesConfidence) {
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.10, 0.20));

    auto damped = run_ok(make_strategy(provider, 0.5), bars);
    EXPECT_EQ(damped.total_trades, 0);

    auto boosted = run_ok(make_strategy(provider, 1.5), bars);
    ASSERT_EQ(boosted.total_trades, 1);
    EXPECT_DOUBLE_EQ(boosted.closed_trades.front().confidence, 100.0);
}

TEST_F(TradeSimulatorTest, RiskRewardFilterRejectsPoorSetups) {
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.04, 0.02));

    auto result = run_ok(make_strategy(provider), bars);
    EXPECT_EQ(result.total_trades, 0);
}

TEST_F(TradeSimulatorTest, LevelsOnWrongSideOfEntryAreRejected) {
    auto bars = make_bars(geometric_closes(200, 100.0, 0.01));
    auto provider = std::make_shared<ScriptedProvider>();

    // Long with stop above and target below the entry
    CandidateSignal inverted_long;
    inverted_long.direction = SignalDirection::BUY;
    inverted_long.confidence = 90.0;
    inverted_long.stop_loss = bars[60].close * 1.02;
    inverted_long.take_profit = bars[60].close * 0.96;
    provider->add(60, inverted_long);

    // Long with a sound stop but a target below the entry
    auto low_target = make_signal(SignalDirection::BUY, 90.0, bars[80].close, 0.02, 0.05);
    low_target.take_profit = bars[80].close * 0.97;
    provider->add(80, low_target);

    // Short with its stop below the entry
    auto low_stop = make_signal(SignalDirection::SELL, 90.0, bars[100].close, 0.02, 0.05);
    low_stop.stop_loss = bars[100].close * 0.98;
    provider->add(100, low_stop);

    auto result = run_ok(make_strategy(provider), bars);
    EXPECT_EQ(result.total_trades, 0);
    EXPECT_DOUBLE_EQ(result.total_return, 0.0);
}

TEST_F(TradeSimulatorTest, FinalEquityEqualsCapitalPlusRealizedPnl) {
    auto bars = make_bars(geometric_closes(300, 100.0, 0.002));
    auto strategy = make_strategy(
        std::make_shared<PeriodicProvider>("periodic", SignalDirection::BUY, 7, 90.0, 0.02, 0.03));

    auto result = run_ok(strategy, bars);

    ASSERT_GT(result.total_trades, 0);
    for (const auto& trade : result.closed_trades) {
        EXPECT_FALSE(trade.is_open());
    }
    EXPECT_NEAR(result.equity_curve.back().equity, 100000.0 + sum_pnl(result), 1e-6);
    EXPECT_NEAR(result.total_return, sum_pnl(result), 1e-6);
    EXPECT_EQ(result.equity_curve.size(), bars.size());
}

TEST_F(TradeSimulatorTest, EquityBalancesAtEveryBarWhileTradesAreOpen) {
    auto bars = make_bars(geometric_closes(300, 100.0, 0.002));
    auto strategy = make_strategy(
        std::make_shared<PeriodicProvider>("periodic", SignalDirection::BUY, 7, 90.0, 0.02, 0.03));

    auto result = run_ok(strategy, bars);

    ASSERT_GT(result.total_trades, 1);
    ASSERT_EQ(result.equity_curve.size(), bars.size());

    int bars_with_open_trades = 0;
    for (size_t i = 0; i < bars.size(); ++i) {
        const Timestamp now = bars[i].timestamp;
        double realized = 0.0;
        double unrealized = 0.0;
        bool any_open = false;
        for (const auto& trade : result.closed_trades) {
            ASSERT_TRUE(trade.exit_time.has_value());
            if (*trade.exit_time <= now) {
                realized += *trade.pnl;
            } else if (trade.entry_time <= now) {
                // All trades are long
                unrealized += (bars[i].close - trade.entry_price) * trade.quantity -
                              trade.total_cost();
                any_open = true;
            }
        }
        if (any_open) {
            ++bars_with_open_trades;
        }
        EXPECT_NEAR(result.equity_curve[i].equity,
                    config_.initial_capital + realized + unrealized, 1e-6)
            << "bar " << i;
    }
    EXPECT_GT(bars_with_open_trades, 0);
}

TEST_F(TradeSimulatorTest, DrawdownLimitStopsNewEntries) {
    config_.max_drawdown_limit = 0.05;
    std::vector<double> closes = flat_closes(51, 100.0);
    auto tail = flat_closes(100, 70.0);
    closes.insert(closes.end(), tail.begin(), tail.end());
    auto bars = make_bars(closes);

    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(50, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.01, 0.05));
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 70.0, 0.01, 0.05));

    auto result = run_ok(make_strategy(provider), bars);

    EXPECT_TRUE(result.drawdown_limit_breached);
    EXPECT_EQ(result.total_trades, 1);
    EXPECT_EQ(result.closed_trades.front().exit_reason, ExitReason::STOP_LOSS);
    EXPECT_GT(result.max_drawdown, 0.05);
    for (const auto& point : result.equity_curve) {
        EXPECT_GE(point.drawdown, 0.0);
        EXPECT_LE(point.drawdown, 1.0);
    }
}

TEST_F(TradeSimulatorTest, MarginEventsRequireLeverageAndMarginTrading) {
    auto bars = make_bars(flat_closes(100, 100.0));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, 100.0, 0.10, 0.20));

    auto unlevered = run_ok(make_strategy(provider), bars);
    EXPECT_FALSE(unlevered.had_margin_call());

    config_.use_leverage = true;
    config_.enable_margin_trading = true;
    config_.margin_requirement = 1.0;
    auto levered = run_ok(make_strategy(provider), bars);

    // Entry costs put equity just below capital while the trade is open
    ASSERT_TRUE(levered.had_margin_call());
    EXPECT_EQ(levered.margin_events.front().timestamp, bars[60].timestamp);
    EXPECT_LT(levered.margin_events.front().equity, levered.margin_events.front().required_equity);
    EXPECT_EQ(levered.total_trades, 1);
}

TEST_F(TradeSimulatorTest, ThrowingProviderIsCountedAndSkipped) {
    auto bars = make_bars(geometric_closes(100, 100.0, 0.01));
    auto scripted = std::make_shared<ScriptedProvider>();
    scripted->add(60, make_signal(SignalDirection::BUY, 90.0, bars[60].close, 0.02, 0.05));

    StrategyDefinition strategy = make_strategy(scripted);
    strategy.providers.push_back({std::make_shared<ThrowingProvider>(), 1.0});

    auto result = run_ok(strategy, bars);

    EXPECT_EQ(result.provider_failures, 50);
    EXPECT_EQ(result.total_trades, 1);
}

TEST_F(TradeSimulatorTest, SlowProviderExceedsBudget) {
    config_.warmup_bars = 0;
    config_.provider_timeout_ms = 5;
    auto bars = make_bars(flat_closes(5, 100.0));

    TradeSimulator simulator(
        config_, make_strategy(std::make_shared<SlowProvider>(std::chrono::milliseconds(40))));
    auto result = simulator.run(bars);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::TIMEOUT_ERROR);
}

TEST_F(TradeSimulatorTest, RunsAreDeterministic) {
    auto bars = make_bars(geometric_closes(300, 100.0, 0.001));
    auto strategy = make_strategy(
        std::make_shared<PeriodicProvider>("periodic", SignalDirection::BUY, 5, 85.0, 0.01, 0.01));

    auto first = run_ok(strategy, bars);
    auto second = run_ok(strategy, bars);

    EXPECT_EQ(first.total_trades, second.total_trades);
    EXPECT_DOUBLE_EQ(first.total_return, second.total_return);
    EXPECT_DOUBLE_EQ(first.sharpe_ratio, second.sharpe_ratio);
    EXPECT_EQ(first.sortino_ratio.state, second.sortino_ratio.state);
    EXPECT_DOUBLE_EQ(first.sortino_ratio.value, second.sortino_ratio.value);
    EXPECT_DOUBLE_EQ(first.calmar_ratio, second.calmar_ratio);
    EXPECT_DOUBLE_EQ(first.max_drawdown, second.max_drawdown);
    ASSERT_EQ(first.equity_curve.size(), second.equity_curve.size());
    for (size_t i = 0; i < first.equity_curve.size(); ++i) {
        EXPECT_DOUBLE_EQ(first.equity_curve[i].equity, second.equity_curve[i].equity);
    }
}

TEST_F(TradeSimulatorTest, PerTradeCompoundingSizesFromRealizedCapital) {
    auto bars = make_bars(geometric_closes(200, 100.0, 0.01));
    auto provider = std::make_shared<ScriptedProvider>();
    provider->add(60, make_signal(SignalDirection::BUY, 90.0, bars[60].close, 0.02, 0.05));
    provider->add(80, make_signal(SignalDirection::BUY, 90.0, bars[80].close, 0.02, 0.05));

    config_.compounding = CompoundingMode::NONE;
    auto fixed = run_ok(make_strategy(provider), bars);

    config_.compounding = CompoundingMode::PER_TRADE;
    auto per_trade = run_ok(make_strategy(provider), bars);

    // The second trade opens on the next UTC day, after the first has closed
    config_.compounding = CompoundingMode::DAILY;
    auto daily = run_ok(make_strategy(provider), bars);

    ASSERT_EQ(fixed.total_trades, 2);
    ASSERT_EQ(per_trade.total_trades, 2);
    ASSERT_EQ(daily.total_trades, 2);
    EXPECT_DOUBLE_EQ(fixed.closed_trades[0].quantity, per_trade.closed_trades[0].quantity);
    EXPECT_GT(per_trade.closed_trades[1].quantity, fixed.closed_trades[1].quantity);
    EXPECT_DOUBLE_EQ(daily.closed_trades[1].quantity, per_trade.closed_trades[1].quantity);
}

TEST_F(TradeSimulatorTest, RejectsInvalidBars) {
    TradeSimulator simulator(config_, make_strategy(std::make_shared<ScriptedProvider>()));

    auto empty = simulator.run({});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::INVALID_DATA);

    auto bars = make_bars(flat_closes(10, 100.0));
    bars[5].timestamp = bars[4].timestamp;
    auto duplicate = simulator.run(bars);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_DATA);

    auto zero = make_bars(flat_closes(10, 100.0));
    zero[3].close = 0.0;
    auto zero_close = simulator.run(zero);
    ASSERT_TRUE(zero_close.is_error());
    EXPECT_EQ(zero_close.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_low = make_bars(flat_closes(10, 100.0));
    bad_low[6].low = 0.0;
    auto zero_low = simulator.run(bad_low);
    ASSERT_TRUE(zero_low.is_error());
    EXPECT_EQ(zero_low.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_open = make_bars(flat_closes(10, 100.0));
    bad_open[2].open = -1.0;
    auto negative_open = simulator.run(bad_open);
    ASSERT_TRUE(negative_open.is_error());
    EXPECT_EQ(negative_open.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_high = make_bars(flat_closes(10, 100.0));
    bad_high[8].high = 0.0;
    EXPECT_TRUE(simulator.run(bad_high).is_error());
}

TEST_F(TradeSimulatorTest, RejectsInvalidConfigurationAndStrategy) {
    auto bars = make_bars(flat_closes(10, 100.0));

    BacktestConfig bad_config = config_;
    bad_config.risk_per_trade = 0.0;
    auto config_result =
        TradeSimulator(bad_config, make_strategy(std::make_shared<ScriptedProvider>())).run(bars);
    ASSERT_TRUE(config_result.is_error());
    EXPECT_EQ(config_result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    BacktestConfig unknown_timeframe = config_;
    unknown_timeframe.timeframe = "4h";
    auto timeframe_result =
        TradeSimulator(unknown_timeframe, make_strategy(std::make_shared<ScriptedProvider>()))
            .run(bars);
    ASSERT_TRUE(timeframe_result.is_error());
    EXPECT_EQ(timeframe_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    for (const std::string& label : {"1d", "1h", "15m", "5m", "1m"}) {
        unknown_timeframe.timeframe = label;
        EXPECT_TRUE(unknown_timeframe.validate().is_ok()) << label;
    }

    StrategyDefinition unnamed = make_strategy(std::make_shared<ScriptedProvider>());
    unnamed.name.clear();
    auto name_result = TradeSimulator(config_, unnamed).run(bars);
    ASSERT_TRUE(name_result.is_error());
    EXPECT_EQ(name_result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    StrategyDefinition null_provider = make_strategy(nullptr);
    auto null_result = TradeSimulator(config_, null_provider).run(bars);
    ASSERT_TRUE(null_result.is_error());
    EXPECT_EQ(null_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(TradeSimulatorTest, MarketConditionsFromPrecedingBars) {
    auto bars = make_bars(geometric_closes(60, 100.0, 0.01));

    auto early = TradeSimulator::analyze_market_conditions(bars, 5);
    EXPECT_TRUE(early.empty());

    auto labels = TradeSimulator::analyze_market_conditions(bars, 30);
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "strong_uptrend");
    EXPECT_EQ(labels[1], "low_volatility");
}
