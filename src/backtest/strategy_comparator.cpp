// src/backtest/strategy_comparator.cpp

#include "stratlab/backtest/strategy_comparator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <utility>
#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include "stratlab/backtest/trade_simulator.hpp"
#include "stratlab/core/logger.hpp"

namespace stratlab {
namespace backtest {

namespace {

const std::vector<std::string> REGIMES = {"bull_market", "bear_market", "sideways",
                                          "high_volatility", "low_volatility"};

std::vector<std::string> regimes_for(const std::vector<std::string>& conditions) {
    std::vector<std::string> regimes;
    for (const auto& label : conditions) {
        if (label == "strong_uptrend" || label == "uptrend") {
            regimes.push_back("bull_market");
        } else if (label == "strong_downtrend" || label == "downtrend") {
            regimes.push_back("bear_market");
        } else if (label == "sideways" || label == "high_volatility" ||
                   label == "low_volatility") {
            regimes.push_back(label);
        }
    }
    return regimes;
}

}  // namespace

bool ranks_before(const StrategyResult& a, const StrategyResult& b,
                  RankingConvention convention) {
    if (convention == RankingConvention::LEGACY_LOWER_IS_BETTER) {
        return a.composite_score < b.composite_score;
    }
    return a.composite_score > b.composite_score;
}

const std::vector<int>& StrategyComparator::default_windows() {
    static const std::vector<int> windows = {30, 90, 180, 365};
    return windows;
}

StrategyComparator::StrategyComparator(BacktestConfig config, RankingConvention convention)
    : config_(std::move(config)), convention_(convention) {}

std::vector<Bar> StrategyComparator::slice_window(const std::vector<Bar>& bars, int days) {
    if (bars.empty() || days <= 0) {
        return {};
    }
    Timestamp cutoff = bars.back().timestamp - std::chrono::hours(24 * days);
    auto first = std::find_if(bars.begin(), bars.end(),
                              [&cutoff](const Bar& bar) { return bar.timestamp >= cutoff; });
    return std::vector<Bar>(first, bars.end());
}

double StrategyComparator::periods_per_year() const {
    auto bar = frequency_to_duration(frequency_from_string(config_.timeframe));
    double bars_per_day = 86400.0 / static_cast<double>(bar.count());
    return 252.0 * bars_per_day;
}

std::vector<RegimePerformance> StrategyComparator::calculate_regime_performance(
    const std::vector<Trade>& trades) {
    std::map<std::string, double> totals;
    for (const auto& regime : REGIMES) {
        totals[regime] = 0.0;
    }

    for (const auto& trade : trades) {
        double notional = trade.entry_price * trade.quantity;
        if (notional <= 0.0) {
            continue;
        }
        double trade_return = trade.pnl.value_or(0.0) / notional;
        for (const auto& regime : regimes_for(trade.market_conditions)) {
            totals[regime] += trade_return;
        }
    }

    std::vector<RegimePerformance> performance;
    for (const auto& regime : REGIMES) {
        performance.push_back(RegimePerformance{regime, totals[regime]});
    }
    return performance;
}

double StrategyComparator::calculate_risk_adjusted_performance(
    const std::vector<PeriodResult>& periods) {
    if (periods.empty()) {
        return 0.0;
    }
    double total_sharpe = 0.0;
    double total_annualized = 0.0;
    double max_dd = 0.0;
    for (const auto& period : periods) {
        total_sharpe += period.sharpe_ratio;
        total_annualized += period.annualized_return;
        max_dd = std::max(max_dd, period.max_drawdown);
    }
    double avg_return = total_annualized / static_cast<double>(periods.size());
    return (total_sharpe + avg_return) / (1.0 + max_dd);
}

double StrategyComparator::calculate_consistency(const std::vector<PeriodResult>& periods) {
    std::vector<double> returns;
    returns.reserve(periods.size());
    for (const auto& period : periods) {
        returns.push_back(period.annualized_return);
    }
    double std_dev = BacktestMetricsCalculator::calculate_std_dev(returns);
    return 1.0 / (1.0 + std_dev * std_dev);
}

double StrategyComparator::calculate_composite(const StrategyResult& result) {
    double regime_score = 0.0;
    if (!result.regime_performance.empty()) {
        for (const auto& regime : result.regime_performance) {
            regime_score += regime.performance;
        }
        regime_score /= static_cast<double>(result.regime_performance.size());
    }
    return 0.5 * result.risk_adjusted_performance + 0.3 * result.consistency + 0.2 * regime_score;
}

Eigen::MatrixXd StrategyComparator::calculate_correlation_matrix(
    const std::vector<StrategyResult>& strategies) {
    const Eigen::Index n = static_cast<Eigen::Index>(strategies.size());
    Eigen::MatrixXd correlation = Eigen::MatrixXd::Identity(n, n);
    if (n < 2) {
        return correlation;
    }

    const size_t length = strategies.front().equity_returns.size();
    if (length < 2) {
        return correlation;
    }
    for (const auto& strategy : strategies) {
        if (strategy.equity_returns.size() != length) {
            return correlation;
        }
    }

    Eigen::MatrixXd returns(static_cast<Eigen::Index>(length), n);
    for (Eigen::Index j = 0; j < n; ++j) {
        const auto& series = strategies[static_cast<size_t>(j)].equity_returns;
        for (size_t t = 0; t < length; ++t) {
            returns(static_cast<Eigen::Index>(t), j) = series[t];
        }
    }

    Eigen::MatrixXd centered = returns.rowwise() - returns.colwise().mean();
    Eigen::MatrixXd covariance = (centered.transpose() * centered) / static_cast<double>(length);

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            double denom = std::sqrt(covariance(i, i) * covariance(j, j));
            correlation(i, j) = denom > 0.0 ? covariance(i, j) / denom : 0.0;
        }
    }
    return correlation;
}

ComparisonSummary StrategyComparator::summarize(const std::vector<StrategyResult>& ranked) {
    ComparisonSummary summary;
    if (ranked.empty()) {
        return summary;
    }

    const StrategyResult* best_rap = &ranked.front();
    const StrategyResult* best_return = &ranked.front();
    const StrategyResult* best_win_rate = &ranked.front();
    const StrategyResult* lowest_dd = &ranked.front();
    const StrategyResult* most_consistent = &ranked.front();

    for (const auto& result : ranked) {
        if (result.risk_adjusted_performance > best_rap->risk_adjusted_performance)
            best_rap = &result;
        if (result.mean_annualized_return > best_return->mean_annualized_return)
            best_return = &result;
        if (result.mean_win_rate > best_win_rate->mean_win_rate)
            best_win_rate = &result;
        if (result.max_drawdown < lowest_dd->max_drawdown)
            lowest_dd = &result;
        if (result.consistency > most_consistent->consistency)
            most_consistent = &result;
    }

    summary.best_risk_adjusted = best_rap->strategy_name;
    summary.best_return = best_return->strategy_name;
    summary.best_win_rate = best_win_rate->strategy_name;
    summary.lowest_drawdown = lowest_dd->strategy_name;
    summary.most_consistent = most_consistent->strategy_name;
    return summary;
}

std::vector<std::string> StrategyComparator::recommend(const std::vector<StrategyResult>& ranked) {
    std::vector<std::string> recommendations;
    if (ranked.empty()) {
        return recommendations;
    }

    recommendations.push_back("Consider allocating 40-60% to " + ranked[0].strategy_name +
                              " based on superior risk-adjusted returns");
    if (ranked.size() > 1) {
        recommendations.push_back("Diversify with " + ranked[1].strategy_name +
                                  " for additional stability across market conditions");
    }
    if (ranked.size() > 2) {
        recommendations.push_back("Use " + ranked[2].strategy_name +
                                  " as a tertiary strategy for specific market regimes");
    }

    const auto& worst = ranked.back();
    if (worst.consistency < 0.5) {
        recommendations.push_back("Exercise caution with " + worst.strategy_name +
                                  " due to inconsistent performance");
    }
    return recommendations;
}

Result<StrategyResult> StrategyComparator::evaluate_strategy(const StrategyDefinition& strategy,
                                                             const std::vector<Bar>& bars,
                                                             const std::vector<int>& windows) const {
    if (windows.empty()) {
        return make_error<StrategyResult>(ErrorCode::INVALID_ARGUMENT,
                                          "At least one lookback window is required",
                                          "StrategyComparator");
    }

    StrategyResult result;
    result.strategy_name = strategy.name;

    TradeSimulator simulator(config_, strategy);
    const double annualization = std::sqrt(periods_per_year());
    int longest_days = 0;
    std::vector<Trade> longest_trades;

    for (int days : windows) {
        if (days <= 0) {
            return make_error<StrategyResult>(ErrorCode::INVALID_ARGUMENT,
                                              "Lookback windows must be positive, got " +
                                                  std::to_string(days),
                                              "StrategyComparator");
        }

        auto run = simulator.run(slice_window(bars, days));
        if (run.is_error()) {
            return make_error<StrategyResult>(run.error()->code(),
                                              "Window " + std::to_string(days) + "D of " +
                                                  strategy.name + ": " + run.error()->what(),
                                              "StrategyComparator");
        }
        BacktestResult backtest = run.take_value();

        PeriodResult period;
        period.period = std::to_string(days) + "D";
        period.days = days;
        period.total_return = backtest.total_return / config_.initial_capital;
        period.sharpe_ratio = backtest.sharpe_ratio;
        period.max_drawdown = backtest.max_drawdown;
        period.win_rate = backtest.win_rate;
        period.profit_factor = backtest.profit_factor;
        period.average_win = backtest.average_win;
        period.average_loss = backtest.average_loss;
        period.total_trades = backtest.total_trades;
        period.expectancy = backtest.expectancy;
        period.calmar_ratio = backtest.calmar_ratio;
        period.sortino_ratio = backtest.sortino_ratio;
        period.annualized_return = backtest.annualized_return;
        period.annualized_volatility = backtest.volatility * annualization;
        result.periods.push_back(period);

        if (days > longest_days) {
            longest_days = days;
            longest_trades = std::move(backtest.closed_trades);
            result.equity_returns = std::move(backtest.period_returns);
        }
    }

    double total_annualized = 0.0;
    double total_volatility = 0.0;
    double total_win_rate = 0.0;
    for (const auto& period : result.periods) {
        total_annualized += period.annualized_return;
        total_volatility += period.annualized_volatility;
        total_win_rate += period.win_rate;
        result.max_drawdown = std::max(result.max_drawdown, period.max_drawdown);
    }
    double count = static_cast<double>(result.periods.size());
    result.mean_annualized_return = total_annualized / count;
    result.mean_volatility = total_volatility / count;
    result.mean_win_rate = total_win_rate / count;

    result.risk_adjusted_performance = calculate_risk_adjusted_performance(result.periods);
    result.consistency = calculate_consistency(result.periods);
    result.regime_performance = calculate_regime_performance(longest_trades);

    double composite = calculate_composite(result);
    result.composite_score =
        convention_ == RankingConvention::LEGACY_LOWER_IS_BETTER ? -composite : composite;

    return result;
}

Result<ComparisonReport> StrategyComparator::compare(
    const std::vector<StrategyDefinition>& strategies, const std::vector<Bar>& bars,
    const std::vector<int>& windows) const {
    Logger::register_component("StrategyComparator");

    if (strategies.empty()) {
        return make_error<ComparisonReport>(ErrorCode::INVALID_ARGUMENT,
                                            "No strategies to compare", "StrategyComparator");
    }

    ComparisonReport report;
    report.convention = convention_;

    for (const auto& strategy : strategies) {
        auto evaluated = evaluate_strategy(strategy, bars, windows);
        if (evaluated.is_error()) {
            ERROR("Comparison failed: " << evaluated.error()->to_string());
            return make_error<ComparisonReport>(evaluated.error()->code(),
                                                evaluated.error()->what(), "StrategyComparator");
        }
        report.strategies.push_back(evaluated.take_value());
    }

    const RankingConvention convention = convention_;
    std::stable_sort(report.strategies.begin(), report.strategies.end(),
                     [convention](const StrategyResult& a, const StrategyResult& b) {
                         return ranks_before(a, b, convention);
                     });

    report.summary = summarize(report.strategies);
    report.recommendations = recommend(report.strategies);
    report.correlation_matrix = calculate_correlation_matrix(report.strategies);

    INFO("Compared " << report.strategies.size() << " strategies over " << windows.size()
                     << " windows, top ranked: " << report.strategies.front().strategy_name);
    return report;
}

}  // namespace backtest
}  // namespace stratlab
