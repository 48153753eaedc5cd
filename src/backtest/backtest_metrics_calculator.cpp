// src/backtest/backtest_metrics_calculator.cpp

#include "stratlab/backtest/backtest_metrics_calculator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <numeric>
#include "stratlab/core/time_utils.hpp"

namespace stratlab {
namespace backtest {

namespace {
constexpr double SECONDS_PER_YEAR = 365.0 * 24.0 * 3600.0;
}

// ========== Helpers ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = calculate_mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

// ========== Return Calculations ==========

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<EquityPoint>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);

    for (size_t i = 1; i < equity_curve.size(); ++i) {
        double prev = equity_curve[i - 1].equity;
        if (prev != 0.0) {
            returns.push_back((equity_curve[i].equity - prev) / prev);
        } else {
            returns.push_back(0.0);
        }
    }
    return returns;
}

double BacktestMetricsCalculator::calculate_annualized_return(
    double initial_capital, const std::vector<EquityPoint>& equity_curve) const {
    if (equity_curve.size() < 2 || initial_capital <= 0.0) {
        return 0.0;
    }
    auto span = std::chrono::duration_cast<std::chrono::seconds>(
        equity_curve.back().timestamp - equity_curve.front().timestamp);
    double years = static_cast<double>(span.count()) / SECONDS_PER_YEAR;
    double growth = equity_curve.back().equity / initial_capital;
    if (years <= 0.0 || growth <= 0.0) {
        return 0.0;
    }
    return std::pow(growth, 1.0 / years) - 1.0;
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                         double risk_free_rate) const {
    double volatility = calculate_std_dev(returns);
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (calculate_mean(returns) - risk_free_rate / 252.0) / volatility;
}

RatioValue BacktestMetricsCalculator::calculate_sortino_ratio(
    const std::vector<double>& returns) const {
    RatioValue ratio;
    if (returns.empty()) {
        ratio.state = RatioState::INSUFFICIENT_DATA;
        return ratio;
    }

    double mean_return = calculate_mean(returns);
    double downside_sum = 0.0;
    int downside_count = 0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sum += (r - mean_return) * (r - mean_return);
            ++downside_count;
        }
    }

    if (downside_count == 0) {
        ratio.state = RatioState::NO_DOWNSIDE;
        return ratio;
    }

    double downside_deviation = std::sqrt(downside_sum / downside_count);
    ratio.state = RatioState::DEFINED;
    ratio.value = downside_deviation > 0.0 ? mean_return / downside_deviation : 0.0;
    return ratio;
}

double BacktestMetricsCalculator::calculate_calmar_ratio(double total_return,
                                                         double initial_capital,
                                                         double max_drawdown) const {
    if (max_drawdown <= 0.0 || initial_capital <= 0.0) {
        return 0.0;
    }
    return (total_return / initial_capital) / max_drawdown;
}

// ========== Drawdown and Tail Risk ==========

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<EquityPoint>& equity_curve) const {
    double max_dd = 0.0;
    for (const auto& point : equity_curve) {
        max_dd = std::max(max_dd, point.drawdown);
    }
    return max_dd;
}

double BacktestMetricsCalculator::calculate_var_95(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t var_index = static_cast<size_t>(std::floor(sorted_returns.size() * 0.05));
    return sorted_returns[std::min(var_index, sorted_returns.size() - 1)];
}

double BacktestMetricsCalculator::calculate_cvar_95(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t var_index = std::min(static_cast<size_t>(std::floor(sorted_returns.size() * 0.05)),
                                sorted_returns.size() - 1);
    double tail_sum = std::accumulate(sorted_returns.begin(),
                                      sorted_returns.begin() + var_index + 1, 0.0);
    return tail_sum / static_cast<double>(var_index + 1);
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<Trade>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());

    double total_hours = 0.0;
    for (const auto& trade : trades) {
        double pnl = trade.pnl.value_or(0.0);

        if (trade.is_push) {
            stats.push_trades++;
        } else if (trade.is_win) {
            stats.winning_trades++;
            stats.total_profit += std::abs(pnl);
        } else {
            stats.losing_trades++;
            stats.total_loss += std::abs(pnl);
        }
        if (trade.is_partial_win) {
            stats.partial_wins++;
        }

        stats.total_commission += trade.costs.commission;
        stats.total_slippage += trade.costs.slippage;
        stats.total_costs += trade.costs.total();

        if (trade.exit_time) {
            total_hours += std::chrono::duration<double, std::ratio<3600>>(*trade.exit_time -
                                                                           trade.entry_time)
                               .count();
        }
    }

    int decided = stats.winning_trades + stats.losing_trades;
    stats.win_rate = decided > 0 ? static_cast<double>(stats.winning_trades) / decided : 0.0;
    stats.avg_win = stats.winning_trades > 0 ? stats.total_profit / stats.winning_trades : 0.0;
    stats.avg_loss = stats.losing_trades > 0 ? -stats.total_loss / stats.losing_trades : 0.0;
    stats.profit_factor = stats.total_loss > 0.0 ? stats.total_profit / stats.total_loss : 0.0;
    stats.avg_duration_hours = trades.empty() ? 0.0 : total_hours / trades.size();

    return stats;
}

double BacktestMetricsCalculator::calculate_kelly_criterion(const TradeStatistics& stats) const {
    if (stats.winning_trades == 0 || stats.losing_trades == 0 || stats.avg_win <= 0.0) {
        return 0.0;
    }
    double p = static_cast<double>(stats.winning_trades) /
               (stats.winning_trades + stats.losing_trades);
    return p - (1.0 - p) * (std::abs(stats.avg_loss) / stats.avg_win);
}

std::pair<int, int> BacktestMetricsCalculator::calculate_consecutive_streaks(
    const std::vector<Trade>& trades) const {
    int max_wins = 0;
    int max_losses = 0;
    int wins = 0;
    int losses = 0;

    for (const auto& trade : trades) {
        if (trade.is_push) {
            wins = 0;
            losses = 0;
        } else if (trade.is_win) {
            ++wins;
            losses = 0;
            max_wins = std::max(max_wins, wins);
        } else {
            ++losses;
            wins = 0;
            max_losses = std::max(max_losses, losses);
        }
    }
    return {max_wins, max_losses};
}

std::vector<MonthlyReturn> BacktestMetricsCalculator::calculate_monthly_returns(
    const std::vector<EquityPoint>& equity_curve) const {
    // Keys sort chronologically as YYYY-MM
    std::map<std::string, std::vector<double>> by_month;
    for (const auto& point : equity_curve) {
        by_month[core::month_key(point.timestamp)].push_back(point.equity);
    }

    std::vector<MonthlyReturn> monthly;
    for (const auto& entry : by_month) {
        const auto& values = entry.second;
        if (values.size() < 2 || values.front() == 0.0) {
            continue;
        }
        std::vector<double> returns;
        returns.reserve(values.size() - 1);
        for (size_t i = 1; i < values.size(); ++i) {
            returns.push_back(values[i - 1] != 0.0 ? (values[i] - values[i - 1]) / values[i - 1]
                                                   : 0.0);
        }

        MonthlyReturn month;
        month.month = entry.first;
        month.return_pct = (values.back() - values.front()) / values.front();
        month.volatility = calculate_std_dev(returns) * std::sqrt(21.0);
        monthly.push_back(month);
    }
    return monthly;
}

// ========== Full Report ==========

void BacktestMetricsCalculator::calculate_metrics(BacktestResult& result, double initial_capital,
                                                  double risk_free_rate) const {
    const auto& trades = result.closed_trades;
    const auto& curve = result.equity_curve;

    double final_equity = curve.empty() ? initial_capital : curve.back().equity;
    result.total_return = final_equity - initial_capital;
    result.total_return_percent =
        initial_capital > 0.0 ? result.total_return / initial_capital * 100.0 : 0.0;
    result.annualized_return = calculate_annualized_return(initial_capital, curve);

    TradeStatistics stats = calculate_trade_statistics(trades);
    result.total_trades = stats.total_trades;
    result.winning_trades = stats.winning_trades;
    result.losing_trades = stats.losing_trades;
    result.push_trades = stats.push_trades;
    result.partial_wins = stats.partial_wins;
    result.win_rate = stats.win_rate;
    result.average_win = stats.avg_win;
    result.average_loss = stats.avg_loss;
    result.profit_factor = stats.profit_factor;
    result.expectancy = stats.total_trades > 0 ? result.total_return / stats.total_trades : 0.0;
    result.average_trade_duration_hours = stats.avg_duration_hours;
    result.total_commission = stats.total_commission;
    result.total_slippage = stats.total_slippage;
    result.total_costs = stats.total_costs;
    result.kelly_criterion = calculate_kelly_criterion(stats);

    result.best_trade.reset();
    result.worst_trade.reset();
    for (const auto& trade : trades) {
        double pnl = trade.pnl.value_or(0.0);
        if (!result.best_trade || pnl > result.best_trade->pnl.value_or(0.0)) {
            result.best_trade = trade;
        }
        if (!result.worst_trade || pnl < result.worst_trade->pnl.value_or(0.0)) {
            result.worst_trade = trade;
        }
    }

    auto streaks = calculate_consecutive_streaks(trades);
    result.max_consecutive_wins = streaks.first;
    result.max_consecutive_losses = streaks.second;

    result.period_returns = calculate_returns_from_equity(curve);
    result.volatility = calculate_std_dev(result.period_returns);
    result.sharpe_ratio = calculate_sharpe_ratio(result.period_returns, risk_free_rate);
    result.sortino_ratio = calculate_sortino_ratio(result.period_returns);
    result.max_drawdown = calculate_max_drawdown(curve);
    result.calmar_ratio =
        calculate_calmar_ratio(result.total_return, initial_capital, result.max_drawdown);
    result.var_95 = calculate_var_95(result.period_returns);
    result.cvar_95 = calculate_cvar_95(result.period_returns);
    result.monthly_returns = calculate_monthly_returns(curve);
}

}  // namespace backtest
}  // namespace stratlab
