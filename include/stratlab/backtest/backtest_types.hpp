// include/stratlab/backtest/backtest_types.hpp
#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/transaction_cost/cost_model.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Reason a simulated trade was closed, in exit priority order
 */
enum class ExitReason {
    NONE,         // Still open
    STOP_LOSS,
    TAKE_PROFIT,
    SIGNAL_EXIT,  // Opposing high-confidence signal
    TIME_EXIT,    // Holding period exceeded
    END_OF_RUN    // Forced close at the last bar
};

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS:
            return "stop_loss";
        case ExitReason::TAKE_PROFIT:
            return "take_profit";
        case ExitReason::SIGNAL_EXIT:
            return "signal_exit";
        case ExitReason::TIME_EXIT:
            return "time_exit";
        case ExitReason::END_OF_RUN:
            return "end_of_run";
        default:
            return "open";
    }
}

/**
 * @brief A simulated position from open to close
 *
 * Quantity, entry and costs are fixed when the trade opens. The exit fields
 * are written exactly once, by close().
 */
struct Trade {
    int id = 0;
    Side side = Side::NONE;
    Price entry_price = 0.0;
    Timestamp entry_time;
    std::optional<Price> exit_price;
    std::optional<Timestamp> exit_time;
    Quantity quantity = 0.0;
    Price stop_loss = 0.0;
    std::optional<Price> take_profit;
    transaction_cost::CostBreakdown costs;
    std::optional<double> pnl;
    ExitReason exit_reason = ExitReason::NONE;

    // Originating signal
    double confidence = 0.0;
    std::string source;
    std::vector<std::string> market_conditions;

    double risk_adjusted_return = 0.0;
    bool is_win = false;
    bool is_push = false;
    bool is_partial_win = false;

    bool is_open() const {
        return !exit_time.has_value();
    }

    double total_cost() const {
        return costs.total();
    }

    /**
     * @brief Mark-to-market P&L at a price, net of the costs paid at entry
     */
    double unrealized_pnl(Price current_price) const {
        double gross = side == Side::BUY ? (current_price - entry_price) * quantity
                                         : (entry_price - current_price) * quantity;
        return gross - costs.total();
    }

    /**
     * @brief Close the trade and classify its outcome
     *
     * @param price Exit price
     * @param time Exit time, not earlier than the entry time
     * @param reason Why the trade closed
     * @return Realized P&L net of costs, or an error if the trade is already
     *         closed or the exit precedes the entry
     */
    Result<double> close(Price price, Timestamp time, ExitReason reason) {
        if (!is_open()) {
            return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                      "Trade " + std::to_string(id) + " is already closed",
                                      "Trade");
        }
        if (time < entry_time) {
            return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                      "Exit time precedes entry time for trade " +
                                          std::to_string(id),
                                      "Trade");
        }

        double realized = unrealized_pnl(price);
        exit_price = price;
        exit_time = time;
        exit_reason = reason;
        pnl = realized;

        double risk = std::abs(entry_price - stop_loss) * quantity;
        risk_adjusted_return = risk > 0.0 ? std::abs(realized) / risk : 0.0;
        is_win = realized > 0.0;
        is_push = std::abs(realized) < costs.total();
        is_partial_win = realized > 0.0 && risk_adjusted_return < 1.0;
        return realized;
    }
};

/**
 * @brief One sample of the equity curve, taken after each bar
 */
struct EquityPoint {
    Timestamp timestamp;
    double equity = 0.0;
    double drawdown = 0.0;  // Fraction of running peak, in [0, 1]
};

/**
 * @brief Equity fell below the margin requirement on a bar
 *
 * Reported only; the simulator does not liquidate.
 */
struct MarginEvent {
    Timestamp timestamp;
    double equity = 0.0;
    double capital = 0.0;
    double required_equity = 0.0;
};

/**
 * @brief Whether a ratio could be computed
 */
enum class RatioState {
    DEFINED,
    NO_DOWNSIDE,       // No negative returns, ratio is unbounded
    INSUFFICIENT_DATA  // No returns at all
};

inline std::string ratio_state_to_string(RatioState state) {
    switch (state) {
        case RatioState::DEFINED:
            return "DEFINED";
        case RatioState::NO_DOWNSIDE:
            return "NO_DOWNSIDE";
        default:
            return "INSUFFICIENT_DATA";
    }
}

/**
 * @brief A ratio together with its definedness state
 */
struct RatioValue {
    RatioState state = RatioState::INSUFFICIENT_DATA;
    double value = 0.0;  // Meaningful only when state is DEFINED

    bool is_defined() const {
        return state == RatioState::DEFINED;
    }

    double value_or(double fallback) const {
        return is_defined() ? value : fallback;
    }
};

struct MonthlyReturn {
    std::string month;  // YYYY-MM, UTC
    double return_pct = 0.0;
    double volatility = 0.0;
};

/**
 * @brief Full report of one simulation run
 */
struct BacktestResult {
    std::string strategy_name;

    std::vector<Trade> closed_trades;
    std::vector<EquityPoint> equity_curve;
    std::vector<MarginEvent> margin_events;
    int provider_failures = 0;
    bool drawdown_limit_breached = false;

    // Returns
    double total_return = 0.0;          // Currency
    double total_return_percent = 0.0;  // Percent of initial capital
    double annualized_return = 0.0;

    // Trade statistics
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int push_trades = 0;
    int partial_wins = 0;
    double win_rate = 0.0;  // Fraction, pushes excluded
    double average_win = 0.0;
    double average_loss = 0.0;  // Mean P&L of losing trades (negative)
    double profit_factor = 0.0;
    double expectancy = 0.0;
    std::optional<Trade> best_trade;
    std::optional<Trade> worst_trade;
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
    double average_trade_duration_hours = 0.0;

    // Risk
    std::vector<double> period_returns;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    RatioValue sortino_ratio;
    double max_drawdown = 0.0;
    double calmar_ratio = 0.0;
    double var_95 = 0.0;
    double cvar_95 = 0.0;
    double kelly_criterion = 0.0;
    std::vector<MonthlyReturn> monthly_returns;

    // Costs
    double total_commission = 0.0;
    double total_slippage = 0.0;
    double total_costs = 0.0;

    bool had_margin_call() const {
        return !margin_events.empty();
    }
};

}  // namespace backtest
}  // namespace stratlab
