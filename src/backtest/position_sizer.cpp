// src/backtest/position_sizer.cpp

#include "stratlab/backtest/position_sizer.hpp"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace backtest {

Result<void> PositionSizer::validate_inputs(double capital, Price price, Price stop_loss) const {
    if (!(capital > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Capital must be positive to size a trade", "PositionSizer");
    }
    if (!(price > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Price must be positive to size a trade", "PositionSizer");
    }
    if (std::abs(price - stop_loss) <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Stop distance is zero", "PositionSizer");
    }
    return Result<void>();
}

std::optional<Quantity> PositionSizer::kelly_cap(double capital,
                                                 const signals::CandidateSignal& signal,
                                                 Price price) {
    if (!signal.win_rate || !signal.average_win || !signal.average_loss ||
        *signal.average_win <= 0.0 || price <= 0.0) {
        return std::nullopt;
    }
    double p = *signal.win_rate;
    double avg_win = *signal.average_win;
    double avg_loss = std::abs(*signal.average_loss);

    double kelly = (p * avg_win - (1.0 - p) * avg_loss) / avg_win;
    return capital * std::max(0.0, kelly * KELLY_FRACTION) / price;
}

Quantity PositionSizer::calculate_quantity(double capital, const signals::CandidateSignal& signal,
                                           Price price, Price stop_loss) const {
    if (validate_inputs(capital, price, stop_loss).is_error()) {
        return 0.0;
    }

    double risk_amount = capital * risk_per_trade_;
    Quantity quantity = risk_amount / std::abs(price - stop_loss);

    auto kelly_limit = kelly_cap(capital, signal, price);
    if (kelly_limit) {
        quantity = std::min(quantity, *kelly_limit);
    }

    quantity = std::min(quantity, capital * MAX_POSITION_FRACTION / price);

    return std::floor(quantity * 100.0) / 100.0;
}

}  // namespace backtest
}  // namespace stratlab
