// include/stratlab/backtest/position_sizer.hpp
#pragma once

#include <optional>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/signals/signal_provider.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Converts capital, risk tolerance and a signal into a trade quantity
 *
 * quantity = capital * risk_per_trade / |price - stop|, capped by a
 * quarter-Kelly fraction when the signal carries its historical win/loss
 * statistics and by a hard ceiling of 20% of capital. Floored to 2 decimals.
 */
class PositionSizer {
public:
    static constexpr double MAX_POSITION_FRACTION = 0.20;
    static constexpr double KELLY_FRACTION = 0.25;

    explicit PositionSizer(double risk_per_trade) : risk_per_trade_(risk_per_trade) {}

    /**
     * @brief Size a trade
     * @param capital Capital available for sizing
     * @param signal Candidate signal (Kelly inputs are read from it)
     * @param price Entry price
     * @param stop_loss Stop level the trade will carry
     * @return Quantity, or 0 when the trade must be rejected
     */
    Quantity calculate_quantity(double capital, const signals::CandidateSignal& signal,
                                Price price, Price stop_loss) const;

    /**
     * @brief Report why a trade cannot be sized
     * @return INVALID_ARGUMENT on non-positive capital or price, or zero stop distance
     */
    Result<void> validate_inputs(double capital, Price price, Price stop_loss) const;

    /**
     * @brief Quarter-Kelly cap on quantity, empty when the signal lacks Kelly inputs
     */
    static std::optional<Quantity> kelly_cap(double capital,
                                             const signals::CandidateSignal& signal,
                                             Price price);

private:
    double risk_per_trade_;
};

}  // namespace backtest
}  // namespace stratlab
