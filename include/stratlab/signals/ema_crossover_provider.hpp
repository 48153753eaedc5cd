// include/stratlab/signals/ema_crossover_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "stratlab/signals/signal_provider.hpp"

namespace stratlab {
namespace signals {

/**
 * @brief Configuration for the EMA crossover provider
 */
struct EmaCrossoverConfig {
    int short_window{8};             // Fast EMA span
    int long_window{32};             // Slow EMA span
    int history_bars{128};           // Trailing closes the averages are seeded from
    double base_confidence{75.0};    // Confidence of a bare crossover
    double stop_loss_pct{0.02};      // Stop distance as fraction of price
    double take_profit_pct{0.04};    // Target distance as fraction of price
};

/**
 * @brief Emits a signal on the bar where the fast EMA crosses the slow EMA
 *
 * BUY when the fast EMA crosses above the slow one, SELL when it crosses
 * below. Confidence and strength grow with the gap between the two averages.
 * Only the last history_bars closes are used, so the cost per bar is constant.
 */
class EmaCrossoverProvider : public SignalProvider {
public:
    explicit EmaCrossoverProvider(EmaCrossoverConfig config = EmaCrossoverConfig());

    std::vector<CandidateSignal> provide(const std::vector<Bar>& window) const override;

    std::string name() const override {
        return "ema_crossover";
    }

    /**
     * @brief Exponentially weighted moving average with lambda = 2 / (window + 1)
     */
    static std::vector<double> calculate_ema(const std::vector<double>& prices, int window);

private:
    EmaCrossoverConfig config_;
};

}  // namespace signals
}  // namespace stratlab
