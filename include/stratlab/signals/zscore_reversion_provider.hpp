// include/stratlab/signals/zscore_reversion_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "stratlab/signals/signal_provider.hpp"

namespace stratlab {
namespace signals {

/**
 * @brief Configuration for the z-score mean reversion provider
 */
struct ZScoreReversionConfig {
    int lookback_period{20};     // Lookback for moving average and deviation
    double entry_threshold{2.0};  // Z-score magnitude that triggers a signal
    double stop_loss_pct{0.05};   // Stop loss percentage (5%)
};

/**
 * @brief Simple mean reversion signals using z-score
 *
 * - Moving average and standard deviation over the lookback period
 * - SELL when z-score > entry_threshold (price too high)
 * - BUY when z-score < -entry_threshold (price too low)
 * - Target is the moving average
 */
class ZScoreReversionProvider : public SignalProvider {
public:
    explicit ZScoreReversionProvider(ZScoreReversionConfig config = ZScoreReversionConfig());

    std::vector<CandidateSignal> provide(const std::vector<Bar>& window) const override;

    std::string name() const override {
        return "zscore_reversion";
    }

private:
    ZScoreReversionConfig config_;
};

}  // namespace signals
}  // namespace stratlab
