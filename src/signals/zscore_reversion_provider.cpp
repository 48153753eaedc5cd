// src/signals/zscore_reversion_provider.cpp

#include "stratlab/signals/zscore_reversion_provider.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace stratlab {
namespace signals {

ZScoreReversionProvider::ZScoreReversionProvider(ZScoreReversionConfig config)
    : config_(std::move(config)) {}

std::vector<CandidateSignal> ZScoreReversionProvider::provide(
    const std::vector<Bar>& window) const {
    std::vector<CandidateSignal> signals;
    if (config_.lookback_period < 2 || config_.entry_threshold <= 0.0 ||
        window.size() < static_cast<size_t>(config_.lookback_period)) {
        return signals;
    }

    size_t start = window.size() - static_cast<size_t>(config_.lookback_period);
    double sum = 0.0;
    for (size_t i = start; i < window.size(); ++i) {
        sum += window[i].close;
    }
    double mean = sum / config_.lookback_period;

    double sq_sum = 0.0;
    for (size_t i = start; i < window.size(); ++i) {
        double diff = window[i].close - mean;
        sq_sum += diff * diff;
    }
    double std_dev = std::sqrt(sq_sum / config_.lookback_period);
    if (std_dev <= 0.0) {
        return signals;
    }

    double price = window.back().close;
    double z_score = (price - mean) / std_dev;
    if (std::abs(z_score) <= config_.entry_threshold) {
        return signals;
    }

    CandidateSignal signal;
    signal.confidence = std::min(100.0, 50.0 + 10.0 * std::abs(z_score));
    signal.strength = std::min(1.0, 0.75 * std::abs(z_score) / config_.entry_threshold);
    signal.take_profit = mean;
    if (z_score < 0.0) {
        signal.direction = SignalDirection::BUY;
        signal.stop_loss = price * (1.0 - config_.stop_loss_pct);
    } else {
        signal.direction = SignalDirection::SELL;
        signal.stop_loss = price * (1.0 + config_.stop_loss_pct);
    }
    signal.source = name();
    signals.push_back(signal);
    return signals;
}

}  // namespace signals
}  // namespace stratlab
