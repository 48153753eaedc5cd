// src/signals/ema_crossover_provider.cpp

#include "stratlab/signals/ema_crossover_provider.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace stratlab {
namespace signals {

EmaCrossoverProvider::EmaCrossoverProvider(EmaCrossoverConfig config)
    : config_(std::move(config)) {}

std::vector<double> EmaCrossoverProvider::calculate_ema(const std::vector<double>& prices,
                                                        int window) {
    std::vector<double> ema(prices.size(), 0.0);
    if (prices.empty() || window <= 0) {
        return ema;
    }
    double lambda = 2.0 / (window + 1);
    ema[0] = prices[0];

    for (size_t i = 1; i < prices.size(); ++i) {
        ema[i] = lambda * prices[i] + (1 - lambda) * ema[i - 1];
    }
    return ema;
}

std::vector<CandidateSignal> EmaCrossoverProvider::provide(const std::vector<Bar>& window) const {
    std::vector<CandidateSignal> signals;
    if (config_.short_window <= 0 || config_.long_window <= config_.short_window ||
        window.size() < static_cast<size_t>(config_.long_window) + 1) {
        return signals;
    }

    size_t history = std::max(static_cast<size_t>(config_.history_bars),
                              static_cast<size_t>(config_.long_window) + 1);
    size_t start = window.size() > history ? window.size() - history : 0;

    std::vector<double> closes;
    closes.reserve(window.size() - start);
    for (size_t i = start; i < window.size(); ++i) {
        closes.push_back(window[i].close);
    }

    auto fast = calculate_ema(closes, config_.short_window);
    auto slow = calculate_ema(closes, config_.long_window);

    size_t last = closes.size() - 1;
    double prev_gap = fast[last - 1] - slow[last - 1];
    double gap = fast[last] - slow[last];

    SignalDirection direction = SignalDirection::HOLD;
    if (prev_gap <= 0.0 && gap > 0.0) {
        direction = SignalDirection::BUY;
    } else if (prev_gap >= 0.0 && gap < 0.0) {
        direction = SignalDirection::SELL;
    }
    if (direction == SignalDirection::HOLD || slow[last] <= 0.0) {
        return signals;
    }

    double price = closes[last];
    double relative_gap = std::abs(gap) / slow[last];

    CandidateSignal signal;
    signal.direction = direction;
    signal.confidence = std::min(100.0, config_.base_confidence + 1000.0 * relative_gap);
    signal.strength = std::min(1.0, 0.6 + 20.0 * relative_gap);
    if (direction == SignalDirection::BUY) {
        signal.stop_loss = price * (1.0 - config_.stop_loss_pct);
        signal.take_profit = price * (1.0 + config_.take_profit_pct);
    } else {
        signal.stop_loss = price * (1.0 + config_.stop_loss_pct);
        signal.take_profit = price * (1.0 - config_.take_profit_pct);
    }
    signal.source = name();
    signals.push_back(signal);
    return signals;
}

}  // namespace signals
}  // namespace stratlab
