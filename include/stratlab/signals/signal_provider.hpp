// include/stratlab/signals/signal_provider.hpp
#pragma once

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace signals {

/**
 * @brief Direction proposed by a candidate signal
 */
enum class SignalDirection { BUY, SELL, HOLD };

inline std::string direction_to_string(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::BUY:
            return "BUY";
        case SignalDirection::SELL:
            return "SELL";
        default:
            return "HOLD";
    }
}

/**
 * @brief Map a tradeable direction onto an order side (HOLD maps to NONE)
 */
inline Side to_side(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::BUY:
            return Side::BUY;
        case SignalDirection::SELL:
            return Side::SELL;
        default:
            return Side::NONE;
    }
}

/**
 * @brief Output of a signal provider for a single bar
 *
 * Confidence is on a 0-100 scale. Strength is in [0, 1] and defaults to 1.0
 * for providers that do not grade it.
 */
struct CandidateSignal {
    SignalDirection direction{SignalDirection::HOLD};
    double confidence{0.0};
    double strength{1.0};
    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    std::optional<double> risk_reward_ratio;

    // Historical performance of this setup, used for the Kelly cap
    std::optional<double> win_rate;
    std::optional<double> average_win;
    std::optional<double> average_loss;

    std::string source;

    bool is_actionable() const {
        return direction != SignalDirection::HOLD;
    }

    /**
     * @brief Check that stop and target sit on the losing and winning side of the entry
     *
     * A long needs stop < entry < target, a short the mirror image. Missing
     * levels are not checked.
     */
    Result<void> check_levels(Price entry_price) const {
        if (direction == SignalDirection::HOLD) {
            return Result<void>();
        }
        const bool is_long = direction == SignalDirection::BUY;
        if (stop_loss && (is_long ? *stop_loss >= entry_price : *stop_loss <= entry_price)) {
            return make_error<void>(ErrorCode::INVALID_SIGNAL,
                                    direction_to_string(direction) + " stop " +
                                        std::to_string(*stop_loss) +
                                        " is not on the losing side of entry " +
                                        std::to_string(entry_price),
                                    "CandidateSignal");
        }
        if (take_profit &&
            (is_long ? *take_profit <= entry_price : *take_profit >= entry_price)) {
            return make_error<void>(ErrorCode::INVALID_SIGNAL,
                                    direction_to_string(direction) + " target " +
                                        std::to_string(*take_profit) +
                                        " is not on the winning side of entry " +
                                        std::to_string(entry_price),
                                    "CandidateSignal");
        }
        return Result<void>();
    }

    /**
     * @brief Reward-to-risk ratio, derived from stop and target when not supplied
     * @param entry_price Price the trade would be opened at
     * @return Ratio, or empty when neither the ratio nor both levels are known
     */
    std::optional<double> effective_risk_reward(Price entry_price) const {
        if (risk_reward_ratio) {
            return risk_reward_ratio;
        }
        if (!stop_loss || !take_profit) {
            return std::nullopt;
        }
        double risk = std::abs(entry_price - *stop_loss);
        if (risk <= 0.0) {
            return std::nullopt;
        }
        return std::abs(*take_profit - entry_price) / risk;
    }
};

/**
 * @brief Interface for pluggable signal generators
 *
 * Implementations must be deterministic for a given window and must not look
 * at anything beyond the last bar of the window. They may throw; the simulator
 * treats a throwing provider as having produced no signals for that bar.
 */
class SignalProvider {
public:
    virtual ~SignalProvider() = default;

    /**
     * @brief Produce candidate signals for the last bar of the window
     * @param window Bars up to and including the current bar, oldest first
     */
    virtual std::vector<CandidateSignal> provide(const std::vector<Bar>& window) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief A provider attached to a strategy with its confidence weight
 */
struct ProviderRegistration {
    std::shared_ptr<const SignalProvider> provider;
    double confidence_weight{1.0};
};

}  // namespace signals
}  // namespace stratlab
