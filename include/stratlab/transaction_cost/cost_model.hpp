// include/stratlab/transaction_cost/cost_model.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace transaction_cost {

/**
 * @brief Coefficients of the execution cost model
 */
struct CostModelConfig : public ConfigBase {
    double commission_rate{0.001};         // Full-tier commission as fraction of notional
    double slippage{0.001};                // Square-root slippage coefficient
    double price_impact{0.001};            // Notional-driven impact coefficient
    double liquidity_cost{0.001};          // Participation-driven liquidity coefficient
    double latency_ms{50.0};               // Order latency window in milliseconds
    double default_average_volume{1e6};    // Used when no volume history is available

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Cost components of a single fill, all in currency and non-negative
 */
struct CostBreakdown {
    double commission = 0.0;
    double slippage = 0.0;
    double impact = 0.0;
    double liquidity = 0.0;
    double latency = 0.0;

    double total() const {
        return commission + slippage + impact + liquidity + latency;
    }
};

/**
 * @brief Execution cost model combining commission and implicit costs
 *
 * - Slippage follows the square-root law on participation
 * - Impact grows with the square root of notional
 * - Liquidity cost grows linearly with participation
 * - Latency cost scales with annualized volatility over the latency window
 * - Commission is tiered by notional
 *
 * Stateless; every call is a pure function of its arguments and the config.
 */
class CostModel {
public:
    explicit CostModel(CostModelConfig config = CostModelConfig());

    /**
     * @brief Calculate all cost components of a fill
     *
     * @param quantity Filled quantity (absolute value used)
     * @param price Fill price
     * @param average_volume Trailing average volume, default volume when empty
     * @param volatility Annualized trailing volatility, latency cost is zero when empty
     * @return Detailed cost breakdown
     */
    CostBreakdown calculate_costs(double quantity, double price,
                                  std::optional<double> average_volume,
                                  std::optional<double> volatility) const;

    /**
     * @brief Commission rate for a notional tier
     *
     * Full rate below 100k, 60% from 100k, 40% from 1M, 20% from 10M.
     */
    double commission_rate(double notional) const;

    /**
     * @brief Annualized volatility of simple close-to-close returns
     *
     * Uses the `window` closes ending at `end_index` (inclusive) and never
     * looks past it. Population standard deviation scaled by sqrt(252).
     *
     * @return Empty when fewer than two prices are available
     */
    static std::optional<double> trailing_volatility(const std::vector<Bar>& bars,
                                                     size_t end_index, size_t window);

    /**
     * @brief Mean volume of the `window` bars ending at `end_index` (inclusive)
     * @return Empty when no bar in the window reports positive volume
     */
    static std::optional<double> trailing_average_volume(const std::vector<Bar>& bars,
                                                         size_t end_index, size_t window);

    const CostModelConfig& config() const {
        return config_;
    }

private:
    CostModelConfig config_;
};

}  // namespace transaction_cost
}  // namespace stratlab
