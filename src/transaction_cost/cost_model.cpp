// src/transaction_cost/cost_model.cpp

#include "stratlab/transaction_cost/cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stratlab {
namespace transaction_cost {

nlohmann::json CostModelConfig::to_json() const {
    nlohmann::json j;
    j["commission_rate"] = commission_rate;
    j["slippage"] = slippage;
    j["price_impact"] = price_impact;
    j["liquidity_cost"] = liquidity_cost;
    j["latency_ms"] = latency_ms;
    j["default_average_volume"] = default_average_volume;
    j["version"] = version;
    return j;
}

void CostModelConfig::from_json(const nlohmann::json& j) {
    if (j.contains("commission_rate"))
        commission_rate = j.at("commission_rate").get<double>();
    if (j.contains("slippage"))
        slippage = j.at("slippage").get<double>();
    if (j.contains("price_impact"))
        price_impact = j.at("price_impact").get<double>();
    if (j.contains("liquidity_cost"))
        liquidity_cost = j.at("liquidity_cost").get<double>();
    if (j.contains("latency_ms"))
        latency_ms = j.at("latency_ms").get<double>();
    if (j.contains("default_average_volume"))
        default_average_volume = j.at("default_average_volume").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

CostModel::CostModel(CostModelConfig config) : config_(std::move(config)) {}

CostBreakdown CostModel::calculate_costs(double quantity, double price,
                                         std::optional<double> average_volume,
                                         std::optional<double> volatility) const {
    quantity = std::abs(quantity);
    double notional = quantity * price;

    double avg_volume = config_.default_average_volume;
    if (average_volume && *average_volume > 0.0) {
        avg_volume = *average_volume;
    }
    double participation = avg_volume > 0.0 ? std::min(quantity / avg_volume, 1.0) : 1.0;

    CostBreakdown costs;

    // Square-root law, capped at full participation
    costs.slippage = config_.slippage * std::sqrt(participation) * 0.01;

    costs.impact = config_.price_impact * std::sqrt(notional / 100000.0) * 0.0001;

    costs.liquidity = config_.liquidity_cost * (1.0 + 2.0 * participation) * 0.001;

    if (volatility) {
        double latency_window = config_.latency_ms / 1000.0;
        costs.latency = notional * std::max(0.0, *volatility) *
                        std::sqrt(std::max(0.0, latency_window)) * 0.1;
    }

    costs.commission = notional * commission_rate(notional);

    return costs;
}

double CostModel::commission_rate(double notional) const {
    if (notional >= 10000000.0) {
        return config_.commission_rate * 0.2;
    }
    if (notional >= 1000000.0) {
        return config_.commission_rate * 0.4;
    }
    if (notional >= 100000.0) {
        return config_.commission_rate * 0.6;
    }
    return config_.commission_rate;
}

std::optional<double> CostModel::trailing_volatility(const std::vector<Bar>& bars,
                                                     size_t end_index, size_t window) {
    if (bars.empty() || window < 2 || end_index >= bars.size()) {
        return std::nullopt;
    }
    size_t start = end_index + 1 >= window ? end_index + 1 - window : 0;
    if (end_index - start + 1 < 2) {
        return std::nullopt;
    }

    std::vector<double> returns;
    returns.reserve(end_index - start);
    for (size_t i = start + 1; i <= end_index; ++i) {
        double prev = bars[i - 1].close;
        if (prev <= 0.0) {
            continue;
        }
        returns.push_back((bars[i].close - prev) / prev);
    }
    if (returns.empty()) {
        return std::nullopt;
    }

    double mean = 0.0;
    for (double r : returns) {
        mean += r;
    }
    mean /= static_cast<double>(returns.size());

    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= static_cast<double>(returns.size());

    return std::sqrt(variance) * std::sqrt(252.0);
}

std::optional<double> CostModel::trailing_average_volume(const std::vector<Bar>& bars,
                                                         size_t end_index, size_t window) {
    if (bars.empty() || window == 0 || end_index >= bars.size()) {
        return std::nullopt;
    }
    size_t start = end_index + 1 >= window ? end_index + 1 - window : 0;

    double total = 0.0;
    for (size_t i = start; i <= end_index; ++i) {
        total += bars[i].volume;
    }
    double mean = total / static_cast<double>(end_index - start + 1);
    if (mean <= 0.0) {
        return std::nullopt;
    }
    return mean;
}

}  // namespace transaction_cost
}  // namespace stratlab
