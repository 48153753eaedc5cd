// include/stratlab/optimization/portfolio_optimizer.hpp
#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/error.hpp"

namespace stratlab {

/**
 * @brief Configuration for mean-variance allocation across strategies
 */
struct PortfolioOptConfig : public ConfigBase {
    int max_iterations{100};   // Gradient steps
    double step_size{0.01};    // Weight nudge per unit of marginal utility
    int frontier_samples{100};  // Random portfolios on the sampled frontier
    uint32_t seed{7};
    double var_z_score{1.645};  // 95% one-sided

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_iterations"] = max_iterations;
        j["step_size"] = step_size;
        j["frontier_samples"] = frontier_samples;
        j["seed"] = seed;
        j["var_z_score"] = var_z_score;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_iterations")) max_iterations = j.at("max_iterations").get<int>();
        if (j.contains("step_size")) step_size = j.at("step_size").get<double>();
        if (j.contains("frontier_samples")) {
            frontier_samples = j.at("frontier_samples").get<int>();
        }
        if (j.contains("seed")) seed = j.at("seed").get<uint32_t>();
        if (j.contains("var_z_score")) var_z_score = j.at("var_z_score").get<double>();
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Return and risk estimate of one strategy
 */
struct StrategyEstimate {
    std::string name;
    double expected_return = 0.0;  // Annualized
    double volatility = 0.0;       // Annualized, non-negative
    double max_drawdown = 0.0;
};

struct StrategyWeight {
    std::string strategy;
    double weight = 0.0;
    double expected_return = 0.0;
    double risk_contribution = 0.0;
};

struct RiskContribution {
    std::string strategy;
    double contribution = 0.0;  // w_i * (Sigma w)_i / sigma_p
    double percentage = 0.0;    // Share of portfolio volatility
};

struct FrontierPoint {
    double expected_return = 0.0;
    double volatility = 0.0;
    double sharpe = 0.0;
};

struct EfficientFrontier {
    std::vector<FrontierPoint> portfolios;
    FrontierPoint optimal_point;  // Highest Sharpe sample
};

/**
 * @brief Result of portfolio optimization
 */
struct OptimalPortfolio {
    std::vector<StrategyWeight> weights;  // Non-negative, sum to 1
    double expected_return = 0.0;
    double expected_volatility = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;  // Weight-averaged strategy drawdowns
    double var_95 = 0.0;        // Parametric: r_p - z * sigma_p
    std::vector<RiskContribution> risk_contributions;
    EfficientFrontier efficient_frontier;
    int iterations = 0;
};

/**
 * @brief Long-only mean-variance allocator
 *
 * Starts from equal weights and nudges each weight along
 * (r_i - r_p) / sigma_p, clamping at zero and renormalizing every step.
 * Portfolio volatility is sqrt(w' D C D w) with D the diagonal of
 * volatilities and C the correlation matrix.
 */
class PortfolioOptimizer {
public:
    explicit PortfolioOptimizer(PortfolioOptConfig config = PortfolioOptConfig());

    /**
     * @brief Compute the allocation
     * @param estimates Per-strategy return and volatility estimates
     * @param correlation Correlation matrix in the same order, identity when empty
     * @return Optimal portfolio or INVALID_ARGUMENT for malformed inputs
     */
    Result<OptimalPortfolio> optimize(const std::vector<StrategyEstimate>& estimates,
                                      const std::vector<std::vector<double>>& correlation) const;

    /**
     * @brief sqrt(w' Sigma w)
     */
    static double portfolio_volatility(const Eigen::VectorXd& weights,
                                       const Eigen::MatrixXd& covariance);

    const PortfolioOptConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_inputs(const std::vector<StrategyEstimate>& estimates,
                                 const std::vector<std::vector<double>>& correlation) const;

    EfficientFrontier sample_frontier(const Eigen::VectorXd& returns,
                                      const Eigen::MatrixXd& covariance) const;

    PortfolioOptConfig config_;
};

}  // namespace stratlab
