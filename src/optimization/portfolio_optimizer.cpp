// src/optimization/portfolio_optimizer.cpp

#include "stratlab/optimization/portfolio_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>
#include "stratlab/core/logger.hpp"

namespace stratlab {

PortfolioOptimizer::PortfolioOptimizer(PortfolioOptConfig config) : config_(std::move(config)) {}

Result<void> PortfolioOptimizer::validate_inputs(
    const std::vector<StrategyEstimate>& estimates,
    const std::vector<std::vector<double>>& correlation) const {
    if (estimates.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No strategies to allocate across",
                                "PortfolioOptimizer");
    }

    if (!correlation.empty() && correlation.size() != estimates.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Correlation matrix size " + std::to_string(correlation.size()) +
                                    " does not match " + std::to_string(estimates.size()) +
                                    " strategies",
                                "PortfolioOptimizer");
    }

    for (const auto& row : correlation) {
        if (row.size() != correlation.size()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Correlation matrix must be square", "PortfolioOptimizer");
        }
    }

    for (const auto& estimate : estimates) {
        if (estimate.volatility < 0.0 || !std::isfinite(estimate.volatility) ||
            !std::isfinite(estimate.expected_return)) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid return or volatility estimate for " + estimate.name,
                                    "PortfolioOptimizer");
        }
    }

    if (config_.max_iterations < 0 || config_.frontier_samples < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Iteration and sample counts cannot be negative",
                                "PortfolioOptimizer");
    }
    return Result<void>();
}

double PortfolioOptimizer::portfolio_volatility(const Eigen::VectorXd& weights,
                                                const Eigen::MatrixXd& covariance) {
    double variance = weights.dot(covariance * weights);
    return variance > 0.0 ? std::sqrt(variance) : 0.0;
}

EfficientFrontier PortfolioOptimizer::sample_frontier(const Eigen::VectorXd& returns,
                                                      const Eigen::MatrixXd& covariance) const {
    EfficientFrontier frontier;
    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const Eigen::Index n = returns.size();

    for (int s = 0; s < config_.frontier_samples; ++s) {
        Eigen::VectorXd w(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            w(i) = uniform(rng);
        }
        double total = w.sum();
        if (total <= 0.0) {
            w.setConstant(1.0 / static_cast<double>(n));
        } else {
            w /= total;
        }

        FrontierPoint point;
        point.expected_return = w.dot(returns);
        point.volatility = portfolio_volatility(w, covariance);
        point.sharpe = point.volatility > 0.0 ? point.expected_return / point.volatility : 0.0;
        frontier.portfolios.push_back(point);
    }

    if (!frontier.portfolios.empty()) {
        frontier.optimal_point = *std::max_element(
            frontier.portfolios.begin(), frontier.portfolios.end(),
            [](const FrontierPoint& a, const FrontierPoint& b) { return a.sharpe < b.sharpe; });
    }
    return frontier;
}

Result<OptimalPortfolio> PortfolioOptimizer::optimize(
    const std::vector<StrategyEstimate>& estimates,
    const std::vector<std::vector<double>>& correlation) const {
    auto validation = validate_inputs(estimates, correlation);
    if (validation.is_error()) {
        return make_error<OptimalPortfolio>(validation.error()->code(),
                                            validation.error()->what(), "PortfolioOptimizer");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(estimates.size());
    Eigen::VectorXd returns(n);
    Eigen::VectorXd vols(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        returns(i) = estimates[static_cast<size_t>(i)].expected_return;
        vols(i) = estimates[static_cast<size_t>(i)].volatility;
    }

    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(n, n);
    if (!correlation.empty()) {
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                corr(i, j) = correlation[static_cast<size_t>(i)][static_cast<size_t>(j)];
            }
        }
    }
    Eigen::MatrixXd covariance = vols.asDiagonal() * corr * vols.asDiagonal();

    Eigen::VectorXd weights = Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
    int iterations = 0;
    for (; iterations < config_.max_iterations; ++iterations) {
        double portfolio_return = weights.dot(returns);
        double sigma = portfolio_volatility(weights, covariance);
        if (sigma <= 0.0) {
            break;
        }

        weights.array() += config_.step_size * (returns.array() - portfolio_return) / sigma;
        weights = weights.cwiseMax(0.0);

        double total = weights.sum();
        if (total <= 0.0) {
            weights.setConstant(1.0 / static_cast<double>(n));
        } else {
            weights /= total;
        }
    }

    OptimalPortfolio portfolio;
    portfolio.iterations = iterations;
    portfolio.expected_return = weights.dot(returns);
    portfolio.expected_volatility = portfolio_volatility(weights, covariance);
    portfolio.sharpe_ratio = portfolio.expected_volatility > 0.0
                                 ? portfolio.expected_return / portfolio.expected_volatility
                                 : 0.0;
    portfolio.var_95 = portfolio.expected_return - config_.var_z_score * portfolio.expected_volatility;

    Eigen::VectorXd marginal = covariance * weights;
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& estimate = estimates[static_cast<size_t>(i)];
        double contribution = portfolio.expected_volatility > 0.0
                                  ? weights(i) * marginal(i) / portfolio.expected_volatility
                                  : 0.0;

        StrategyWeight weight;
        weight.strategy = estimate.name;
        weight.weight = weights(i);
        weight.expected_return = estimate.expected_return;
        weight.risk_contribution = contribution;
        portfolio.weights.push_back(weight);

        RiskContribution risk;
        risk.strategy = estimate.name;
        risk.contribution = contribution;
        risk.percentage = portfolio.expected_volatility > 0.0
                              ? contribution / portfolio.expected_volatility
                              : 0.0;
        portfolio.risk_contributions.push_back(risk);

        portfolio.max_drawdown += weights(i) * estimate.max_drawdown;
    }

    portfolio.efficient_frontier = sample_frontier(returns, covariance);

    DEBUG("Optimized " << n << " strategy weights in " << iterations
                       << " iterations: return " << portfolio.expected_return << ", volatility "
                       << portfolio.expected_volatility);
    return portfolio;
}

}  // namespace stratlab
