#include "tempo_ngin/allocation/risk_parity.hpp"
#include <algorithm>
#include <cmath>
#include "tempo_ngin/allocation/weight_utils.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/statistics/statistics_tools.hpp"

namespace tempo_ngin {

RiskParityAllocator::RiskParityAllocator(AllocatorConfig config)
    : Allocator(AllocatorType::RISK_PARITY, std::move(config)) {}

Result<WeightVector> RiskParityAllocator::compute_raw_weights(
    const ReturnsWindow& window, const AllocationConstraints& constraints) const {
    auto data = statistics::to_matrix(window.rows);
    if (data.is_error()) {
        return forward_error<WeightVector>(data.error());
    }
    auto cov_result = statistics::sample_covariance(data.value(), 2);
    if (cov_result.is_error()) {
        return forward_error<WeightVector>(cov_result.error());
    }

    Eigen::MatrixXd cov = cov_result.take();
    const Eigen::Index n = cov.rows();
    const double var_floor = config().min_vol * config().min_vol;
    for (Eigen::Index i = 0; i < n; ++i) {
        cov(i, i) = std::max(cov(i, i), var_floor);
    }

    WeightVector raw(static_cast<size_t>(n));
    if (n <= 2) {
        // With two assets equal risk contribution is inverse volatility
        for (Eigen::Index i = 0; i < n; ++i) {
            raw[static_cast<size_t>(i)] = 1.0 / std::sqrt(cov(i, i));
        }
        return weights::cap_and_renormalize(raw, constraints.caps, constraints.gross_target);
    }

    // Solve Sigma x = b / x with b_i = 1 / n, one coordinate at a time
    const double budget = 1.0 / static_cast<double>(n);
    Eigen::VectorXd x(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        x(i) = 1.0 / std::sqrt(cov(i, i));
    }
    x /= x.sum();

    bool converged = false;
    int iteration = 0;
    for (; iteration < config().max_iterations && !converged; ++iteration) {
        double change = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            double cross = cov.row(i).dot(x) - cov(i, i) * x(i);
            double updated =
                (-cross + std::sqrt(cross * cross + 4.0 * cov(i, i) * budget)) / (2.0 * cov(i, i));
            change = std::max(change, std::abs(updated - x(i)));
            x(i) = updated;
        }
        converged = change <= config().tolerance * std::max(1.0, x.maxCoeff());
    }

    if (!converged || !x.allFinite()) {
        return make_error<WeightVector>(ErrorCode::SOLVER_ERROR,
                                        "risk parity did not converge within " +
                                            std::to_string(config().max_iterations) +
                                            " iterations",
                                        "RiskParityAllocator");
    }
    DEBUG("Risk parity converged after " << iteration << " sweeps");

    for (Eigen::Index i = 0; i < n; ++i) {
        raw[static_cast<size_t>(i)] = x(i);
    }
    return weights::cap_and_renormalize(raw, constraints.caps, constraints.gross_target);
}

}  // namespace tempo_ngin
