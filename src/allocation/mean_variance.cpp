#include "tempo_ngin/allocation/mean_variance.hpp"
#include <algorithm>
#include <cmath>
#include "tempo_ngin/allocation/weight_utils.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/statistics/statistics_tools.hpp"

namespace tempo_ngin {

namespace {

constexpr int MAX_PROJECTION_SWEEPS = 2000;
constexpr double GROUP_TOLERANCE = 1e-10;

double group_sum(const WeightVector& w, const GroupLimit& group) {
    double total = 0.0;
    for (size_t i : group.members) {
        total += w[i];
    }
    return total;
}

double max_group_violation(const WeightVector& w, const std::vector<GroupLimit>& groups) {
    double worst = 0.0;
    for (const auto& group : groups) {
        worst = std::max(worst, group_sum(w, group) - group.max_weight);
    }
    return worst;
}

}  // namespace

MeanVarianceAllocator::MeanVarianceAllocator(AllocatorConfig config)
    : Allocator(AllocatorType::MEAN_VARIANCE, std::move(config)) {}

Result<WeightVector> MeanVarianceAllocator::project(
    const WeightVector& point, const AllocationConstraints& constraints) const {
    if (constraints.groups.empty()) {
        return weights::project_capped_simplex(point, constraints.caps, constraints.gross_target);
    }

    // Dykstra: group halfspaces first, capped simplex last, so every sweep
    // ends on a point that meets the caps and the gross target
    const size_t num_sets = constraints.groups.size() + 1;
    std::vector<WeightVector> increments(num_sets, WeightVector(point.size(), 0.0));
    WeightVector x = point;

    for (int sweep = 0; sweep < MAX_PROJECTION_SWEEPS; ++sweep) {
        WeightVector previous = x;

        for (size_t g = 0; g < constraints.groups.size(); ++g) {
            const auto& group = constraints.groups[g];
            WeightVector y(x.size());
            for (size_t i = 0; i < x.size(); ++i) {
                y[i] = x[i] + increments[g][i];
            }
            double excess = group_sum(y, group) - group.max_weight;
            WeightVector projected = y;
            if (excess > 0.0) {
                double shift = excess / static_cast<double>(group.members.size());
                for (size_t i : group.members) {
                    projected[i] -= shift;
                }
            }
            for (size_t i = 0; i < x.size(); ++i) {
                increments[g][i] = y[i] - projected[i];
            }
            x = std::move(projected);
        }

        WeightVector y(x.size());
        for (size_t i = 0; i < x.size(); ++i) {
            y[i] = x[i] + increments.back()[i];
        }
        auto projected = weights::project_capped_simplex(y, constraints.caps,
                                                         constraints.gross_target);
        if (projected.is_error()) {
            return projected;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            increments.back()[i] = y[i] - projected.value()[i];
        }
        x = projected.take();

        double change = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            change = std::max(change, std::abs(x[i] - previous[i]));
        }
        if (change <= config().tolerance &&
            max_group_violation(x, constraints.groups) <= GROUP_TOLERANCE) {
            return x;
        }
    }

    if (max_group_violation(x, constraints.groups) > GROUP_TOLERANCE) {
        return make_error<WeightVector>(ErrorCode::SOLVER_ERROR,
                                        "Group limits are infeasible with the gross target",
                                        "MeanVarianceAllocator");
    }
    return x;
}

Result<WeightVector> MeanVarianceAllocator::compute_raw_weights(
    const ReturnsWindow& window, const AllocationConstraints& constraints) const {
    auto data = statistics::to_matrix(window.rows);
    if (data.is_error()) {
        return forward_error<WeightVector>(data.error());
    }
    auto mu = statistics::sample_mean(data.value(), 2);
    if (mu.is_error()) {
        return forward_error<WeightVector>(mu.error());
    }
    auto cov = statistics::sample_covariance(data.value(), 2);
    if (cov.is_error()) {
        return forward_error<WeightVector>(cov.error());
    }

    auto diagnostics = statistics::diagnose_covariance(cov.value(), config().singularity_threshold);
    if (diagnostics.is_error()) {
        return forward_error<WeightVector>(diagnostics.error());
    }
    if (diagnostics.value().singular) {
        return make_error<WeightVector>(
            ErrorCode::SOLVER_ERROR,
            "singular covariance matrix (min eigenvalue " +
                std::to_string(diagnostics.value().min_eigenvalue) + ", max " +
                std::to_string(diagnostics.value().max_eigenvalue) + ")",
            "MeanVarianceAllocator");
    }

    const size_t n = constraints.caps.size();
    const double lambda = config().risk_aversion;
    const double step = 1.0 / (lambda * diagnostics.value().max_eigenvalue);
    const Eigen::MatrixXd& sigma = cov.value();
    const Eigen::VectorXd& expected = mu.value();

    auto start = project(WeightVector(n, constraints.gross_target / static_cast<double>(n)),
                         constraints);
    if (start.is_error()) {
        return start;
    }
    WeightVector w = start.take();

    for (int iteration = 0; iteration < config().max_iterations; ++iteration) {
        Eigen::Map<const Eigen::VectorXd> current(w.data(), static_cast<Eigen::Index>(n));
        Eigen::VectorXd gradient = expected - lambda * (sigma * current);

        WeightVector ascent(n);
        for (size_t i = 0; i < n; ++i) {
            ascent[i] = w[i] + step * gradient(static_cast<Eigen::Index>(i));
        }
        auto next = project(ascent, constraints);
        if (next.is_error()) {
            return next;
        }

        double change = 0.0;
        for (size_t i = 0; i < n; ++i) {
            change = std::max(change, std::abs(next.value()[i] - w[i]));
        }
        w = next.take();
        if (change <= config().tolerance) {
            DEBUG("Mean-variance converged after " << iteration + 1 << " iterations");
            return w;
        }
    }

    return make_error<WeightVector>(ErrorCode::SOLVER_ERROR,
                                    "did not converge within " +
                                        std::to_string(config().max_iterations) + " iterations",
                                    "MeanVarianceAllocator");
}

}  // namespace tempo_ngin
