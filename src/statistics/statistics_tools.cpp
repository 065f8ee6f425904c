#include "tempo_ngin/statistics/statistics_tools.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace tempo_ngin {
namespace statistics {

namespace {

Result<void> require_observations(const Eigen::MatrixXd& data, size_t min_observations,
                                  const std::string& what) {
    if (data.rows() < static_cast<Eigen::Index>(min_observations)) {
        return make_error<void>(ErrorCode::INSUFFICIENT_HISTORY,
                                what + " needs " + std::to_string(min_observations) +
                                    " observations, have " + std::to_string(data.rows()),
                                "Statistics");
    }
    return Result<void>();
}

}  // namespace

Result<Eigen::MatrixXd> to_matrix(const std::vector<WeightVector>& rows) {
    if (rows.empty()) {
        return Eigen::MatrixXd(0, 0);
    }
    const size_t cols = rows.front().size();
    Eigen::MatrixXd data(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols));
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != cols) {
            return make_error<Eigen::MatrixXd>(ErrorCode::INVALID_DATA,
                                               "Row " + std::to_string(r) + " has " +
                                                   std::to_string(rows[r].size()) +
                                                   " values, expected " + std::to_string(cols),
                                               "Statistics");
        }
        for (size_t c = 0; c < cols; ++c) {
            data(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }
    return Result<Eigen::MatrixXd>(std::move(data));
}

Result<Eigen::VectorXd> sample_mean(const Eigen::MatrixXd& data, size_t min_observations) {
    auto enough = require_observations(data, std::max<size_t>(1, min_observations), "Mean");
    if (enough.is_error()) {
        return forward_error<Eigen::VectorXd>(enough.error());
    }
    Eigen::VectorXd mean = data.colwise().mean().transpose();
    return Result<Eigen::VectorXd>(std::move(mean));
}

Result<Eigen::VectorXd> sample_volatility(const Eigen::MatrixXd& data, size_t min_observations) {
    auto cov = sample_covariance(data, min_observations);
    if (cov.is_error()) {
        return forward_error<Eigen::VectorXd>(cov.error());
    }
    Eigen::VectorXd vol = cov.value().diagonal().array().max(0.0).sqrt().matrix();
    return Result<Eigen::VectorXd>(std::move(vol));
}

Result<Eigen::MatrixXd> sample_covariance(const Eigen::MatrixXd& data, size_t min_observations) {
    auto enough =
        require_observations(data, std::max<size_t>(2, min_observations), "Covariance");
    if (enough.is_error()) {
        return forward_error<Eigen::MatrixXd>(enough.error());
    }

    Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
    Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(data.rows() - 1);
    return Result<Eigen::MatrixXd>(std::move(cov));
}

Result<CovarianceDiagnostics> diagnose_covariance(const Eigen::MatrixXd& covariance,
                                                  double relative_tolerance) {
    if (covariance.rows() == 0 || covariance.rows() != covariance.cols()) {
        return make_error<CovarianceDiagnostics>(ErrorCode::INVALID_ARGUMENT,
                                                 "Covariance must be a non-empty square matrix",
                                                 "Statistics");
    }
    if (!covariance.allFinite()) {
        return make_error<CovarianceDiagnostics>(ErrorCode::INVALID_DATA,
                                                 "Covariance has non-finite entries",
                                                 "Statistics");
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
    if (solver.info() != Eigen::Success) {
        return make_error<CovarianceDiagnostics>(ErrorCode::SOLVER_ERROR,
                                                 "Eigenvalue decomposition failed", "Statistics");
    }

    CovarianceDiagnostics diagnostics;
    diagnostics.min_eigenvalue = solver.eigenvalues().minCoeff();
    diagnostics.max_eigenvalue = solver.eigenvalues().maxCoeff();
    diagnostics.singular = diagnostics.max_eigenvalue <= 0.0 ||
                           diagnostics.min_eigenvalue <=
                               relative_tolerance * diagnostics.max_eigenvalue;
    return diagnostics;
}

RollingWindow::RollingWindow(size_t length) : length_(length) {}

void RollingWindow::push(double value) {
    values_.push_back(value);
    while (values_.size() > length_) {
        values_.pop_front();
    }
}

Result<void> RollingWindow::require_full() const {
    if (length_ == 0 || !full()) {
        return make_error<void>(ErrorCode::INSUFFICIENT_HISTORY,
                                "Rolling window has " + std::to_string(values_.size()) + " of " +
                                    std::to_string(length_) + " observations",
                                "RollingWindow");
    }
    return Result<void>();
}

Result<double> RollingWindow::mean() const {
    auto ready = require_full();
    if (ready.is_error()) {
        return forward_error<double>(ready.error());
    }
    double sum = 0.0;
    for (double v : values_) {
        sum += v;
    }
    return sum / static_cast<double>(values_.size());
}

Result<double> RollingWindow::std_dev() const {
    auto ready = require_full();
    if (ready.is_error()) {
        return forward_error<double>(ready.error());
    }
    if (values_.size() < 2) {
        return make_error<double>(ErrorCode::INSUFFICIENT_HISTORY,
                                  "Standard deviation needs two observations", "RollingWindow");
    }
    double m = mean().value();
    double sq = 0.0;
    for (double v : values_) {
        sq += (v - m) * (v - m);
    }
    return std::sqrt(sq / static_cast<double>(values_.size() - 1));
}

}  // namespace statistics
}  // namespace tempo_ngin
