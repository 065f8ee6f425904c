// include/tempo_ngin/statistics/statistics_tools.hpp
#pragma once

#include <Eigen/Dense>
#include <deque>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {
namespace statistics {

/**
 * @brief Eigenvalue summary of a covariance matrix
 */
struct CovarianceDiagnostics {
    double min_eigenvalue{0.0};
    double max_eigenvalue{0.0};
    bool singular{false};  // min eigenvalue <= relative_tolerance * max eigenvalue
};

/**
 * @brief Stack rows (one per observation) into an observations x assets matrix
 * @return INVALID_DATA when rows have different widths
 */
Result<Eigen::MatrixXd> to_matrix(const std::vector<WeightVector>& rows);

/**
 * @brief Column means
 * @param min_observations Rows required, INSUFFICIENT_HISTORY below it
 */
Result<Eigen::VectorXd> sample_mean(const Eigen::MatrixXd& data, size_t min_observations);

/**
 * @brief Column sample standard deviations (n - 1 denominator)
 * @param min_observations Rows required, at least 2
 */
Result<Eigen::VectorXd> sample_volatility(const Eigen::MatrixXd& data, size_t min_observations);

/**
 * @brief Sample covariance matrix (n - 1 denominator)
 * @param min_observations Rows required, at least 2
 */
Result<Eigen::MatrixXd> sample_covariance(const Eigen::MatrixXd& data, size_t min_observations);

/**
 * @brief Eigenvalue-based singularity check of a symmetric matrix
 * @param relative_tolerance Threshold on min/max eigenvalue ratio
 */
Result<CovarianceDiagnostics> diagnose_covariance(const Eigen::MatrixXd& covariance,
                                                  double relative_tolerance);

/**
 * @brief Fixed-length window of the most recent observations
 *
 * Statistics are only available once the window is full; before that they
 * return INSUFFICIENT_HISTORY instead of a NaN.
 */
class RollingWindow {
public:
    explicit RollingWindow(size_t length);

    void push(double value);

    size_t size() const {
        return values_.size();
    }

    size_t length() const {
        return length_;
    }

    bool full() const {
        return values_.size() >= length_;
    }

    void clear() {
        values_.clear();
    }

    Result<double> mean() const;

    /**
     * @brief Sample standard deviation of the window
     */
    Result<double> std_dev() const;

private:
    Result<void> require_full() const;

    size_t length_;
    std::deque<double> values_;
};

}  // namespace statistics
}  // namespace tempo_ngin
