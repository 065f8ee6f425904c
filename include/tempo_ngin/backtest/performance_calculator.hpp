// include/tempo_ngin/backtest/performance_calculator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "tempo_ngin/core/time_index.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

struct YearSummary {
    int year{0};
    size_t trading_days{0};
    double total_return{0.0};
    double volatility{0.0};
    double sharpe_ratio{0.0};
    double max_drawdown{0.0};
};

/**
 * @brief Summary statistics of a return segment
 */
struct PerformanceMetrics {
    size_t trading_days{0};
    double total_return{0.0};
    double cagr{0.0};
    double volatility{0.0};  // Annualized
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double max_drawdown{0.0};  // Positive fraction of the running peak
    double calmar_ratio{0.0};
    double average_turnover{0.0};
    double average_leverage{0.0};
    std::vector<double> drawdown;
    std::vector<YearSummary> yearly;

    nlohmann::json to_json() const;
};

/**
 * @brief Pure stateless calculation of performance metrics
 *
 * All methods are const and have no side effects. Ratios with a zero
 * denominator are 0, except Sortino and Calmar which are capped at
 * RATIO_CAP when there is no downside and the return is non-negative.
 */
class PerformanceCalculator {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double RATIO_CAP = 999.0;

    /**
     * @brief Metrics of one segment; all vectors are aligned with index
     */
    PerformanceMetrics calculate(const TimeIndex& index, const std::vector<double>& returns,
                                 const std::vector<double>& turnover,
                                 const std::vector<double>& leverage) const;

    double calculate_total_return(const std::vector<double>& returns) const;

    double calculate_cagr(double total_return, size_t trading_days) const;

    double calculate_volatility(const std::vector<double>& returns) const;

    double calculate_downside_volatility(const std::vector<double>& returns,
                                         double target = 0.0) const;

    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double risk_free_rate = 0.0) const;

    double calculate_sortino_ratio(const std::vector<double>& returns,
                                   double minimum_acceptable_return = 0.0) const;

    double calculate_calmar_ratio(double cagr, double max_drawdown) const;

    /**
     * @brief Drawdown curve of the compounded returns, starting from 1.0
     */
    std::vector<double> calculate_drawdowns(const std::vector<double>& returns) const;

    double calculate_max_drawdown(const std::vector<double>& returns) const;

    std::vector<YearSummary> calculate_yearly_summary(const TimeIndex& index,
                                                      const std::vector<double>& returns) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
};

}  // namespace tempo_ngin
