#include "tempo_ngin/backtest/performance_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["trading_days"] = trading_days;
    j["total_return"] = total_return;
    j["cagr"] = cagr;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["max_drawdown"] = max_drawdown;
    j["calmar_ratio"] = calmar_ratio;
    j["average_turnover"] = average_turnover;
    j["average_leverage"] = average_leverage;
    j["yearly"] = nlohmann::json::array();
    for (const auto& year : yearly) {
        j["yearly"].push_back({{"year", year.year},
                               {"trading_days", year.trading_days},
                               {"total_return", year.total_return},
                               {"volatility", year.volatility},
                               {"sharpe_ratio", year.sharpe_ratio},
                               {"max_drawdown", year.max_drawdown}});
    }
    return j;
}

double PerformanceCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

// ========== Return Calculations ==========

double PerformanceCalculator::calculate_total_return(const std::vector<double>& returns) const {
    double equity = 1.0;
    for (double r : returns) {
        equity *= 1.0 + r;
    }
    return equity - 1.0;
}

double PerformanceCalculator::calculate_cagr(double total_return, size_t trading_days) const {
    if (trading_days == 0 || total_return <= -1.0) {
        return total_return <= -1.0 ? -1.0 : 0.0;
    }
    double years = static_cast<double>(trading_days) / TRADING_DAYS_PER_YEAR;
    return std::pow(1.0 + total_return, 1.0 / years) - 1.0;
}

// ========== Volatility Metrics ==========

double PerformanceCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    double mean_return = calculate_mean(returns);
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean_return) * (r - mean_return);
    }
    double variance = sq_sum / static_cast<double>(returns.size() - 1);
    return std::sqrt(variance) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceCalculator::calculate_downside_volatility(const std::vector<double>& returns,
                                                            double target) const {
    double downside_sum = 0.0;
    int downside_count = 0;
    for (double ret : returns) {
        if (ret < target) {
            double deviation = ret - target;
            downside_sum += deviation * deviation;
            downside_count++;
        }
    }
    if (downside_count <= 0) {
        return 0.0;
    }
    return std::sqrt(downside_sum / downside_count) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

// ========== Risk-Adjusted Return Metrics ==========

double PerformanceCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                     double risk_free_rate) const {
    double volatility = calculate_volatility(returns);
    if (volatility <= 0.0) {
        return 0.0;
    }
    double annualized_return = calculate_mean(returns) * TRADING_DAYS_PER_YEAR;
    return (annualized_return - risk_free_rate) / volatility;
}

double PerformanceCalculator::calculate_sortino_ratio(const std::vector<double>& returns,
                                                      double minimum_acceptable_return) const {
    if (returns.empty()) {
        return 0.0;
    }
    double annualized_return = calculate_mean(returns) * TRADING_DAYS_PER_YEAR;
    double downside_vol = calculate_downside_volatility(returns, minimum_acceptable_return);
    if (downside_vol <= 0.0) {
        return annualized_return >= 0.0 ? RATIO_CAP : 0.0;
    }
    return (annualized_return - minimum_acceptable_return) / downside_vol;
}

double PerformanceCalculator::calculate_calmar_ratio(double cagr, double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return cagr >= 0.0 ? RATIO_CAP : 0.0;
    }
    return cagr / max_drawdown;
}

// ========== Drawdown Metrics ==========

std::vector<double> PerformanceCalculator::calculate_drawdowns(
    const std::vector<double>& returns) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(returns.size());
    double equity = 1.0;
    double peak = 1.0;
    for (double r : returns) {
        equity *= 1.0 + r;
        peak = std::max(peak, equity);
        drawdowns.push_back(equity < peak ? (peak - equity) / peak : 0.0);
    }
    return drawdowns;
}

double PerformanceCalculator::calculate_max_drawdown(const std::vector<double>& returns) const {
    auto drawdowns = calculate_drawdowns(returns);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return *std::max_element(drawdowns.begin(), drawdowns.end());
}

std::vector<YearSummary> PerformanceCalculator::calculate_yearly_summary(
    const TimeIndex& index, const std::vector<double>& returns) const {
    std::vector<YearSummary> summary;
    size_t begin = 0;
    while (begin < returns.size()) {
        int year = core::to_calendar_date(index[begin]).year;
        size_t end = begin;
        while (end < returns.size() && core::to_calendar_date(index[end]).year == year) {
            ++end;
        }
        std::vector<double> segment(returns.begin() + begin, returns.begin() + end);

        YearSummary entry;
        entry.year = year;
        entry.trading_days = segment.size();
        entry.total_return = calculate_total_return(segment);
        entry.volatility = calculate_volatility(segment);
        entry.sharpe_ratio = calculate_sharpe_ratio(segment);
        entry.max_drawdown = calculate_max_drawdown(segment);
        summary.push_back(entry);
        begin = end;
    }
    return summary;
}

PerformanceMetrics PerformanceCalculator::calculate(const TimeIndex& index,
                                                    const std::vector<double>& returns,
                                                    const std::vector<double>& turnover,
                                                    const std::vector<double>& leverage) const {
    PerformanceMetrics metrics;
    metrics.trading_days = returns.size();
    metrics.total_return = calculate_total_return(returns);
    metrics.cagr = calculate_cagr(metrics.total_return, returns.size());
    metrics.volatility = calculate_volatility(returns);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.sortino_ratio = calculate_sortino_ratio(returns);
    metrics.drawdown = calculate_drawdowns(returns);
    metrics.max_drawdown =
        metrics.drawdown.empty()
            ? 0.0
            : *std::max_element(metrics.drawdown.begin(), metrics.drawdown.end());
    metrics.calmar_ratio = calculate_calmar_ratio(metrics.cagr, metrics.max_drawdown);
    metrics.average_turnover = calculate_mean(turnover);
    metrics.average_leverage = calculate_mean(leverage);
    metrics.yearly = calculate_yearly_summary(index, returns);
    return metrics;
}

}  // namespace tempo_ngin
