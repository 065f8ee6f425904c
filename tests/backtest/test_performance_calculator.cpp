#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "tempo_ngin/backtest/performance_calculator.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class PerformanceCalculatorTest : public TestBase {
protected:
    PerformanceCalculator calculator_;
};

TEST_F(PerformanceCalculatorTest, TotalReturnCompounds) {
    EXPECT_NEAR(calculator_.calculate_total_return({0.1, -0.1}), -0.01, 1e-12);
    EXPECT_DOUBLE_EQ(calculator_.calculate_total_return({}), 0.0);
}

TEST_F(PerformanceCalculatorTest, CagrOverTwoYears) {
    EXPECT_NEAR(calculator_.calculate_cagr(0.21, 504), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(calculator_.calculate_cagr(0.5, 0), 0.0);
    EXPECT_DOUBLE_EQ(calculator_.calculate_cagr(-1.0, 252), -1.0);
}

TEST_F(PerformanceCalculatorTest, DrawdownFromRunningPeak) {
    auto drawdowns = calculator_.calculate_drawdowns({0.1, -0.5, 0.2});
    ASSERT_EQ(drawdowns.size(), 3u);
    EXPECT_DOUBLE_EQ(drawdowns[0], 0.0);
    EXPECT_NEAR(drawdowns[1], 0.5, 1e-12);
    EXPECT_NEAR(drawdowns[2], 0.4, 1e-12);
    EXPECT_NEAR(calculator_.calculate_max_drawdown({0.1, -0.5, 0.2}), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(calculator_.calculate_max_drawdown({}), 0.0);
}

TEST_F(PerformanceCalculatorTest, VolatilityAndSharpe) {
    std::vector<double> returns{0.01, -0.01, 0.01, -0.01};
    double expected_vol = std::sqrt(4 * 0.0001 / 3.0) * std::sqrt(252.0);
    EXPECT_NEAR(calculator_.calculate_volatility(returns), expected_vol, 1e-12);
    EXPECT_NEAR(calculator_.calculate_sharpe_ratio(returns), 0.0, 1e-12);

    std::vector<double> drifting{0.02, 0.0, 0.02, 0.0};
    double vol = calculator_.calculate_volatility(drifting);
    EXPECT_NEAR(calculator_.calculate_sharpe_ratio(drifting), 0.01 * 252.0 / vol, 1e-9);
}

TEST_F(PerformanceCalculatorTest, ZeroDenominatorConventions) {
    std::vector<double> flat{0.001, 0.001, 0.001};
    EXPECT_DOUBLE_EQ(calculator_.calculate_volatility(flat), 0.0);
    EXPECT_DOUBLE_EQ(calculator_.calculate_sharpe_ratio(flat), 0.0);
    EXPECT_DOUBLE_EQ(calculator_.calculate_sortino_ratio(flat), PerformanceCalculator::RATIO_CAP);
    EXPECT_DOUBLE_EQ(calculator_.calculate_calmar_ratio(0.05, 0.0),
                     PerformanceCalculator::RATIO_CAP);
    EXPECT_DOUBLE_EQ(calculator_.calculate_calmar_ratio(-0.05, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(calculator_.calculate_volatility({0.01}), 0.0);
}

TEST_F(PerformanceCalculatorTest, SortinoUsesDownsideOnly) {
    std::vector<double> returns{0.02, -0.01, 0.03, -0.01};
    double mean = 0.03 / 4.0;
    double downside = std::sqrt((0.0001 + 0.0001) / 2.0) * std::sqrt(252.0);
    EXPECT_NEAR(calculator_.calculate_sortino_ratio(returns), mean * 252.0 / downside, 1e-9);
}

TEST_F(PerformanceCalculatorTest, YearlySummarySplitsOnCalendarYear) {
    std::vector<Timestamp> days;
    long first = core::days_from_civil(2024, 12, 30);
    for (long d = 0; d < 4; ++d) {
        days.emplace_back(std::chrono::seconds((first + d) * 86400L));
    }
    auto index = TimeIndex::create(days).take();

    auto yearly = calculator_.calculate_yearly_summary(index, {0.01, 0.02, -0.01, 0.03});
    ASSERT_EQ(yearly.size(), 2u);
    EXPECT_EQ(yearly[0].year, 2024);
    EXPECT_EQ(yearly[0].trading_days, 2u);
    EXPECT_NEAR(yearly[0].total_return, 1.01 * 1.02 - 1.0, 1e-12);
    EXPECT_EQ(yearly[1].year, 2025);
    EXPECT_EQ(yearly[1].trading_days, 2u);
    EXPECT_NEAR(yearly[1].total_return, 0.99 * 1.03 - 1.0, 1e-12);
}

TEST_F(PerformanceCalculatorTest, CalculateFillsEveryField) {
    auto index = make_index(4);
    auto metrics = calculator_.calculate(index, {0.01, -0.02, 0.015, 0.0}, {1.0, 0.0, 0.5, 0.5},
                                         {1.0, 1.0, 2.0, 2.0});
    EXPECT_EQ(metrics.trading_days, 4u);
    EXPECT_NEAR(metrics.total_return, 1.01 * 0.98 * 1.015 - 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.average_turnover, 0.5);
    EXPECT_DOUBLE_EQ(metrics.average_leverage, 1.5);
    EXPECT_NEAR(metrics.max_drawdown, 0.02, 1e-12);
    EXPECT_EQ(metrics.drawdown.size(), 4u);
    EXPECT_EQ(metrics.yearly.size(), 1u);
    EXPECT_NEAR(metrics.calmar_ratio, metrics.cagr / metrics.max_drawdown, 1e-9);

    auto j = metrics.to_json();
    EXPECT_EQ(j["trading_days"].get<size_t>(), 4u);
    EXPECT_TRUE(j.contains("sharpe_ratio"));
    EXPECT_EQ(j["yearly"].size(), 1u);
}
