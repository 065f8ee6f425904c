#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "core/test_base.hpp"
#include "tempo_ngin/portfolio/portfolio_constructor.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class PortfolioConstructorTest : public TestBase {};

TEST_F(PortfolioConstructorTest, ScalesAllocationOverActiveAssets) {
    PortfolioConstructor constructor(1.0, 1.0);
    auto result = constructor.construct({1.0, -1.0, 0.0}, {0.5, 0.3, 0.2});
    ASSERT_TRUE(result.is_ok());

    const auto& out = result.value();
    EXPECT_DOUBLE_EQ(out.target[0], 0.625);
    EXPECT_DOUBLE_EQ(out.target[1], -0.375);
    EXPECT_DOUBLE_EQ(out.target[2], 0.0);

    EXPECT_DOUBLE_EQ(out.signal[0], 0.5);
    EXPECT_DOUBLE_EQ(out.signal[1], -0.5);
    EXPECT_DOUBLE_EQ(out.signal[2], 0.0);
}

TEST_F(PortfolioConstructorTest, RedistributesExcessOverCap) {
    PortfolioConstructor constructor(1.0, 0.6);
    auto out = constructor.construct({1.0, -1.0}, {0.75, 0.25}).take();
    EXPECT_NEAR(out.target[0], 0.6, 1e-12);
    EXPECT_NEAR(out.target[1], -0.4, 1e-12);
    EXPECT_NEAR(std::abs(out.target[0]) + std::abs(out.target[1]), 1.0, 1e-12);
}

TEST_F(PortfolioConstructorTest, GrossBeyondCapacityLeavesAssetsAtCap) {
    PortfolioConstructor constructor(2.0, 0.9);
    auto out = constructor.construct({1.0, 1.0}, {0.75, 0.25}).take();
    EXPECT_NEAR(out.target[0], 0.9, 1e-12);
    EXPECT_NEAR(out.target[1], 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(out.signal[0], 1.0);
}

TEST_F(PortfolioConstructorTest, ExposureMagnitudeSetsRelativeSize) {
    PortfolioConstructor constructor(1.0, 1.0);
    auto out = constructor.construct({0.5, 1.0}, {0.5, 0.5}).take();
    EXPECT_NEAR(out.target[0], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(out.target[1], 2.0 / 3.0, 1e-12);
}

TEST_F(PortfolioConstructorTest, ContinuousScoresFillGrossTarget) {
    // Rank-normalized exposures below one must not shrink the book
    PortfolioConstructor constructor(1.0, 0.5);
    auto out = constructor.construct({0.1, 0.2, 0.3, 0.4}, {0.25, 0.25, 0.25, 0.25}).take();

    double gross = 0.0;
    for (double w : out.target) {
        EXPECT_GT(w, 0.0);
        EXPECT_LE(w, 0.5 + 1e-12);
        gross += std::abs(w);
    }
    EXPECT_NEAR(gross, 1.0, 1e-12);
    EXPECT_NEAR(out.target[3], 0.4, 1e-12);
    EXPECT_NEAR(out.target[0] / out.target[1], 0.5, 1e-12);
}

TEST_F(PortfolioConstructorTest, ZeroAllocationAssetStaysFlat) {
    PortfolioConstructor constructor(1.0, 0.4);
    auto out = constructor.construct({1.0, 1.0, -1.0}, {0.5, 0.0, 0.5}).take();
    EXPECT_EQ(out.target[1], 0.0);
    EXPECT_NEAR(out.target[0], 0.4, 1e-12);
    EXPECT_NEAR(out.target[2], -0.4, 1e-12);
}

TEST_F(PortfolioConstructorTest, NoActiveAssetsGivesZeroRow) {
    PortfolioConstructor constructor(1.0, 0.5);
    auto out = constructor.construct({0.0, 0.0, 0.0}, {0.4, 0.3, 0.3}).take();
    EXPECT_EQ(out.target, (WeightVector{0.0, 0.0, 0.0}));
    EXPECT_EQ(out.signal, (WeightVector{0.0, 0.0, 0.0}));
}

TEST_F(PortfolioConstructorTest, NoAllocationOnActiveAssetsGivesZeroTarget) {
    PortfolioConstructor constructor(1.0, 1.0);
    auto out = constructor.construct({1.0, 0.0}, {0.0, 1.0}).take();
    EXPECT_EQ(out.target, (WeightVector{0.0, 0.0}));
    EXPECT_DOUBLE_EQ(out.signal[0], 1.0);
}

TEST_F(PortfolioConstructorTest, RejectsBadRows) {
    PortfolioConstructor constructor(1.0, 1.0);

    auto mismatch = constructor.construct({1.0, 1.0}, {1.0});
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto nan = constructor.construct({std::numeric_limits<double>::quiet_NaN()}, {1.0});
    ASSERT_TRUE(nan.is_error());
    EXPECT_EQ(nan.error()->code(), ErrorCode::INVALID_DATA);
}
