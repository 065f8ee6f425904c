#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "tempo_ngin/portfolio/risk_caps.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

namespace {

double gross(const WeightVector& w) {
    double total = 0.0;
    for (double v : w) {
        total += std::abs(v);
    }
    return total;
}

}  // namespace

class RiskCapsTest : public TestBase {
protected:
    static std::unique_ptr<RiskCapsOverlay> make_overlay(RiskCapsConfig config,
                                                         std::vector<std::string> symbols) {
        auto overlay = RiskCapsOverlay::create(std::move(config), std::move(symbols));
        EXPECT_TRUE(overlay.is_ok());
        return overlay.take();
    }
};

TEST_F(RiskCapsTest, AssetCapRedistributesExcess) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 0.4;
    auto overlay = make_overlay(config, {"A", "B", "C"});

    auto out = overlay->apply({0.5, 0.3, 0.2}).take();
    EXPECT_NEAR(out.weights[0], 0.4, 1e-12);
    EXPECT_NEAR(out.weights[1], 0.36, 1e-12);
    EXPECT_NEAR(out.weights[2], 0.24, 1e-12);
    EXPECT_NEAR(gross(out.weights), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(out.leverage, 1.0);
    EXPECT_FALSE(out.warming_up);
}

TEST_F(RiskCapsTest, AssetCapKeepsSigns) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 0.5;
    auto overlay = make_overlay(config, {"A", "B"});

    auto out = overlay->apply({-0.6, 0.4}).take();
    EXPECT_NEAR(out.weights[0], -0.5, 1e-12);
    EXPECT_NEAR(out.weights[1], 0.5, 1e-12);
}

TEST_F(RiskCapsTest, RowWithinLimitsUnchanged) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 0.5;
    config.max_sector_weight = 0.8;
    config.sector_map = {{"A", "Equity"}, {"B", "Rates"}};
    auto overlay = make_overlay(config, {"A", "B"});

    auto out = overlay->apply({0.3, -0.2}).take();
    EXPECT_EQ(out.weights, (WeightVector{0.3, -0.2}));
}

TEST_F(RiskCapsTest, SectorCapShiftsWeightToOtherSectors) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 0.5;
    config.max_sector_weight = 0.4;
    config.sector_map = {{"A", "Equity"}, {"B", "Equity"}, {"C", "Rates"}};
    auto overlay = make_overlay(config, {"A", "B", "C", "D"});

    auto out = overlay->apply({0.3, 0.3, 0.2, 0.2}).take();
    const auto& w = out.weights;
    EXPECT_LE(std::abs(w[0]) + std::abs(w[1]), 0.4 + 1e-12);
    EXPECT_NEAR(w[0], w[1], 1e-12);
    EXPECT_NEAR(gross(w), 1.0, 1e-9);
    for (double v : w) {
        EXPECT_LE(std::abs(v), 0.5 + 1e-12);
    }
}

TEST_F(RiskCapsTest, UnmappedSymbolsShareUnknownSector) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 1.0;
    config.max_sector_weight = 0.5;
    config.sector_map = {{"A", "Equity"}};
    auto overlay = make_overlay(config, {"A", "B", "C"});

    auto out = overlay->apply({0.2, 0.3, 0.3}).take();
    const auto& w = out.weights;
    EXPECT_LE(w[1] + w[2], 0.5 + 1e-12);
    EXPECT_NEAR(w[1] + w[2], 0.5, 1e-9);
    EXPECT_NEAR(w[0], 0.3, 1e-9);
}

TEST_F(RiskCapsTest, TooFewActiveAssetsFlattensRow) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 1.0;
    config.min_assets_held = 2;
    auto overlay = make_overlay(config, {"A", "B", "C"});

    auto out = overlay->apply({0.5, 0.0, 0.0}).take();
    EXPECT_EQ(out.weights, (WeightVector{0.0, 0.0, 0.0}));

    auto kept = overlay->apply({0.5, -0.5, 0.0}).take();
    EXPECT_EQ(kept.weights, (WeightVector{0.5, -0.5, 0.0}));
}

TEST_F(RiskCapsTest, InfeasibleConfigRejected) {
    RiskCapsConfig config;
    config.min_assets_held = 4;
    auto overlay = RiskCapsOverlay::create(config, {"A", "B", "C"});
    ASSERT_TRUE(overlay.is_error());
    EXPECT_EQ(overlay.error()->code(), ErrorCode::INVALID_CONFIG);

    RiskCapsConfig bad_sector;
    bad_sector.max_sector_weight = 0.0;
    EXPECT_TRUE(bad_sector.validate().is_error());

    RiskCapsConfig bad_asset;
    bad_asset.max_weight_per_asset = 1.5;
    EXPECT_TRUE(bad_asset.validate().is_error());
}

TEST_F(RiskCapsTest, WrongRowWidthRejected) {
    auto overlay = make_overlay(RiskCapsConfig(), {"A", "B"});
    auto out = overlay->apply({0.1});
    ASSERT_TRUE(out.is_error());
    EXPECT_EQ(out.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RiskCapsTest, ConfigJsonKeepsOptionalSectorCap) {
    RiskCapsConfig config;
    config.max_sector_weight = 0.6;
    config.sector_map = {{"ES", "Equity"}};

    RiskCapsConfig loaded;
    ASSERT_TRUE(loaded.load_json(config.to_json()).is_ok());
    ASSERT_TRUE(loaded.max_sector_weight.has_value());
    EXPECT_DOUBLE_EQ(*loaded.max_sector_weight, 0.6);
    EXPECT_EQ(loaded.sector_map.at("ES"), "Equity");

    auto j = config.to_json();
    j["max_sector_weight"] = nullptr;
    ASSERT_TRUE(loaded.load_json(j).is_ok());
    EXPECT_FALSE(loaded.max_sector_weight.has_value());
}

TEST_F(RiskCapsTest, CapModeDefaultsToBothAndRejectsUnknownNames) {
    RiskCapsConfig config;
    EXPECT_EQ(config.cap_mode, CapMode::BOTH);
    EXPECT_EQ(config.to_json()["cap_mode"].get<std::string>(), "both");

    RiskCapsConfig loaded;
    ASSERT_TRUE(loaded.load_json({{"cap_mode", "post_leverage"}}).is_ok());
    EXPECT_EQ(loaded.cap_mode, CapMode::POST_LEVERAGE);

    auto invalid = loaded.load_json({{"cap_mode", "leverage_aware"}});
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(RiskCapsTest, LeveredRowIsCappedAgain) {
    RiskCapsConfig config;
    config.max_weight_per_asset = 0.3;
    auto overlay = make_overlay(config, {"A", "B", "C", "D"});
    auto out = overlay->apply({0.5, 0.5, -0.5, 0.5}).take();
    EXPECT_EQ(out.weights, (WeightVector{0.3, 0.3, -0.3, 0.3}));
}
