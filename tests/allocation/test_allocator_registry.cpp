#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "tempo_ngin/allocation/allocator_registry.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class AllocatorRegistryTest : public TestBase {};

TEST_F(AllocatorRegistryTest, BuiltInsRegistered) {
    AllocatorRegistry registry;
    for (auto type : {AllocatorType::EQUAL_WEIGHT, AllocatorType::INVERSE_VOLATILITY,
                      AllocatorType::MEAN_VARIANCE, AllocatorType::RISK_PARITY}) {
        EXPECT_TRUE(registry.has_factory(type)) << allocator_type_to_string(type);
    }
}

TEST_F(AllocatorRegistryTest, ChainStartsAtConfiguredType) {
    AllocatorRegistry registry;
    AllocatorConfig config;

    config.type = AllocatorType::MEAN_VARIANCE;
    EXPECT_EQ(registry.resolve_chain(config),
              (std::vector<AllocatorType>{AllocatorType::MEAN_VARIANCE,
                                          AllocatorType::INVERSE_VOLATILITY,
                                          AllocatorType::EQUAL_WEIGHT}));

    config.type = AllocatorType::INVERSE_VOLATILITY;
    EXPECT_EQ(registry.resolve_chain(config),
              (std::vector<AllocatorType>{AllocatorType::INVERSE_VOLATILITY,
                                          AllocatorType::EQUAL_WEIGHT}));

    // Not listed: the whole fallback order follows
    config.type = AllocatorType::RISK_PARITY;
    EXPECT_EQ(registry.resolve_chain(config).size(), 4u);
}

TEST_F(AllocatorRegistryTest, CreateLinksFallbacks) {
    AllocatorRegistry registry;
    AllocatorConfig config;
    config.type = AllocatorType::MEAN_VARIANCE;

    auto allocator = registry.create(config);
    ASSERT_TRUE(allocator.is_ok());
    const Allocator* link = allocator.value().get();
    EXPECT_EQ(link->type(), AllocatorType::MEAN_VARIANCE);
    ASSERT_NE(link->fallback(), nullptr);
    EXPECT_EQ(link->fallback()->type(), AllocatorType::INVERSE_VOLATILITY);
    ASSERT_NE(link->fallback()->fallback(), nullptr);
    EXPECT_EQ(link->fallback()->fallback()->type(), AllocatorType::EQUAL_WEIGHT);
    EXPECT_EQ(link->fallback()->fallback()->fallback(), nullptr);
}

TEST_F(AllocatorRegistryTest, InvalidConfigRejected) {
    AllocatorRegistry registry;

    AllocatorConfig no_terminal;
    no_terminal.fallback_order = {AllocatorType::INVERSE_VOLATILITY};
    auto result = registry.create(no_terminal);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);

    AllocatorConfig duplicate;
    duplicate.fallback_order = {AllocatorType::EQUAL_WEIGHT, AllocatorType::EQUAL_WEIGHT};
    EXPECT_TRUE(registry.validate(duplicate).is_error());

    AllocatorConfig groups_without_mv;
    groups_without_mv.type = AllocatorType::INVERSE_VOLATILITY;
    groups_without_mv.groups = {GroupConstraint{"g", {"A"}, 0.5}};
    EXPECT_TRUE(registry.validate(groups_without_mv).is_error());

    AllocatorConfig short_lookback;
    short_lookback.lookback = 1;
    EXPECT_TRUE(registry.validate(short_lookback).is_error());
}

TEST_F(AllocatorRegistryTest, ConstraintsFromConfig) {
    AllocatorConfig config;
    config.type = AllocatorType::MEAN_VARIANCE;
    config.per_asset_cap = 0.3;
    config.groups = {GroupConstraint{"rates", {"ZB", "ZN"}, 0.4}};

    auto constraints = AllocationConstraints::from_config(config, {"ES", "GC", "ZB", "ZN"});
    ASSERT_TRUE(constraints.is_ok());
    EXPECT_EQ(constraints.value().caps, WeightVector(4, 0.3));
    ASSERT_EQ(constraints.value().groups.size(), 1u);
    EXPECT_EQ(constraints.value().groups[0].members, (std::vector<size_t>{2, 3}));

    auto infeasible = AllocationConstraints::from_config(config, {"ES", "GC", "ZB"});
    ASSERT_TRUE(infeasible.is_error());
    EXPECT_EQ(infeasible.error()->code(), ErrorCode::INVALID_CONFIG);

    config.groups = {GroupConstraint{"bad", {"XX"}, 0.4}};
    EXPECT_TRUE(AllocationConstraints::from_config(config, {"ES", "GC", "ZB", "ZN"}).is_error());
}

TEST_F(AllocatorRegistryTest, ConfigJsonRoundTrip) {
    AllocatorConfig config;
    config.type = AllocatorType::RISK_PARITY;
    config.lookback = 90;
    config.groups = {GroupConstraint{"g", {"A", "B"}, 0.7}};

    AllocatorConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.type, AllocatorType::RISK_PARITY);
    EXPECT_EQ(loaded.lookback, 90u);
    ASSERT_EQ(loaded.groups.size(), 1u);
    EXPECT_EQ(loaded.groups[0].members, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(loaded.fallback_order, config.fallback_order);
}
