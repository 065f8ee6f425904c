#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include "core/test_base.hpp"
#include "tempo_ngin/backtest/walkforward_orchestrator.hpp"
#include "tempo_ngin/strategy/passthrough_strategy.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

namespace {

// Flips asset A between long and short every step, holds the rest long
class AlternatingStrategy : public BaseStrategy {
public:
    AlternatingStrategy() : BaseStrategy("alternating", SignalType::DISCRETE, 0) {}

    Result<Intent> generate_intent(const MarketView& view) override {
        std::vector<double> row(view.symbols().size(), 1.0);
        row[0] = view.as_of_position() % 2 == 0 ? 1.0 : -1.0;
        return make_intent_row(view, row);
    }
};

// Dates every intent at the first timestamp of its view
class StaleStrategy : public BaseStrategy {
public:
    StaleStrategy() : BaseStrategy("stale", SignalType::DISCRETE, 0) {}

    Result<Intent> generate_intent(const MarketView& view) override {
        auto first = view.index().slice(0, 1).take();
        Intent intent;
        for (const auto& symbol : view.symbols()) {
            intent.emplace(symbol, Series::create(first, {1.0}).take());
        }
        return intent;
    }
};

// Only ever speaks about the first symbol
class PartialStrategy : public BaseStrategy {
public:
    PartialStrategy() : BaseStrategy("partial", SignalType::DISCRETE, 0) {}

    Result<Intent> generate_intent(const MarketView& view) override {
        auto full = view.index();
        auto point = full.slice(full.size() - 1, full.size()).take();
        Intent intent;
        intent.emplace(view.symbols().front(), Series::create(point, {1.0}).take());
        return intent;
    }
};

}  // namespace

class WalkforwardOrchestratorTest : public TestBase {
protected:
    static WalkforwardConfig simple_config(int delay) {
        WalkforwardConfig config;
        config.execution.execution_delay_days = delay;
        config.exposure.method = ExposureMethod::PASSTHROUGH;
        config.allocator.type = AllocatorType::EQUAL_WEIGHT;
        return config;
    }

    // Deterministic, uncorrelated daily returns per asset
    static std::shared_ptr<const MarketData> wavy_market(size_t days, size_t assets) {
        std::map<std::string, std::vector<double>> prices;
        for (size_t a = 0; a < assets; ++a) {
            std::vector<double> returns;
            for (size_t t = 0; t + 1 < days; ++t) {
                double x = static_cast<double>(t);
                returns.push_back(0.01 * std::sin(0.37 * x * static_cast<double>(a + 1) + a) +
                                  0.004 * std::cos(1.3 * x + 2.0 * a));
            }
            prices[std::string(1, static_cast<char>('A' + a))] = prices_from_returns(returns);
        }
        return make_market_data(prices);
    }

    static std::vector<std::unique_ptr<StrategyInterface>> one(
        std::unique_ptr<StrategyInterface> strategy) {
        std::vector<std::unique_ptr<StrategyInterface>> strategies;
        strategies.push_back(std::move(strategy));
        return strategies;
    }

    static std::shared_ptr<const WalkforwardResult> run_ok(WalkforwardOrchestrator& orchestrator) {
        auto initialized = orchestrator.initialize();
        EXPECT_TRUE(initialized.is_ok())
            << (initialized.is_error() ? initialized.error()->to_string() : "");
        auto result = orchestrator.run();
        EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error()->to_string() : "");
        return result.is_ok() ? result.value() : nullptr;
    }
};

TEST_F(WalkforwardOrchestratorTest, LongOneAssetEarnsItsReturnAfterTheDelay) {
    auto data = make_market_data({{"A", prices_from_returns({0.01, 0.01, 0.01, 0.01, 0.01})},
                                  {"B", std::vector<double>(6, 100.0)}});
    WalkforwardOrchestrator orchestrator(
        simple_config(1), data,
        one(std::make_unique<PassthroughStrategy>("long_a",
                                                  std::map<std::string, double>{{"A", 1.0},
                                                                                {"B", 0.0}})));
    auto result = run_ok(orchestrator);
    ASSERT_NE(result, nullptr);

    EXPECT_EQ(orchestrator.state(), RunState::COMPLETE);
    EXPECT_EQ(orchestrator.warmup_plan().parallel_warmup, 0u);
    EXPECT_EQ(orchestrator.warmup_plan().total_warmup, 1u);

    const auto& net = result->net_returns();
    ASSERT_EQ(net.size(), 6u);
    EXPECT_DOUBLE_EQ(net[0], 0.0);
    for (size_t t = 1; t < 6; ++t) {
        EXPECT_NEAR(net[t], 0.01, 1e-12) << "t=" << t;
    }
    EXPECT_EQ(result->held_weights().row(0), (WeightVector{0.0, 0.0}));
    for (size_t t = 1; t < 6; ++t) {
        EXPECT_EQ(result->held_weights().row(t), (WeightVector{1.0, 0.0}));
    }
    EXPECT_EQ(result->metrics().trading_days, 5u);
    EXPECT_NEAR(result->equity_curve().back(), std::pow(1.01, 5), 1e-12);
}

TEST_F(WalkforwardOrchestratorTest, ZeroIntentGivesZeroReturns) {
    WalkforwardOrchestrator orchestrator(
        simple_config(1), wavy_market(30, 3),
        one(std::make_unique<PassthroughStrategy>("flat", std::map<std::string, double>{}, 0.0)));
    auto result = run_ok(orchestrator);
    ASSERT_NE(result, nullptr);

    for (size_t t = 0; t < result->index().size(); ++t) {
        EXPECT_EQ(result->gross_returns()[t], 0.0);
        EXPECT_EQ(result->net_returns()[t], 0.0);
        EXPECT_EQ(result->turnover()[t], 0.0);
    }
}

TEST_F(WalkforwardOrchestratorTest, ExecutionDelayChangesTheOutcome) {
    auto data = wavy_market(40, 2);

    WalkforwardOrchestrator one_day(simple_config(1), data,
                                    one(std::make_unique<AlternatingStrategy>()));
    WalkforwardOrchestrator two_days(simple_config(2), data,
                                     one(std::make_unique<AlternatingStrategy>()));
    auto first = run_ok(one_day);
    auto second = run_ok(two_days);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    // Identical decisions, different fills
    EXPECT_EQ(first->target_weights().rows(), second->target_weights().rows());
    EXPECT_NE(first->held_weights().rows(), second->held_weights().rows());

    bool differs = false;
    for (size_t t = 0; t < first->gross_returns().size(); ++t) {
        if (std::abs(first->gross_returns()[t] - second->gross_returns()[t]) > 1e-10) {
            differs = true;
        }
    }
    EXPECT_TRUE(differs);
}

TEST_F(WalkforwardOrchestratorTest, HeldIsTargetShiftedByDelay) {
    WalkforwardOrchestrator orchestrator(simple_config(3), wavy_market(20, 2),
                                         one(std::make_unique<AlternatingStrategy>()));
    auto result = run_ok(orchestrator);
    ASSERT_NE(result, nullptr);

    const auto& target = result->target_weights();
    const auto& held = result->held_weights();
    for (size_t t = 0; t < target.num_rows(); ++t) {
        if (t < 3) {
            EXPECT_EQ(held.row(t), WeightVector(2, 0.0));
        } else {
            EXPECT_EQ(held.row(t), target.row(t - 3));
        }
    }
}

TEST_F(WalkforwardOrchestratorTest, FullStackRunReconciles) {
    auto config = simple_config(1);
    config.allocator.type = AllocatorType::INVERSE_VOLATILITY;
    config.allocator.lookback = 20;
    config.costs.spread_bps = 2.0;
    config.costs.slippage_bps = 1.0;
    config.costs.impact_k_bps = 5.0;
    RiskCapsConfig caps;
    caps.max_weight_per_asset = 0.4;
    caps.min_assets_held = 2;
    config.risk_caps = caps;
    VolTargetingConfig vol;
    vol.target_vol = 0.10;
    vol.vol_lookback = 10;
    config.vol_targeting = vol;
    config.allocation_schedule = ScheduleConfig(Frequency::WEEKLY);

    std::vector<std::unique_ptr<StrategyInterface>> strategies;
    auto long_all = std::make_unique<PassthroughStrategy>("long_all");
    const PassthroughStrategy* long_all_ptr = long_all.get();
    strategies.push_back(std::move(long_all));
    strategies.push_back(std::make_unique<PassthroughStrategy>(
        "mixed", std::map<std::string, double>{{"B", -1.0}, {"D", 0.0}}));

    WalkforwardOrchestrator orchestrator(config, wavy_market(120, 4), std::move(strategies));
    auto result = run_ok(orchestrator);
    ASSERT_NE(result, nullptr);

    const auto& plan = result->warmup_plan();
    EXPECT_EQ(plan.allocator_warmup, 21u);
    EXPECT_EQ(plan.parallel_warmup, 21u);
    EXPECT_EQ(plan.total_warmup, 21u + 1u + 10u);
    EXPECT_EQ(result->metrics().trading_days, 120u - plan.total_warmup);

    const auto& target = result->target_weights();
    for (size_t t = 0; t < target.num_rows(); ++t) {
        double gross_weight = 0.0;
        for (double w : target.row(t)) {
            gross_weight += std::abs(w);
        }
        if (t < plan.parallel_warmup) {
            EXPECT_EQ(gross_weight, 0.0) << "t=" << t;
        } else {
            EXPECT_GT(gross_weight, 0.0) << "t=" << t;
        }
        const auto& attribution = result->attribution();
        double explained =
            attribution.signal[t] + attribution.allocation[t] + attribution.leverage[t];
        EXPECT_NEAR(explained, result->gross_returns()[t],
                    1e-9 + 1e-6 * std::abs(result->gross_returns()[t]));
        EXPECT_EQ(result->net_returns()[t],
                  result->gross_returns()[t] - result->costs().total_at(t));
    }
    EXPECT_GT(result->costs().total_at(plan.parallel_warmup), 0.0);
    EXPECT_EQ(long_all_ptr->times_trained(), 1u);
    EXPECT_EQ(result->config()["execution"]["execution_delay_days"].get<int>(), 1);
}

TEST_F(WalkforwardOrchestratorTest, CapModeDecidesWhetherLeverageCanBreachCaps) {
    // Quiet, uncorrelated assets keep the volatility target at max leverage
    std::map<std::string, std::vector<double>> prices;
    for (size_t a = 0; a < 4; ++a) {
        std::vector<double> returns;
        for (size_t t = 0; t < 59; ++t) {
            returns.push_back(0.001 * std::sin(0.9 * static_cast<double>(t) + 1.7 * a));
        }
        prices[std::string(1, static_cast<char>('A' + a))] = prices_from_returns(returns);
    }
    auto data = make_market_data(prices);

    auto max_abs_target = [&](CapMode mode) {
        auto config = simple_config(1);
        RiskCapsConfig caps;
        caps.max_weight_per_asset = 0.3;
        caps.cap_mode = mode;
        config.risk_caps = caps;
        VolTargetingConfig vol;
        vol.target_vol = 0.20;
        vol.vol_lookback = 10;
        vol.max_leverage = 2.0;
        config.vol_targeting = vol;

        WalkforwardOrchestrator orchestrator(
            config, data, one(std::make_unique<PassthroughStrategy>("long_all")));
        auto result = run_ok(orchestrator);
        double largest = 0.0;
        if (result) {
            for (const auto& row : result->target_weights().rows()) {
                for (double w : row) {
                    largest = std::max(largest, std::abs(w));
                }
            }
        }
        return largest;
    };

    EXPECT_LE(max_abs_target(CapMode::BOTH), 0.3 + 1e-12);
    EXPECT_LE(max_abs_target(CapMode::POST_LEVERAGE), 0.3 + 1e-12);
    EXPECT_NEAR(max_abs_target(CapMode::PRE_LEVERAGE), 0.5, 1e-12);
}

TEST_F(WalkforwardOrchestratorTest, ContinuousScoresFillTheGrossTarget) {
    auto config = simple_config(1);
    config.exposure.method = ExposureMethod::RANK_THEN_NORMALIZE;
    WalkforwardOrchestrator orchestrator(
        config, wavy_market(30, 4),
        one(std::make_unique<PassthroughStrategy>(
            "scores", std::map<std::string, double>{{"A", 0.5}, {"B", 1.0}, {"C", 2.0}, {"D", 4.0}},
            1.0, SignalType::CONTINUOUS)));
    auto result = run_ok(orchestrator);
    ASSERT_NE(result, nullptr);

    const auto& target = result->target_weights();
    for (size_t t = orchestrator.warmup_plan().parallel_warmup; t < target.num_rows(); ++t) {
        double gross_weight = 0.0;
        for (double w : target.row(t)) {
            gross_weight += std::abs(w);
        }
        EXPECT_NEAR(gross_weight, config.allocator.gross_exposure_cap, 1e-9) << "t=" << t;
    }
}

TEST_F(WalkforwardOrchestratorTest, RaisingAnyCostLowersMeanNetReturn) {
    auto data = wavy_market(40, 3);
    auto mean_net = [&](const transaction_cost::CostPolicy& costs) {
        auto config = simple_config(1);
        config.costs = costs;
        WalkforwardOrchestrator orchestrator(config, data,
                                             one(std::make_unique<AlternatingStrategy>()));
        auto result = run_ok(orchestrator);
        if (!result) {
            return 0.0;
        }
        const auto& net = result->net_returns();
        return std::accumulate(net.begin(), net.end(), 0.0) / static_cast<double>(net.size());
    };

    const double cost_free = mean_net(transaction_cost::CostPolicy());
    for (int component = 0; component < 3; ++component) {
        double previous = cost_free;
        for (double bps : {1.0, 5.0, 20.0}) {
            transaction_cost::CostPolicy costs;
            if (component == 0) {
                costs.spread_bps = bps;
            } else if (component == 1) {
                costs.slippage_bps = bps;
            } else {
                costs.impact_k_bps = bps;
            }
            double mean = mean_net(costs);
            EXPECT_LT(mean, previous) << "component " << component << " at " << bps << " bps";
            previous = mean;
        }
    }
}

TEST_F(WalkforwardOrchestratorTest, MisalignedIntentFailsTheRun) {
    WalkforwardOrchestrator orchestrator(simple_config(1), wavy_market(10, 2),
                                         one(std::make_unique<StaleStrategy>()));
    ASSERT_TRUE(orchestrator.initialize().is_ok());
    auto result = orchestrator.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error()->code() == ErrorCode::ALIGNMENT_ERROR ||
                result.error()->code() == ErrorCode::INTENT_VALIDATION_ERROR);
    EXPECT_EQ(orchestrator.state(), RunState::FAILED);
    EXPECT_FALSE(orchestrator.failure_reason().empty());
}

TEST_F(WalkforwardOrchestratorTest, IncompleteIntentFailsTheRun) {
    WalkforwardOrchestrator orchestrator(simple_config(1), wavy_market(10, 2),
                                         one(std::make_unique<PartialStrategy>()));
    ASSERT_TRUE(orchestrator.initialize().is_ok());
    auto result = orchestrator.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INTENT_VALIDATION_ERROR);
    EXPECT_EQ(orchestrator.state(), RunState::FAILED);
}

TEST_F(WalkforwardOrchestratorTest, ShortHistoryRejectedAtInitialize) {
    auto config = simple_config(1);
    config.allocator.type = AllocatorType::INVERSE_VOLATILITY;
    config.allocator.lookback = 20;
    WalkforwardOrchestrator orchestrator(config, wavy_market(15, 2),
                                         one(std::make_unique<PassthroughStrategy>()));
    auto initialized = orchestrator.initialize();
    ASSERT_TRUE(initialized.is_error());
    EXPECT_EQ(initialized.error()->code(), ErrorCode::INSUFFICIENT_WARMUP);
    EXPECT_EQ(orchestrator.state(), RunState::FAILED);
}

TEST_F(WalkforwardOrchestratorTest, InvalidSetupRejectedAtInitialize) {
    auto config = simple_config(1);
    config.execution.execution_delay_days = -1;
    WalkforwardOrchestrator bad_config(config, wavy_market(10, 2),
                                       one(std::make_unique<PassthroughStrategy>()));
    auto invalid = bad_config.initialize();
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_CONFIG);

    std::vector<std::unique_ptr<StrategyInterface>> twins;
    twins.push_back(std::make_unique<PassthroughStrategy>("same"));
    twins.push_back(std::make_unique<PassthroughStrategy>("same"));
    WalkforwardOrchestrator duplicate(simple_config(1), wavy_market(10, 2), std::move(twins));
    EXPECT_TRUE(duplicate.initialize().is_error());

    WalkforwardOrchestrator empty(simple_config(1), wavy_market(10, 2), {});
    EXPECT_TRUE(empty.initialize().is_error());
}

TEST_F(WalkforwardOrchestratorTest, RunRequiresInitializeAndRunsOnce) {
    WalkforwardOrchestrator orchestrator(simple_config(1), wavy_market(10, 2),
                                         one(std::make_unique<PassthroughStrategy>()));
    auto early = orchestrator.run();
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error()->code(), ErrorCode::NOT_INITIALIZED);
    EXPECT_EQ(orchestrator.state(), RunState::INITIALIZED);

    ASSERT_TRUE(orchestrator.initialize().is_ok());
    EXPECT_TRUE(orchestrator.initialize().is_error());
    ASSERT_TRUE(orchestrator.run().is_ok());
    EXPECT_EQ(orchestrator.state(), RunState::COMPLETE);

    auto again = orchestrator.run();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::INVALID_STATE);
}
