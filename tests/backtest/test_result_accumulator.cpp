#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "tempo_ngin/backtest/result_accumulator.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class ResultAccumulatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        index_ = make_index(3);
        returns_ = Frame::create(index_, symbols_, {{0.0, 0.0}, {0.01, 0.02}, {0.03, -0.01}})
                       .take();
        ExecutionPolicy policy;
        policy.execution_delay_days = 1;
        execution_ = std::make_unique<ExecutionModule>(make_execution_policy(policy).take());
    }

    static StepRecord record(WeightVector target, WeightVector held) {
        StepRecord step;
        step.pre_overlay = target;
        step.signal = target;
        step.target = std::move(target);
        step.held = std::move(held);
        return step;
    }

    void fill(ResultAccumulator& accumulator, const std::vector<WeightVector>& held) {
        const std::vector<WeightVector> targets{{1.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}};
        for (size_t t = 0; t < targets.size(); ++t) {
            ASSERT_TRUE(accumulator.append(t, record(targets[t], held[t])).is_ok());
        }
    }

    Result<std::shared_ptr<const WalkforwardResult>> finalize(
        ResultAccumulator& accumulator, const transaction_cost::CostPolicy& costs,
        size_t first_scored = 0) {
        return accumulator.finalize(*execution_, costs, returns_, WarmupPlan(), first_scored,
                                    nlohmann::json::object());
    }

    TimeIndex index_;
    std::vector<std::string> symbols_{"A", "B"};
    Frame returns_;
    std::unique_ptr<ExecutionModule> execution_;
};

TEST_F(ResultAccumulatorTest, FinalizeAccountsTheRun) {
    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    accumulator.add_warning("2024-01-02: fallback");

    auto result = finalize(accumulator, transaction_cost::CostPolicy());
    ASSERT_TRUE(result.is_ok());
    const auto& run = *result.value();

    EXPECT_EQ(run.gross_returns(), (std::vector<double>{0.0, 0.01, 0.03}));
    EXPECT_EQ(run.net_returns(), run.gross_returns());
    EXPECT_EQ(run.turnover(), (std::vector<double>{1.0, 0.0, 2.0}));
    EXPECT_NEAR(run.equity_curve().back(), 1.01 * 1.03, 1e-12);
    EXPECT_EQ(run.warnings(), (std::vector<std::string>{"2024-01-02: fallback"}));
    EXPECT_EQ(run.symbols(), symbols_);
    EXPECT_EQ(run.held_weights().row(1), (WeightVector{1.0, 0.0}));
    EXPECT_EQ(run.metrics().trading_days, 3u);

    // Identical signal and pre-overlay rows put the whole gross return in the signal part
    for (size_t t = 0; t < 3; ++t) {
        EXPECT_DOUBLE_EQ(run.attribution().signal[t], run.gross_returns()[t]);
        EXPECT_DOUBLE_EQ(run.attribution().allocation[t], 0.0);
        EXPECT_DOUBLE_EQ(run.attribution().leverage[t], 0.0);
    }
}

TEST_F(ResultAccumulatorTest, AttributionSplitsOverlayScaling) {
    ResultAccumulator accumulator(index_, symbols_);
    StepRecord first;
    first.signal = {0.5, 0.5};
    first.pre_overlay = {0.8, 0.2};
    first.target = {1.6, 0.4};
    first.held = {0.0, 0.0};
    first.leverage = 2.0;
    ASSERT_TRUE(accumulator.append(0, first).is_ok());
    for (size_t t = 1; t < 3; ++t) {
        StepRecord step = first;
        step.held = {1.6, 0.4};
        ASSERT_TRUE(accumulator.append(t, step).is_ok());
    }

    auto run = finalize(accumulator, transaction_cost::CostPolicy()).take();
    const auto& attribution = run->attribution();
    EXPECT_NEAR(attribution.signal[1], 0.5 * 0.01 + 0.5 * 0.02, 1e-15);
    EXPECT_NEAR(attribution.allocation[1], 0.3 * 0.01 - 0.3 * 0.02, 1e-15);
    EXPECT_NEAR(attribution.leverage[1], 0.8 * 0.01 + 0.2 * 0.02, 1e-15);
    for (size_t t = 0; t < 3; ++t) {
        EXPECT_NEAR(attribution.signal[t] + attribution.allocation[t] + attribution.leverage[t],
                    run->gross_returns()[t], 1e-12);
    }
    EXPECT_EQ(run->leverage(), (std::vector<double>{2.0, 2.0, 2.0}));
}

TEST_F(ResultAccumulatorTest, CostsReduceNetExactly) {
    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});

    transaction_cost::CostPolicy costs;
    costs.spread_bps = 4.0;
    costs.slippage_bps = 2.0;
    auto run = finalize(accumulator, costs).take();
    for (size_t t = 0; t < 3; ++t) {
        EXPECT_EQ(run->net_returns()[t], run->gross_returns()[t] - run->costs().total_at(t));
    }
    EXPECT_GT(run->costs().total_at(0), 0.0);
    EXPECT_EQ(run->costs().total_at(1), 0.0);
    EXPECT_LT(run->net_returns()[2], run->gross_returns()[2]);
}

TEST_F(ResultAccumulatorTest, HeldMustBeTheDelayedTarget) {
    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {0.0, 0.0}, {1.0, 0.0}});

    auto result = finalize(accumulator, transaction_cost::CostPolicy());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::ATTRIBUTION_CONSERVATION_ERROR);
}

TEST_F(ResultAccumulatorTest, AppendEnforcesOrderAndWidth) {
    ResultAccumulator accumulator(index_, symbols_);
    auto early = accumulator.append(1, record({1.0, 0.0}, {0.0, 0.0}));
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error()->code(), ErrorCode::INVALID_STATE);

    auto narrow = accumulator.append(0, record({1.0}, {0.0}));
    ASSERT_TRUE(narrow.is_error());
    EXPECT_EQ(narrow.error()->code(), ErrorCode::INVALID_ARGUMENT);

    ASSERT_TRUE(accumulator.append(0, record({1.0, 0.0}, {0.0, 0.0})).is_ok());
    EXPECT_TRUE(accumulator.append(0, record({1.0, 0.0}, {0.0, 0.0})).is_error());
    EXPECT_EQ(accumulator.size(), 1u);
}

TEST_F(ResultAccumulatorTest, FinalizeRequiresEveryStepOnce) {
    ResultAccumulator partial(index_, symbols_);
    ASSERT_TRUE(partial.append(0, record({1.0, 0.0}, {0.0, 0.0})).is_ok());
    auto incomplete = finalize(partial, transaction_cost::CostPolicy());
    ASSERT_TRUE(incomplete.is_error());
    EXPECT_EQ(incomplete.error()->code(), ErrorCode::INVALID_STATE);

    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    ASSERT_TRUE(finalize(accumulator, transaction_cost::CostPolicy()).is_ok());
    auto again = finalize(accumulator, transaction_cost::CostPolicy());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::INVALID_STATE);
    EXPECT_TRUE(accumulator.append(3, record({1.0, 0.0}, {0.0, 0.0})).is_error());
}

TEST_F(ResultAccumulatorTest, MetricsStartAtFirstScoredStep) {
    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    auto run = finalize(accumulator, transaction_cost::CostPolicy(), 1).take();
    EXPECT_EQ(run->metrics().trading_days, 2u);
    EXPECT_NEAR(run->metrics().total_return, 1.01 * 1.03 - 1.0, 1e-12);
    EXPECT_EQ(run->equity_curve().size(), 3u);

    ResultAccumulator late(index_, symbols_);
    fill(late, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    auto none = finalize(late, transaction_cost::CostPolicy(), 3);
    ASSERT_TRUE(none.is_error());
    EXPECT_EQ(none.error()->code(), ErrorCode::INSUFFICIENT_WARMUP);
}

TEST_F(ResultAccumulatorTest, ResultJsonHasStableSchema) {
    ResultAccumulator accumulator(index_, symbols_);
    fill(accumulator, {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    auto run = finalize(accumulator, transaction_cost::CostPolicy()).take();

    auto j = run->to_json();
    for (const char* key : {"index", "symbols", "equity_curve", "target_weights", "held_weights",
                            "gross_returns", "net_returns", "cost_components", "attribution",
                            "turnover", "leverage", "warmup", "warnings", "metrics", "config"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["index"].size(), 3u);
}
