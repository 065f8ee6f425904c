#include <gtest/gtest.h>
#include <limits>
#include "core/test_base.hpp"
#include "tempo_ngin/execution/execution_module.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class ExecutionModuleTest : public TestBase {
protected:
    static ExecutionModule make_module(int delay) {
        ExecutionPolicy policy;
        policy.execution_delay_days = delay;
        return ExecutionModule(make_execution_policy(policy).take());
    }

    static Intent make_intent(const TimeIndex& index,
                              const std::map<std::string, std::vector<double>>& values) {
        Intent intent;
        for (const auto& entry : values) {
            intent.emplace(entry.first, Series::create(index, entry.second).take());
        }
        return intent;
    }
};

TEST_F(ExecutionModuleTest, ApplyDelayShiftsSeriesWithZeroLead) {
    auto index = make_index(5);
    auto series = Series::create(index, {1, 2, 3, 4, 5}).take();

    auto one = make_module(1).apply_delay(series);
    ASSERT_TRUE(one.is_ok());
    EXPECT_EQ(one.value().values, (std::vector<double>{0, 1, 2, 3, 4}));
    EXPECT_EQ(one.value().index, index);

    auto two = make_module(2).apply_delay(series);
    ASSERT_TRUE(two.is_ok());
    EXPECT_EQ(two.value().values, (std::vector<double>{0, 0, 1, 2, 3}));

    auto zero = make_module(0).apply_delay(series);
    ASSERT_TRUE(zero.is_ok());
    EXPECT_EQ(zero.value().values, series.values);
}

TEST_F(ExecutionModuleTest, ApplyDelayDoesNotMutateInput) {
    auto index = make_index(3);
    auto frame = Frame::create(index, {"A", "B"}, {{1, -1}, {2, -2}, {3, -3}}).take();
    auto delayed = make_module(1).apply_delay(frame);
    ASSERT_TRUE(delayed.is_ok());
    EXPECT_DOUBLE_EQ(frame.at(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(delayed.value().at(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(delayed.value().at(2, 1), -2.0);
}

TEST_F(ExecutionModuleTest, DelayLineMatchesApplyDelay) {
    auto module = make_module(2);
    auto index = make_index(6);
    std::vector<std::vector<double>> rows{{1, 0}, {0, 1}, {1, 1}, {-1, 0}, {0, -1}, {1, 0}};
    auto frame = Frame::create(index, {"A", "B"}, rows).take();
    auto batch = module.apply_delay(frame).take();

    DelayLine line = module.make_delay_line(2);
    for (size_t t = 0; t < rows.size(); ++t) {
        auto held = line.push(rows[t]);
        ASSERT_TRUE(held.is_ok());
        EXPECT_EQ(held.value(), batch.row(t)) << "step " << t;
    }
    EXPECT_TRUE(line.push({1.0}).is_error());
}

TEST_F(ExecutionModuleTest, MisalignedObjectsAreNeverReindexed) {
    auto module = make_module(1);
    auto index = make_index(10);
    auto series = Series::create(index.slice(0, 9).value(), std::vector<double>(9, 1.0)).take();
    auto frame = Frame::zeros(index, {"A"});

    EXPECT_TRUE(module.validate_alignment(index, frame).is_ok());

    auto result = module.validate_alignment(index, frame, series);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::ALIGNMENT_ERROR);
    std::string message = result.error()->what();
    EXPECT_NE(message.find("object[1]"), std::string::npos);
    EXPECT_NE(message.find("Missing 1"), std::string::npos);
    EXPECT_NE(message.find(core::format_date(index[9])), std::string::npos);
}

TEST_F(ExecutionModuleTest, ValidateIntentChecksDiscreteValues) {
    auto module = make_module(1);
    auto index = make_index(3);

    auto good = make_intent(index, {{"A", {1, 0, -1}}, {"B", {0, 0, 1}}});
    EXPECT_TRUE(module.validate_intent(good, SignalType::DISCRETE).is_ok());

    auto fractional = make_intent(index, {{"A", {1, 0.5, -1}}});
    auto discrete = module.validate_intent(fractional, SignalType::DISCRETE);
    ASSERT_TRUE(discrete.is_error());
    EXPECT_EQ(discrete.error()->code(), ErrorCode::INTENT_VALIDATION_ERROR);
    EXPECT_TRUE(module.validate_intent(fractional, SignalType::CONTINUOUS).is_ok());

    auto infinite = make_intent(index, {{"A", {1, std::numeric_limits<double>::infinity(), 0}}});
    EXPECT_TRUE(module.validate_intent(infinite, SignalType::CONTINUOUS).is_error());

    EXPECT_TRUE(module.validate_intent(Intent{}, SignalType::DISCRETE).is_error());
}

TEST_F(ExecutionModuleTest, ValidateIntentRejectsMixedIndices) {
    auto module = make_module(1);
    auto index = make_index(4);
    Intent intent;
    intent.emplace("A", Series::create(index, {1, 1, 1, 1}).take());
    intent.emplace("B", Series::create(index.slice(1, 4).value(), {1, 1, 1}).take());

    auto result = module.validate_intent(intent, SignalType::DISCRETE);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::ALIGNMENT_ERROR);
}

TEST_F(ExecutionModuleTest, MetaRawReturnsAreDelayedIntentTimesReturns) {
    auto module = make_module(1);
    auto index = make_index(4);
    auto intent = make_intent(index, {{"A", {1, 1, -1, 0}}, {"B", {0, 1, 1, 1}}});
    SeriesMap returns;
    returns.emplace("A", Series::create(index, {0.0, 0.01, 0.02, -0.03}).take());
    returns.emplace("B", Series::create(index, {0.0, 0.05, -0.01, 0.02}).take());

    auto realized = module.compute_meta_raw_returns(intent, returns);
    ASSERT_TRUE(realized.is_ok());
    const auto& a = realized.value().at("A").values;
    const auto& b = realized.value().at("B").values;
    EXPECT_DOUBLE_EQ(a[0], 0.0);
    EXPECT_DOUBLE_EQ(a[1], 0.01);
    EXPECT_DOUBLE_EQ(a[2], 0.02);
    EXPECT_DOUBLE_EQ(a[3], 0.03);
    EXPECT_DOUBLE_EQ(b[1], 0.0);
    EXPECT_DOUBLE_EQ(b[2], -0.01);
    EXPECT_DOUBLE_EQ(b[3], 0.02);
}

TEST_F(ExecutionModuleTest, MetaRawReturnsRejectMisalignedReturns) {
    auto module = make_module(1);
    auto index = make_index(4);
    auto intent = make_intent(index, {{"A", {1, 1, 1, 1}}});
    SeriesMap returns;
    returns.emplace("A", Series::create(make_index(5).slice(1, 5).value(), {0, 0, 0, 0}).take());

    auto result = module.compute_meta_raw_returns(intent, returns);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::ALIGNMENT_ERROR);

    SeriesMap other_keys;
    other_keys.emplace("B", Series::create(index, {0, 0, 0, 0}).take());
    EXPECT_TRUE(module.compute_meta_raw_returns(intent, other_keys).is_error());
}

TEST_F(ExecutionModuleTest, MetaRawReturnsApplyExposureMapping) {
    auto module = make_module(1);
    auto index = make_index(3);
    auto intent = make_intent(index, {{"A", {3, 3, 3}}, {"B", {-1, -1, -1}}});
    SeriesMap returns;
    returns.emplace("A", Series::create(index, {0.0, 0.1, 0.1}).take());
    returns.emplace("B", Series::create(index, {0.0, 0.1, 0.1}).take());

    ExposureMapper mapper(ExposureConfig{});
    auto realized = module.compute_meta_raw_returns(intent, returns, &mapper);
    ASSERT_TRUE(realized.is_ok());
    // Ranks: |3| -> 2 (exposure 1), |-1| -> 1 (exposure -0.5)
    EXPECT_NEAR(realized.value().at("A").values[1], 0.1, 1e-12);
    EXPECT_NEAR(realized.value().at("B").values[1], -0.05, 1e-12);
}
