#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "tempo_ngin/core/frame.hpp"

using namespace tempo_ngin;
using namespace tempo_ngin::testing;

class FrameTest : public TestBase {};

TEST_F(FrameTest, CreateValidatesShape) {
    auto index = make_index(3);
    auto ok = Frame::create(index, {"A", "B"}, {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().num_rows(), 3u);
    EXPECT_EQ(ok.value().num_columns(), 2u);
    EXPECT_DOUBLE_EQ(ok.value().at(2, 1), 6.0);

    auto short_rows = Frame::create(index, {"A", "B"}, {{1.0, 2.0}, {3.0, 4.0}});
    ASSERT_TRUE(short_rows.is_error());
    EXPECT_EQ(short_rows.error()->code(), ErrorCode::ALIGNMENT_ERROR);

    auto narrow = Frame::create(index, {"A", "B"}, {{1.0, 2.0}, {3.0}, {5.0, 6.0}});
    ASSERT_TRUE(narrow.is_error());
    EXPECT_EQ(narrow.error()->code(), ErrorCode::INVALID_DATA);

    auto duplicate = Frame::create(index, {"A", "A"}, {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
    EXPECT_TRUE(duplicate.is_error());
}

TEST_F(FrameTest, SeriesRejectsLengthMismatch) {
    auto series = Series::create(make_index(3), {1.0, 2.0});
    ASSERT_TRUE(series.is_error());
    EXPECT_EQ(series.error()->code(), ErrorCode::ALIGNMENT_ERROR);
}

TEST_F(FrameTest, FromSeriesRequiresSharedIndex) {
    auto index = make_index(4);
    SeriesMap series;
    series.emplace("A", Series::create(index, {1.0, 2.0, 3.0, 4.0}).take());
    series.emplace("B", Series::create(index, {5.0, 6.0, 7.0, 8.0}).take());

    auto frame = Frame::from_series(series);
    ASSERT_TRUE(frame.is_ok());
    EXPECT_EQ(frame.value().columns(), (std::vector<std::string>{"A", "B"}));
    EXPECT_DOUBLE_EQ(frame.value().at(3, 1), 8.0);

    series.emplace("C", Series::create(index.slice(1, 4).value(), {1.0, 1.0, 1.0}).take());
    auto misaligned = Frame::from_series(series);
    ASSERT_TRUE(misaligned.is_error());
    EXPECT_EQ(misaligned.error()->code(), ErrorCode::ALIGNMENT_ERROR);
    EXPECT_NE(std::string(misaligned.error()->what()).find("'C'"), std::string::npos);
}

TEST_F(FrameTest, ColumnAndSlice) {
    auto index = make_index(4);
    auto frame = Frame::create(index, {"A", "B"}, {{1, 2}, {3, 4}, {5, 6}, {7, 8}}).take();

    auto column = frame.column("B");
    ASSERT_TRUE(column.is_ok());
    EXPECT_EQ(column.value().values, (std::vector<double>{2, 4, 6, 8}));
    EXPECT_TRUE(frame.column("Z").is_error());

    auto slice = frame.slice(1, 3);
    ASSERT_TRUE(slice.is_ok());
    EXPECT_EQ(slice.value().num_rows(), 2u);
    EXPECT_EQ(slice.value().index()[0], index[1]);
    EXPECT_DOUBLE_EQ(slice.value().at(0, 0), 3.0);
    EXPECT_TRUE(frame.slice(2, 5).is_error());
}

TEST_F(FrameTest, ZerosAndToSeries) {
    auto index = make_index(3);
    auto zeros = Frame::zeros(index, {"X", "Y"});
    EXPECT_EQ(zeros.num_rows(), 3u);
    EXPECT_DOUBLE_EQ(zeros.at(2, 1), 0.0);

    auto series = zeros.to_series();
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.at("Y").index, index);
    EXPECT_EQ(series.at("Y").values.size(), 3u);
}
