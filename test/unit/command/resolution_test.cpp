#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "tsquery/command/resolution.h"
#include "tsquery/core/error.h"
#include "tsquery/function/registry.h"
#include "test_util/mock_backends.h"
#include <limits>

namespace tsquery {
namespace command {
namespace {

using ::testing::_;
using ::testing::Eq;
using ::testing::Return;
using testutil::LookbackExpression;
using testutil::MockTimeseriesStorage;

TEST(SmallestResolutionTest, HoldsBackTwoSlots) {
    core::Timerange range = core::Timerange::Snapped(0, 9000, 1000);
    EXPECT_EQ(SmallestResolution(range, 10), 1125);
    EXPECT_EQ(SmallestResolution(range, 3), 9000);
}

TEST(SmallestResolutionTest, TinyLimitsDoNotDivideByZero) {
    core::Timerange range = core::Timerange::Snapped(0, 9000, 1000);
    EXPECT_EQ(SmallestResolution(range, 2), 9000);
    EXPECT_EQ(SmallestResolution(range, 1), 9000);
}

TEST(NegotiateTimerangeTest, BackendBumpsResolution) {
    core::Timerange range = core::Timerange::Snapped(0, 9000, 1000);
    MockTimeseriesStorage storage;
    EXPECT_CALL(storage, ChooseResolution(Eq(range), 1125)).WillOnce(Return(2000));

    NegotiatedRange negotiated = NegotiateTimerange(range, range, 10, storage);
    EXPECT_EQ(negotiated.resolution, 2000);
    EXPECT_EQ(negotiated.timerange.Start(), 0);
    EXPECT_EQ(negotiated.timerange.End(), 8000);
    EXPECT_EQ(negotiated.timerange.Slots(), 5);
}

TEST(NegotiateTimerangeTest, ExceedingSlotLimitFails) {
    core::Timerange range = core::Timerange::Snapped(0, 9000, 1000);
    MockTimeseriesStorage storage;
    EXPECT_CALL(storage, ChooseResolution(_, 9000)).WillOnce(Return(1000));

    try {
        NegotiateTimerange(range, range, 3, storage);
        FAIL() << "expected LimitError";
    } catch (const core::LimitError& e) {
        EXPECT_EQ(e.actual(), 10);
        EXPECT_EQ(e.limit(), 3);
        EXPECT_EQ(e.message(), "Requested number of data points exceeds the configured limit");
    }
}

TEST(NegotiateTimerangeTest, UsesWidenedRangeForBudget) {
    core::Timerange user = core::Timerange::Snapped(4000, 9000, 1000);
    core::Timerange widened = core::Timerange::Snapped(1000, 9000, 1000);
    MockTimeseriesStorage storage;
    EXPECT_CALL(storage, ChooseResolution(Eq(widened), 1000)).WillOnce(Return(1000));

    NegotiatedRange negotiated = NegotiateTimerange(user, widened, 10, storage);
    EXPECT_EQ(negotiated.timerange, user);
}

TEST(NegotiateTimerangeTest, DefaultLimitWhenUnset) {
    core::Timerange range = core::Timerange::Snapped(0, 99800, 100);
    MockTimeseriesStorage storage;
    EXPECT_CALL(storage, ChooseResolution(_, 100)).WillOnce(Return(100));
    EXPECT_EQ(NegotiateTimerange(range, range, 0, storage).timerange.Slots(), 999);
}

TEST(NegotiateTimerangeTest, BackendErrorsPropagate) {
    core::Timerange range = core::Timerange::Snapped(0, 9000, 1000);
    MockTimeseriesStorage storage;
    EXPECT_CALL(storage, ChooseResolution(_, _)).WillOnce([](const core::Timerange&, int64_t) -> int64_t {
        throw core::BackendError("resolution service unavailable");
    });
    EXPECT_THROW(NegotiateTimerange(range, range, 10, storage), core::BackendError);
}

TEST(WidenTimerangeTest, NoLookbackKeepsRange) {
    core::Timerange range = core::Timerange::Snapped(1000, 5000, 1000);
    std::vector<function::ExpressionPtr> expressions = {
        std::make_shared<function::MetricFetchExpression>("cpu", nullptr)};
    EXPECT_EQ(WidenTimerange(range, expressions, nullptr), range);
}

TEST(WidenTimerangeTest, WidestExpressionWins) {
    core::Timerange range = core::Timerange::Snapped(10000, 20000, 1000);
    std::vector<function::ExpressionPtr> expressions = {std::make_shared<LookbackExpression>(2000),
                                                        std::make_shared<LookbackExpression>(5000)};
    core::Timerange widened = WidenTimerange(range, expressions, function::Registry::Default());
    EXPECT_EQ(widened.Start(), 5000);
    EXPECT_EQ(widened.End(), 20000);
    EXPECT_EQ(widened.Resolution(), 1000);
}

TEST(WidenTimerangeTest, FunctionLookback) {
    core::Timerange range = core::Timerange::Snapped(600000, 1200000, 60000);
    std::vector<function::ExpressionPtr> expressions = {std::make_shared<function::FunctionExpression>(
        "transform.moving_average",
        std::vector<function::ExpressionPtr>{std::make_shared<function::MetricFetchExpression>("cpu", nullptr),
                                             std::make_shared<function::DurationExpression>("5m", 300000)})};
    EXPECT_EQ(WidenTimerange(range, expressions, nullptr).Start(), 300000);
}

TEST(WidenTimerangeTest, UnrepresentableWideningFallsBack) {
    core::Timerange range = core::Timerange::Snapped(0, 1000, 1);
    std::vector<function::ExpressionPtr> expressions = {
        std::make_shared<LookbackExpression>(int64_t{1} << 40)};
    EXPECT_EQ(WidenTimerange(range, expressions, nullptr), range);
}

TEST(WidenTimerangeTest, HugeWindowFallsBack) {
    core::Timerange range = core::Timerange::Snapped(600000, 1200000, 60000);
    const int64_t window = std::numeric_limits<int64_t>::max() - 1000;
    std::vector<function::ExpressionPtr> expressions = {std::make_shared<function::FunctionExpression>(
        "transform.moving_average",
        std::vector<function::ExpressionPtr>{std::make_shared<function::MetricFetchExpression>("cpu", nullptr),
                                             std::make_shared<function::DurationExpression>("huge", window)})};
    core::Timerange widened = WidenTimerange(range, expressions, nullptr);
    EXPECT_EQ(widened, range);
    EXPECT_GT(SmallestResolution(widened, 1000), 0);
}

TEST(WidenTimerangeTest, WindowPastEarliestTimeFallsBack) {
    core::Timerange range = core::Timerange::Snapped(-1000, 1000, 100);
    std::vector<function::ExpressionPtr> expressions = {std::make_shared<function::FunctionExpression>(
        "transform.moving_average",
        std::vector<function::ExpressionPtr>{
            std::make_shared<function::MetricFetchExpression>("cpu", nullptr),
            std::make_shared<function::DurationExpression>("max", std::numeric_limits<int64_t>::max())})};
    EXPECT_EQ(WidenTimerange(range, expressions, nullptr), range);
}

} // namespace
} // namespace command
} // namespace tsquery
