#include <gtest/gtest.h>
#include "tsquery/core/error.h"
#include "tsquery/core/timerange.h"
#include <limits>

namespace tsquery {
namespace core {
namespace {

TEST(TimerangeTest, AlignedRange) {
    Timerange range = Timerange::Snapped(0, 240000, 60000);
    EXPECT_EQ(range.Start(), 0);
    EXPECT_EQ(range.End(), 240000);
    EXPECT_EQ(range.Resolution(), 60000);
    EXPECT_EQ(range.Slots(), 5);
    EXPECT_EQ(range.Duration(), 240000);
}

TEST(TimerangeTest, EndSnapsDownOntoGrid) {
    Timerange range = Timerange::Snapped(1000, 1250, 100);
    EXPECT_EQ(range.Start(), 1000);
    EXPECT_EQ(range.End(), 1200);
    EXPECT_EQ(range.Slots(), 3);
}

TEST(TimerangeTest, SingleSlot) {
    Timerange range = Timerange::Snapped(500, 500, 30);
    EXPECT_EQ(range.Slots(), 1);
    EXPECT_EQ(range.Duration(), 0);
}

TEST(TimerangeTest, SnappingIsIdempotent) {
    Timerange once = Timerange::Snapped(17, 1003, 7);
    Timerange twice = Timerange::Snapped(once.Start(), once.End(), once.Resolution());
    EXPECT_EQ(once, twice);
}

TEST(TimerangeTest, NegativeStart) {
    Timerange range = Timerange::Snapped(-300, 0, 100);
    EXPECT_EQ(range.Slots(), 4);
    EXPECT_TRUE(range.Contains(-200));
}

TEST(TimerangeTest, InvalidResolution) {
    EXPECT_THROW(Timerange::Snapped(0, 100, 0), InvalidRangeError);
    EXPECT_THROW(Timerange::Snapped(0, 100, -10), InvalidRangeError);
}

TEST(TimerangeTest, StartAfterEnd) {
    EXPECT_THROW(Timerange::Snapped(200, 100, 10), InvalidRangeError);
}

TEST(TimerangeTest, TooManySlots) {
    EXPECT_THROW(Timerange::Snapped(0, int64_t{1} << 40, 1), InvalidRangeError);
}

TEST(TimerangeTest, SpanBeyondInt64) {
    const int64_t min = std::numeric_limits<int64_t>::min();
    const int64_t max = std::numeric_limits<int64_t>::max();
    EXPECT_THROW(Timerange::Snapped(min + 1, 1000, 1000), InvalidRangeError);
    EXPECT_THROW(Timerange::Snapped(min, max, int64_t{1} << 40), InvalidRangeError);
}

TEST(TimerangeTest, ExtremeEndpoints) {
    const int64_t min = std::numeric_limits<int64_t>::min();
    const int64_t max = std::numeric_limits<int64_t>::max();

    Timerange high = Timerange::Snapped(max - 10, max, 3);
    EXPECT_EQ(high.End(), max - 1);
    EXPECT_EQ(high.Slots(), 4);

    Timerange low = Timerange::Snapped(min, min + 1000, 1000);
    EXPECT_EQ(low.End(), min + 1000);
    EXPECT_EQ(low.Duration(), 1000);
}

TEST(TimerangeTest, Contains) {
    Timerange range = Timerange::Snapped(0, 300, 100);
    EXPECT_TRUE(range.Contains(0));
    EXPECT_TRUE(range.Contains(300));
    EXPECT_FALSE(range.Contains(150));
    EXPECT_FALSE(range.Contains(400));
    EXPECT_FALSE(range.Contains(-100));
}

TEST(TimerangeTest, ToString) {
    EXPECT_EQ(Timerange::Snapped(0, 300, 100).ToString(), "[0, 300] @ 100ms");
}

} // namespace
} // namespace core
} // namespace tsquery
