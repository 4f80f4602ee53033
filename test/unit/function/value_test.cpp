#include <gtest/gtest.h>
#include "tsquery/function/value.h"

namespace tsquery {
namespace function {
namespace {

TEST(ValueTest, SeriesList) {
    core::SeriesList list;
    list.series.push_back(core::Timeseries{{1.0, 2.0}, core::TagSet{{"host", "a"}}});
    Value value(list);
    EXPECT_EQ(value.type(), ValueType::SERIES_LIST);

    auto converted = value.ToSeriesList();
    ASSERT_TRUE(converted.ok());
    EXPECT_EQ(converted.value(), list);
    EXPECT_FALSE(value.ToScalarSet().ok());
    EXPECT_FALSE(value.ToScalar().ok());
}

TEST(ValueTest, ScalarConvertsToScalarSet) {
    Value value(3.5);
    EXPECT_EQ(value.type(), ValueType::SCALAR);
    EXPECT_EQ(value.ToScalar().value(), 3.5);

    auto scalars = value.ToScalarSet();
    ASSERT_TRUE(scalars.ok());
    ASSERT_EQ(scalars.value().size(), 1u);
    EXPECT_TRUE(scalars.value()[0].tagset.empty());
    EXPECT_EQ(scalars.value()[0].value, 3.5);
    EXPECT_FALSE(value.ToSeriesList().ok());
}

TEST(ValueTest, ScalarSet) {
    core::ScalarSet scalars = {core::TaggedScalar{core::TagSet{{"dc", "east"}}, 2.0}};
    Value value(scalars);
    EXPECT_EQ(value.type(), ValueType::SCALAR_SET);
    EXPECT_EQ(value.ToScalarSet().value(), scalars);
    EXPECT_FALSE(value.ToScalar().ok());
}

TEST(ValueTest, StringIsNotTerminal) {
    Value value(std::string("foo"));
    EXPECT_EQ(value.type(), ValueType::STRING);
    EXPECT_EQ(value.ToString().value(), "foo");

    auto list = value.ToSeriesList();
    ASSERT_FALSE(list.ok());
    EXPECT_EQ(list.error(), "cannot convert string to series list");
    auto scalars = value.ToScalarSet();
    ASSERT_FALSE(scalars.ok());
    EXPECT_EQ(scalars.error(), "cannot convert string to scalar set");
}

TEST(ValueTest, Duration) {
    Value value(Duration{60000});
    EXPECT_EQ(value.type(), ValueType::DURATION);
    EXPECT_EQ(value.ToDuration().value().millis, 60000);
    EXPECT_FALSE(value.ToScalarSet().ok());
    EXPECT_EQ(value.ToString().error(), "cannot convert duration to string");
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(ValueTypeName(ValueType::SERIES_LIST), "series list");
    EXPECT_STREQ(ValueTypeName(ValueType::SCALAR_SET), "scalar set");
    EXPECT_STREQ(ValueTypeName(ValueType::SCALAR), "scalar");
}

} // namespace
} // namespace function
} // namespace tsquery
