#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "tsquery/core/result.h"
#include "tsquery/core/types.h"

namespace tsquery {
namespace function {

/**
 * @brief Millisecond duration literal (e.g. a moving-average window)
 */
struct Duration {
    int64_t millis;

    bool operator==(const Duration& other) const { return millis == other.millis; }
};

/**
 * @brief Type of the value
 */
enum class ValueType {
    SERIES_LIST,
    SCALAR_SET,
    SCALAR,
    STRING,
    DURATION
};

const char* ValueTypeName(ValueType type);

/**
 * @brief Result of evaluating an expression
 *
 * Only series lists and scalar sets are terminal: a query must resolve to
 * one of them. Scalars, strings and durations appear as function arguments.
 */
class Value {
public:
    Value(core::SeriesList list) : type_(ValueType::SERIES_LIST), data_(std::move(list)) {}
    Value(core::ScalarSet scalars) : type_(ValueType::SCALAR_SET), data_(std::move(scalars)) {}
    Value(double scalar) : type_(ValueType::SCALAR), data_(scalar) {}
    Value(std::string text) : type_(ValueType::STRING), data_(std::move(text)) {}
    Value(Duration duration) : type_(ValueType::DURATION), data_(duration) {}

    ValueType type() const { return type_; }

    core::Result<core::SeriesList> ToSeriesList() const;
    core::Result<core::ScalarSet> ToScalarSet() const;
    core::Result<double> ToScalar() const;
    core::Result<Duration> ToDuration() const;
    core::Result<std::string> ToString() const;

private:
    ValueType type_;
    std::variant<core::SeriesList, core::ScalarSet, double, std::string, Duration> data_;
};

} // namespace function
} // namespace tsquery
