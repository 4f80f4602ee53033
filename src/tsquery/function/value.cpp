#include "tsquery/function/value.h"

namespace tsquery {
namespace function {

namespace {

std::string ConversionError(ValueType from, const char* to) {
    return std::string("cannot convert ") + ValueTypeName(from) + " to " + to;
}

} // namespace

const char* ValueTypeName(ValueType type) {
    switch (type) {
        case ValueType::SERIES_LIST: return "series list";
        case ValueType::SCALAR_SET: return "scalar set";
        case ValueType::SCALAR: return "scalar";
        case ValueType::STRING: return "string";
        case ValueType::DURATION: return "duration";
    }
    return "unknown";
}

core::Result<core::SeriesList> Value::ToSeriesList() const {
    if (type_ == ValueType::SERIES_LIST) {
        return std::get<core::SeriesList>(data_);
    }
    return core::Result<core::SeriesList>::error(ConversionError(type_, "series list"));
}

core::Result<core::ScalarSet> Value::ToScalarSet() const {
    switch (type_) {
        case ValueType::SCALAR_SET:
            return std::get<core::ScalarSet>(data_);
        case ValueType::SCALAR:
            return core::ScalarSet{core::TaggedScalar{core::TagSet(), std::get<double>(data_)}};
        default:
            return core::Result<core::ScalarSet>::error(ConversionError(type_, "scalar set"));
    }
}

core::Result<double> Value::ToScalar() const {
    if (type_ == ValueType::SCALAR) {
        return std::get<double>(data_);
    }
    return core::Result<double>::error(ConversionError(type_, "scalar"));
}

core::Result<Duration> Value::ToDuration() const {
    if (type_ == ValueType::DURATION) {
        return std::get<Duration>(data_);
    }
    return core::Result<Duration>::error(ConversionError(type_, "duration"));
}

core::Result<std::string> Value::ToString() const {
    if (type_ == ValueType::STRING) {
        return std::get<std::string>(data_);
    }
    return core::Result<std::string>::error(ConversionError(type_, "string"));
}

} // namespace function
} // namespace tsquery
