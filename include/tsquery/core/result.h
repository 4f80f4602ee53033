#ifndef TSQUERY_CORE_RESULT_H_
#define TSQUERY_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tsquery {
namespace core {

/**
 * @brief Result type for conversions that can fail without throwing
 *
 * Usage:
 * ```
 * Result<SeriesList> list = value.ToSeriesList();
 * if (list.ok()) {
 *     use(list.value());
 * } else {
 *     std::string why = list.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    Result(Result&& other) noexcept = default;
    Result& operator=(Result&& other) noexcept = default;

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    const T& value() const {
        if (error_msg_) {
            throw std::runtime_error("Attempting to access value of failed result: " + *error_msg_);
        }
        return *value_;
    }
    T&& take_value() {
        if (error_msg_) {
            throw std::runtime_error("Attempting to take value of failed result: " + *error_msg_);
        }
        return std::move(*value_);
    }

    static Result<T> error(const std::string& message) {
        return Result<T>(message, ErrorTag{});
    }

private:
    struct ErrorTag {};
    Result(std::string error_msg, ErrorTag) : value_(std::nullopt), error_msg_(std::move(error_msg)) {}

    std::optional<T> value_;
    std::optional<std::string> error_msg_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    static Result<void> error(const std::string& message) {
        Result<void> result;
        result.error_msg_ = message;
        return result;
    }

private:
    std::optional<std::string> error_msg_;
};

} // namespace core
} // namespace tsquery

#endif // TSQUERY_CORE_RESULT_H_
