#ifndef TSQUERY_CORE_ERROR_H_
#define TSQUERY_CORE_ERROR_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tsquery {
namespace core {

/**
 * @brief Base class for all query engine errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        TIMEOUT = 3,
        RESOURCE_EXHAUSTED = 4,
        BACKEND = 5,
        INTERNAL = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Malformed start/end/resolution triple
 */
class InvalidRangeError : public InvalidArgumentError {
public:
    explicit InvalidRangeError(const std::string& message)
        : InvalidArgumentError(message) {}
};

/**
 * @brief A query failed to parse (raised by parsers plugged into the API layer)
 */
class ParseError : public InvalidArgumentError {
public:
    explicit ParseError(const std::string& message)
        : InvalidArgumentError(message) {}
};

/**
 * @brief A configured limit was exceeded (slot count, fetch count or timeout)
 *
 * Message format is "<message> (<actual> > <limit>)". Timeouts are
 * reported in milliseconds.
 */
class LimitError : public Error {
public:
    LimitError(const std::string& message, int64_t actual, int64_t limit)
        : Error(Format(message, actual, limit), Code::RESOURCE_EXHAUSTED),
          message_(message), actual_(actual), limit_(limit) {}

    const std::string& message() const { return message_; }
    int64_t actual() const { return actual_; }
    int64_t limit() const { return limit_; }

private:
    static std::string Format(const std::string& message, int64_t actual, int64_t limit) {
        return message + " (" + std::to_string(actual) + " > " + std::to_string(limit) + ")";
    }

    std::string message_;
    int64_t actual_;
    int64_t limit_;
};

/**
 * @brief Failure reported by a storage or metadata backend
 */
class BackendError : public Error {
public:
    explicit BackendError(const std::string& message)
        : Error(message, Code::BACKEND) {}
};

/**
 * @brief An expression evaluated to something other than series or scalars
 */
class TypeMismatchError : public InvalidArgumentError {
public:
    explicit TypeMismatchError(const std::string& query)
        : InvalidArgumentError("query " + query + " does not result in a timeseries or scalar."),
          query_(query) {}

    const std::string& query() const { return query_; }

private:
    std::string query_;
};

/**
 * @brief Response serialization failure; never leaves the API layer
 */
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace tsquery

#endif // TSQUERY_CORE_ERROR_H_
