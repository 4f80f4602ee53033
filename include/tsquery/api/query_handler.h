#pragma once

#include <functional>
#include <string>

#include "tsquery/command/command.h"

namespace tsquery {
namespace api {

/**
 * @brief Status code and JSON payload of a query response
 */
struct HttpResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief Turns a query string into a command
 *
 * Implementations throw core::ParseError on malformed input. Any exception
 * thrown while parsing is answered with 400.
 */
using CommandParser = std::function<command::CommandPtr(const std::string& query)>;

/**
 * @brief Handler for the query endpoint
 *
 * Success responses are {"success":true,"name":...,"body":...,"metadata":...};
 * metadata is a sibling of body and is omitted when empty. Failures are
 * {"success":false,"message":...} with status 400 for parse failures and 500
 * otherwise.
 */
class QueryHandler {
public:
    QueryHandler(command::ExecutionContext context, CommandParser parser);

    HttpResponse Handle(const std::string& query) const;

    /**
     * @throws core::EncodingError if the result cannot be represented as JSON
     */
    static std::string EncodeResult(const command::Result& result, const std::string& name);

    /**
     * @throws core::EncodingError if the message cannot be represented as JSON
     */
    static std::string EncodeError(const std::string& message);

private:
    HttpResponse ErrorResponse(int status, const std::string& message) const;

    command::ExecutionContext context_;
    CommandParser parser_;
};

} // namespace api
} // namespace tsquery
