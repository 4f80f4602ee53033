#pragma once

#include <regex>
#include <string>

#include "tsquery/command/command.h"

namespace tsquery {
namespace command {

/**
 * @brief Describes the tag set of one metric
 *
 * Body: tag key => naturally sorted values, over the tag sets matching the
 * predicate and the context's additional constraints.
 */
class DescribeCommand : public Command {
public:
    DescribeCommand(core::MetricKey metric, query::PredicatePtr predicate);

    Result Execute(const ExecutionContext& context) const override;
    std::string Name() const override { return "describe"; }

private:
    core::MetricKey metric_;
    query::PredicatePtr predicate_;
};

/**
 * @brief Lists every metric whose name matches the pattern, sorted
 */
class DescribeAllCommand : public Command {
public:
    /**
     * @throws core::InvalidArgumentError on a malformed pattern
     */
    explicit DescribeAllCommand(const std::string& pattern);

    Result Execute(const ExecutionContext& context) const override;
    std::string Name() const override { return "describe all"; }

private:
    std::string pattern_;
    std::regex matcher_;
};

/**
 * @brief Lists the metrics that carry one exact tag key/value pair
 */
class DescribeMetricsCommand : public Command {
public:
    DescribeMetricsCommand(std::string tag_key, std::string tag_value);

    Result Execute(const ExecutionContext& context) const override;
    std::string Name() const override { return "describe metrics"; }

private:
    std::string tag_key_;
    std::string tag_value_;
};

} // namespace command
} // namespace tsquery
