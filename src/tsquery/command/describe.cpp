#include "tsquery/command/describe.h"
#include "tsquery/common/natural_sort.h"
#include "tsquery/core/error.h"
#include <algorithm>
#include <set>

namespace tsquery {
namespace command {

namespace {

metadata::MetricMetadataAPI& RequireMetadata(const ExecutionContext& context) {
    if (!context.metric_metadata) {
        throw core::InternalError("execution context has no metric metadata backend");
    }
    return *context.metric_metadata;
}

} // namespace

DescribeCommand::DescribeCommand(core::MetricKey metric, query::PredicatePtr predicate)
    : metric_(std::move(metric)), predicate_(std::move(predicate)) {}

Result DescribeCommand::Execute(const ExecutionContext& context) const {
    std::vector<core::TagSet> tagsets =
        RequireMetadata(context).GetAllTags(metric_, metadata::MetadataContext{context.profiler});

    // Splitting each tag key into its own set of values is helpful for discovering actual metrics.
    query::PredicatePtr predicate = query::All(predicate_, context.additional_constraints);
    std::map<std::string, std::set<std::string>> key_value_sets;
    for (const auto& tagset : tagsets) {
        if (predicate && !predicate->Apply(tagset)) {
            continue;
        }
        for (const auto& [key, value] : tagset) {
            key_value_sets[key].insert(value);
        }
    }

    TagValues key_value_lists;
    for (const auto& [key, values] : key_value_sets) {
        std::vector<std::string> list(values.begin(), values.end());
        common::NaturalSort(list);
        key_value_lists[key] = std::move(list);
    }

    Result result;
    result.body = std::move(key_value_lists);
    return result;
}

DescribeAllCommand::DescribeAllCommand(const std::string& pattern) : pattern_(pattern) {
    try {
        matcher_ = std::regex(pattern_);
    } catch (const std::regex_error& e) {
        throw core::InvalidArgumentError("invalid metric pattern '" + pattern_ + "': " + e.what());
    }
}

Result DescribeAllCommand::Execute(const ExecutionContext& context) const {
    std::vector<core::MetricKey> metrics =
        RequireMetadata(context).GetAllMetrics(metadata::MetadataContext{context.profiler});

    std::vector<core::MetricKey> filtered;
    filtered.reserve(metrics.size());
    for (const auto& metric : metrics) {
        if (std::regex_search(metric, matcher_)) {
            filtered.push_back(metric);
        }
    }
    std::sort(filtered.begin(), filtered.end());

    Result result;
    result.metadata["count"] = static_cast<int64_t>(filtered.size());
    result.body = std::move(filtered);
    return result;
}

DescribeMetricsCommand::DescribeMetricsCommand(std::string tag_key, std::string tag_value)
    : tag_key_(std::move(tag_key)), tag_value_(std::move(tag_value)) {}

Result DescribeMetricsCommand::Execute(const ExecutionContext& context) const {
    std::vector<core::MetricKey> metrics = RequireMetadata(context).GetMetricsForTag(
        tag_key_, tag_value_, metadata::MetadataContext{context.profiler});

    Result result;
    result.metadata["count"] = static_cast<int64_t>(metrics.size());
    result.body = std::move(metrics);
    return result;
}

} // namespace command
} // namespace tsquery
