#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tsquery/core/types.h"

namespace tsquery {
namespace query {
class Profiler;
}

namespace metadata {

/**
 * @brief Per-call context handed to the metadata backend
 */
struct MetadataContext {
    std::shared_ptr<query::Profiler> profiler;  // optional; cache misses are reported here
};

/**
 * @brief Interface for the backend serving metric names and tag sets
 *
 * Implementations report failures by throwing core::BackendError.
 */
class MetricMetadataAPI {
public:
    virtual ~MetricMetadataAPI() = default;

    virtual std::vector<core::TagSet> GetAllTags(const core::MetricKey& metric,
                                                 const MetadataContext& context) = 0;

    virtual std::vector<core::MetricKey> GetAllMetrics(const MetadataContext& context) = 0;

    virtual std::vector<core::MetricKey> GetMetricsForTag(const std::string& tag_key,
                                                          const std::string& tag_value,
                                                          const MetadataContext& context) = 0;
};

} // namespace metadata
} // namespace tsquery
