#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tsquery/core/config.h"
#include "tsquery/core/context.h"
#include "tsquery/core/timerange.h"
#include "tsquery/core/types.h"
#include "tsquery/metadata/metric_metadata.h"
#include "tsquery/query/predicate.h"
#include "tsquery/query/profiler.h"
#include "tsquery/storage/timeseries_storage.h"

namespace tsquery {
namespace function {
class Registry;
}

namespace command {

/**
 * @brief Request-scoped configuration supplied when invoking a command
 *
 * Owned by the caller. Backends are shared so that an evaluation orphaned
 * by a timeout can finish safely after the request has returned.
 */
struct ExecutionContext {
    std::shared_ptr<storage::TimeseriesStorageAPI> timeseries_storage;
    std::shared_ptr<metadata::MetricMetadataAPI> metric_metadata;
    int fetch_limit = 0;                                // maximum number of series fetches
    std::chrono::milliseconds timeout{0};               // optional (0 => no timeout)
    std::shared_ptr<const function::Registry> registry; // optional (null => default registry)
    int slot_limit = 0;                                 // optional (<= 0 => 1000)
    std::shared_ptr<query::Profiler> profiler;          // optional
    query::PredicatePtr additional_constraints;         // optional, applied by describe and select
    std::shared_ptr<core::Context> context;             // optional (null => background)
};

/**
 * @brief Validates the config, applies its log level and builds the request context
 * @throws core::InvalidArgumentError if config.Validate() fails
 */
ExecutionContext MakeExecutionContext(const core::QueryConfig& config,
                                      std::shared_ptr<storage::TimeseriesStorageAPI> timeseries_storage,
                                      std::shared_ptr<metadata::MetricMetadataAPI> metric_metadata);

/**
 * @brief Tag key => sorted distinct values
 */
using TagValues = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Outcome of one select expression
 */
struct QueryResult {
    std::string query;
    std::string name;
    std::string type;  // one of "series" or "scalars"
    // for "series" type
    std::vector<core::Timeseries> series;
    std::optional<core::Timerange> timerange;
    // for "scalars" type
    core::ScalarSet scalars;
};

using ResultBody = std::variant<std::monostate, TagValues, std::vector<core::MetricKey>, std::vector<QueryResult>>;

/**
 * @brief Metadata entry: counts and resolutions are integers (resolution in ms)
 */
using MetadataValue = std::variant<int64_t, TagValues, std::vector<std::string>, std::vector<query::Profile>>;

struct Result {
    ResultBody body;
    std::map<std::string, MetadataValue> metadata;
};

/**
 * @brief A parsed query, ready to run against the backends
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * @brief Runs the command
     * @throws core::Error (or a backend's error) on failure; no partial results
     */
    virtual Result Execute(const ExecutionContext& context) const = 0;

    virtual std::string Name() const = 0;
};

using CommandPtr = std::shared_ptr<const Command>;

} // namespace command
} // namespace tsquery
