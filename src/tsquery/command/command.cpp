#include "tsquery/command/command.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/error.h"
#include "tsquery/function/registry.h"

namespace tsquery {
namespace command {

ExecutionContext MakeExecutionContext(const core::QueryConfig& config,
                                      std::shared_ptr<storage::TimeseriesStorageAPI> timeseries_storage,
                                      std::shared_ptr<metadata::MetricMetadataAPI> metric_metadata) {
    auto valid = config.Validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError("invalid query config: " + valid.error());
    }
    common::Logger::SetLevel(spdlog::level::from_str(config.log_level));

    ExecutionContext context;
    context.timeseries_storage = std::move(timeseries_storage);
    context.metric_metadata = std::move(metric_metadata);
    context.fetch_limit = config.fetch_limit;
    context.timeout = config.timeout;
    context.registry = function::Registry::Default();
    context.slot_limit = core::EffectiveSlotLimit(config.slot_limit);
    context.context = core::Context::Background();
    return context;
}

} // namespace command
} // namespace tsquery
