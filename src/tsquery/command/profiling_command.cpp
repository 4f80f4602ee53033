#include "tsquery/command/profiling_command.h"
#include "tsquery/core/error.h"

namespace tsquery {
namespace command {

ProfilingCommand::ProfilingCommand(CommandPtr command, std::shared_ptr<query::Profiler> profiler)
    : command_(std::move(command)), profiler_(std::move(profiler)) {
    if (!command_) {
        throw core::InvalidArgumentError("cannot profile a null command");
    }
    if (!profiler_) {
        profiler_ = std::make_shared<query::Profiler>();
    }
}

Result ProfilingCommand::Execute(const ExecutionContext& context) const {
    query::Profiler::Span span = profiler_->Record(Name() + ".Execute");

    ExecutionContext profiled = context;
    profiled.profiler = profiler_;
    Result result = command_->Execute(profiled);
    span.Finish();

    std::vector<query::Profile> profiles = profiler_->All();
    if (!profiles.empty()) {
        result.metadata[kProfileKey] = std::move(profiles);
    }
    return result;
}

} // namespace command
} // namespace tsquery
