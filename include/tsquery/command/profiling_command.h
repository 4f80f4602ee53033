#pragma once

#include <memory>
#include <string>

#include "tsquery/command/command.h"
#include "tsquery/query/profiler.h"

namespace tsquery {
namespace command {

/**
 * @brief Decorator that times a command and attaches the recorded spans
 *
 * The wrapped command runs with this profiler in its context, so nested work
 * records sub-spans into the same profile. On success every span is stored
 * under the "profile" metadata key; failures propagate without a profile.
 */
class ProfilingCommand : public Command {
public:
    static constexpr const char* kProfileKey = "profile";

    ProfilingCommand(CommandPtr command, std::shared_ptr<query::Profiler> profiler);

    Result Execute(const ExecutionContext& context) const override;
    std::string Name() const override { return command_->Name(); }

    const std::shared_ptr<query::Profiler>& profiler() const { return profiler_; }

private:
    CommandPtr command_;
    std::shared_ptr<query::Profiler> profiler_;
};

} // namespace command
} // namespace tsquery
