#include <gtest/gtest.h>
#include "tsquery/command/profiling_command.h"
#include "tsquery/core/error.h"

namespace tsquery {
namespace command {
namespace {

// Records a nested span and remembers the profiler it ran with.
class RecordingCommand : public Command {
public:
    explicit RecordingCommand(bool fail = false) : fail_(fail) {}

    Result Execute(const ExecutionContext& context) const override {
        seen_profiler_ = context.profiler;
        if (context.profiler) {
            auto span = context.profiler->Record("inner.work");
        }
        if (fail_) {
            throw core::BackendError("backend down");
        }
        Result result;
        result.body = std::vector<core::MetricKey>{"cpu"};
        result.metadata["count"] = int64_t{1};
        return result;
    }

    std::string Name() const override { return "describe all"; }

    mutable std::shared_ptr<query::Profiler> seen_profiler_;

private:
    bool fail_;
};

TEST(ProfilingCommandTest, AttachesProfiles) {
    auto inner = std::make_shared<RecordingCommand>();
    auto profiler = std::make_shared<query::Profiler>();
    ProfilingCommand command(inner, profiler);

    Result result = command.Execute(ExecutionContext{});
    EXPECT_EQ(inner->seen_profiler_, profiler);
    EXPECT_EQ(std::get<int64_t>(result.metadata.at("count")), 1);

    const auto& profiles = std::get<std::vector<query::Profile>>(result.metadata.at(ProfilingCommand::kProfileKey));
    ASSERT_EQ(profiles.size(), 2u);
    EXPECT_EQ(profiles[0].name, "inner.work");
    EXPECT_EQ(profiles[1].name, "describe all.Execute");
}

TEST(ProfilingCommandTest, ForwardsName) {
    ProfilingCommand command(std::make_shared<RecordingCommand>(), nullptr);
    EXPECT_EQ(command.Name(), "describe all");
    EXPECT_NE(command.profiler(), nullptr);
}

TEST(ProfilingCommandTest, FailurePropagatesWithoutProfile) {
    ProfilingCommand command(std::make_shared<RecordingCommand>(true), nullptr);
    EXPECT_THROW(command.Execute(ExecutionContext{}), core::BackendError);
}

TEST(ProfilingCommandTest, RejectsNullCommand) {
    EXPECT_THROW(ProfilingCommand(nullptr, nullptr), core::InvalidArgumentError);
}

TEST(ProfilingCommandTest, BodyUnchanged) {
    ProfilingCommand command(std::make_shared<RecordingCommand>(), nullptr);
    Result result = command.Execute(ExecutionContext{});
    EXPECT_EQ(std::get<std::vector<core::MetricKey>>(result.body), std::vector<core::MetricKey>{"cpu"});
}

} // namespace
} // namespace command
} // namespace tsquery
