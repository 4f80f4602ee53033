#include "tsquery/command/select.h"
#include "tsquery/command/concurrent_evaluator.h"
#include "tsquery/command/resolution.h"
#include "tsquery/command/result_assembler.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/config.h"
#include "tsquery/core/error.h"
#include "tsquery/function/registry.h"
#include <optional>

namespace tsquery {
namespace command {

namespace {

// Span on the request's profiler, if it has one.
std::optional<query::Profiler::Span> MaybeRecord(const ExecutionContext& context, const std::string& name) {
    if (!context.profiler) {
        return std::nullopt;
    }
    return context.profiler->Record(name);
}

} // namespace

SelectCommand::SelectCommand(query::PredicatePtr predicate,
                             std::vector<function::ExpressionPtr> expressions,
                             SelectContext context)
    : predicate_(std::move(predicate)), expressions_(std::move(expressions)), context_(context) {}

Result SelectCommand::Execute(const ExecutionContext& context) const {
    if (!context.timeseries_storage) {
        throw core::InternalError("execution context has no timeseries storage backend");
    }
    core::Timerange user_range = core::Timerange::Snapped(context_.start, context_.end, context_.resolution);
    int slot_limit = core::EffectiveSlotLimit(context.slot_limit);
    std::shared_ptr<const function::Registry> registry =
        context.registry ? context.registry : function::Registry::Default();

    std::optional<NegotiatedRange> negotiated;
    {
        auto span = MaybeRecord(context, "select.negotiate");
        core::Timerange widened_range = WidenTimerange(user_range, expressions_, registry);
        negotiated = NegotiateTimerange(user_range, widened_range, slot_limit, *context.timeseries_storage);
    }

    function::EvaluationContext evaluation(negotiated->timerange);
    evaluation.storage = context.timeseries_storage;
    evaluation.metadata = context.metric_metadata;
    evaluation.predicate = query::All(predicate_, context.additional_constraints);
    evaluation.sample_method = context_.sample_method;
    evaluation.fetch_limit = std::make_shared<function::FetchCounter>(context.fetch_limit);
    evaluation.notes = std::make_shared<function::EvaluationNotes>();
    evaluation.registry = registry;
    evaluation.profiler = context.profiler;
    evaluation.context = context.context;
    std::shared_ptr<function::EvaluationNotes> notes = evaluation.notes;

    std::vector<function::Value> values;
    {
        auto span = MaybeRecord(context, "select.evaluate");
        ConcurrentEvaluator evaluator(context.timeout);
        values = evaluator.Evaluate(std::move(evaluation), expressions_);
    }

    TSQUERY_DEBUG("select of {} expressions over {} produced {} values",
                  expressions_.size(), negotiated->timerange.ToString(), values.size());
    return AssembleSelectResult(expressions_, values, negotiated->timerange, negotiated->resolution, notes->All());
}

} // namespace command
} // namespace tsquery
