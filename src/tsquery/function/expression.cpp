#include "tsquery/function/expression.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/error.h"
#include "tsquery/function/registry.h"
#include <sstream>

namespace tsquery {
namespace function {

WidestMode::WidestMode(std::shared_ptr<const Registry> registry, int64_t current, int64_t resolution)
    : WidestMode(std::move(registry), current, resolution, std::make_shared<Cell>()) {
    cell_->earliest = current;
}

WidestMode::WidestMode(std::shared_ptr<const Registry> registry, int64_t current, int64_t resolution,
                       std::shared_ptr<Cell> cell)
    : registry_(std::move(registry)), current_(current), resolution_(resolution), cell_(std::move(cell)) {}

void WidestMode::Lower(int64_t candidate) {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    if (candidate < cell_->earliest) {
        cell_->earliest = candidate;
    }
}

int64_t WidestMode::Earliest() const {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    return cell_->earliest;
}

WidestMode WidestMode::WithCurrent(int64_t current) const {
    return WidestMode(registry_, current, resolution_, cell_);
}

std::vector<Value> EvaluateMany(const EvaluationContext& context,
                                const std::vector<ExpressionPtr>& expressions) {
    std::vector<Value> values;
    values.reserve(expressions.size());
    for (const auto& expression : expressions) {
        context.CheckCancelled();
        values.push_back(expression->Evaluate(context));
    }
    return values;
}

// MetricFetchExpression

MetricFetchExpression::MetricFetchExpression(core::MetricKey metric, query::PredicatePtr predicate)
    : metric_(std::move(metric)), predicate_(std::move(predicate)) {}

Value MetricFetchExpression::Evaluate(const EvaluationContext& context) const {
    if (!context.metadata || !context.storage) {
        throw core::InternalError("evaluation context is missing its backends");
    }
    metadata::MetadataContext metadata_context{context.profiler};
    std::vector<core::TagSet> tagsets = context.metadata->GetAllTags(metric_, metadata_context);

    query::PredicatePtr filter = query::All(predicate_, context.predicate);
    std::vector<core::TagSet> matched;
    for (const auto& tagset : tagsets) {
        if (!filter || filter->Apply(tagset)) {
            matched.push_back(tagset);
        }
    }

    if (context.fetch_limit) {
        context.fetch_limit->Consume(static_cast<int>(matched.size()));
    }
    TSQUERY_DEBUG("fetching {} series of {} over {}", matched.size(), metric_, context.timerange.ToString());

    core::SeriesList list;
    list.series.reserve(matched.size());
    for (const auto& tagset : matched) {
        context.CheckCancelled();
        storage::FetchRequest request{metric_, tagset, context.sample_method, context.timerange, context.profiler};
        list.series.push_back(context.storage->FetchSingleTimeseries(request));
    }
    return list;
}

std::string MetricFetchExpression::QueryString() const {
    if (!predicate_) {
        return metric_;
    }
    return metric_ + "[" + predicate_->Query() + "]";
}

// Literals

Value ScalarExpression::Evaluate(const EvaluationContext&) const {
    return value_;
}

std::string ScalarExpression::QueryString() const {
    std::ostringstream oss;
    oss << value_;
    return oss.str();
}

Value StringExpression::Evaluate(const EvaluationContext&) const {
    return text_;
}

std::string StringExpression::QueryString() const {
    return "\"" + text_ + "\"";
}

Value DurationExpression::Evaluate(const EvaluationContext&) const {
    return Duration{millis_};
}

// FunctionExpression

FunctionExpression::FunctionExpression(std::string function_name, std::vector<ExpressionPtr> arguments)
    : function_name_(std::move(function_name)), arguments_(std::move(arguments)) {}

Value FunctionExpression::Evaluate(const EvaluationContext& context) const {
    std::shared_ptr<const Registry> registry = context.registry ? context.registry : Registry::Default();
    FunctionPtr function = registry->Get(function_name_);
    if (!function) {
        throw core::InvalidArgumentError("unknown function: " + function_name_);
    }
    return function->Evaluate(context, arguments_);
}

std::string FunctionExpression::QueryString() const {
    std::ostringstream oss;
    oss << function_name_ << "(";
    for (size_t i = 0; i < arguments_.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << arguments_[i]->QueryString();
    }
    oss << ")";
    return oss.str();
}

void FunctionExpression::Widen(WidestMode& mode) const {
    std::shared_ptr<const Registry> registry = mode.registry() ? mode.registry() : Registry::Default();
    FunctionPtr function = registry->Get(function_name_);
    if (!function) {
        // Unknown functions fail at evaluation; they have no lookback to declare.
        for (const auto& argument : arguments_) {
            argument->Widen(mode);
        }
        return;
    }
    function->Widen(mode, arguments_);
}

} // namespace function
} // namespace tsquery
