#include "tsquery/function/registry.h"
#include "tsquery/core/error.h"
#include <limits>

namespace tsquery {
namespace function {

namespace {

void RequireArguments(const std::string& name, const std::vector<ExpressionPtr>& arguments, size_t count) {
    if (arguments.size() != count) {
        throw core::InvalidArgumentError(name + " expects " + std::to_string(count) + " arguments, got " +
                                         std::to_string(arguments.size()));
    }
}

core::SeriesList EvaluateSeriesList(const EvaluationContext& context, const ExpressionPtr& argument) {
    auto list = argument->Evaluate(context).ToSeriesList();
    if (!list.ok()) {
        throw core::InvalidArgumentError(argument->QueryString() + ": " + list.error());
    }
    return list.take_value();
}

// Windows are only ever given as duration literals, so no evaluation is needed.
int64_t WindowMillis(const std::string& name, const ExpressionPtr& argument) {
    const auto* literal = dynamic_cast<const DurationExpression*>(argument.get());
    if (literal == nullptr) {
        throw core::InvalidArgumentError(name + " window must be a duration, got " + argument->QueryString());
    }
    if (literal->millis() <= 0) {
        throw core::InvalidArgumentError(name + " window must be positive");
    }
    return literal->millis();
}

// timestamp - lookback, clamped at the smallest representable time.
int64_t Earlier(int64_t timestamp, int64_t lookback) {
    if (timestamp < std::numeric_limits<int64_t>::min() + lookback) {
        return std::numeric_limits<int64_t>::min();
    }
    return timestamp - lookback;
}

} // namespace

void Function::Widen(WidestMode& mode, const std::vector<ExpressionPtr>& arguments) const {
    for (const auto& argument : arguments) {
        argument->Widen(mode);
    }
}

void Registry::Register(FunctionPtr function) {
    if (!function) {
        throw core::InvalidArgumentError("cannot register a null function");
    }
    std::string name = function->Name();
    if (!functions_.emplace(name, std::move(function)).second) {
        throw core::InvalidArgumentError("function already registered: " + name);
    }
}

FunctionPtr Registry::Get(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> Registry::Names() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& entry : functions_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<const Registry> Registry::Default() {
    static const std::shared_ptr<const Registry> instance = [] {
        auto registry = std::make_shared<Registry>();
        registry->Register(std::make_shared<MovingAverageFunction>());
        registry->Register(std::make_shared<SumFunction>());
        return std::shared_ptr<const Registry>(registry);
    }();
    return instance;
}

// transform.moving_average

Value MovingAverageFunction::Evaluate(const EvaluationContext& context,
                                      const std::vector<ExpressionPtr>& arguments) const {
    RequireArguments(Name(), arguments, 2);
    int64_t window = WindowMillis(Name(), arguments[1]);
    const core::Timerange& range = context.timerange;

    int64_t window_slots = window / range.Resolution();
    if (window_slots < 1) {
        context.AddNote(Name() + ": window of " + std::to_string(window) +
                        "ms is narrower than the resolution of " + std::to_string(range.Resolution()) +
                        "ms; using a single slot");
        window_slots = 1;
    }

    int64_t lookback = (window_slots - 1) * range.Resolution();
    core::Timerange extended = core::Timerange::Snapped(Earlier(range.Start(), lookback), range.End(), range.Resolution());
    core::SeriesList input = EvaluateSeriesList(context.WithTimerange(extended), arguments[0]);

    const size_t slots = static_cast<size_t>(range.Slots());
    const size_t offset = static_cast<size_t>(extended.Slots()) - slots;
    core::SeriesList output;
    output.series.reserve(input.series.size());
    for (const auto& series : input.series) {
        if (series.values.size() != static_cast<size_t>(extended.Slots())) {
            throw core::InternalError(Name() + ": series " + series.tagset.Serialize() + " has " +
                                      std::to_string(series.values.size()) + " values, expected " +
                                      std::to_string(extended.Slots()));
        }
        core::Timeseries averaged;
        averaged.tagset = series.tagset;
        averaged.values.resize(slots);
        for (size_t i = 0; i < slots; ++i) {
            double sum = 0.0;
            for (size_t j = 0; j < static_cast<size_t>(window_slots); ++j) {
                sum += series.values[offset + i - j];
            }
            averaged.values[i] = sum / static_cast<double>(window_slots);
        }
        output.series.push_back(std::move(averaged));
    }
    return output;
}

void MovingAverageFunction::Widen(WidestMode& mode, const std::vector<ExpressionPtr>& arguments) const {
    RequireArguments(Name(), arguments, 2);
    int64_t window = WindowMillis(Name(), arguments[1]);
    int64_t shifted = Earlier(mode.Current(), window);
    mode.Lower(shifted);
    WidestMode inner = mode.WithCurrent(shifted);
    arguments[0]->Widen(inner);
}

// aggregate.sum

Value SumFunction::Evaluate(const EvaluationContext& context,
                            const std::vector<ExpressionPtr>& arguments) const {
    RequireArguments(Name(), arguments, 1);
    core::SeriesList input = EvaluateSeriesList(context, arguments[0]);
    core::SeriesList output;
    if (input.series.empty()) {
        return output;
    }

    core::Timeseries total;
    total.values.assign(input.series.front().values.size(), 0.0);
    core::TagSet::TagMap common = input.series.front().tagset.tags();
    for (const auto& series : input.series) {
        if (series.values.size() != total.values.size()) {
            throw core::InternalError(Name() + ": series have mismatched lengths");
        }
        for (size_t i = 0; i < series.values.size(); ++i) {
            total.values[i] += series.values[i];
        }
        for (auto it = common.begin(); it != common.end();) {
            if (series.tagset.Get(it->first) != it->second || !series.tagset.Has(it->first)) {
                it = common.erase(it);
            } else {
                ++it;
            }
        }
    }
    total.tagset = core::TagSet(common);
    output.series.push_back(std::move(total));
    return output;
}

} // namespace function
} // namespace tsquery
