#include "tsquery/command/result_assembler.h"
#include "tsquery/common/natural_sort.h"
#include "tsquery/core/error.h"

namespace tsquery {
namespace command {

std::vector<QueryResult> BuildQueryResults(const std::vector<function::ExpressionPtr>& expressions,
                                           const std::vector<function::Value>& values,
                                           const core::Timerange& timerange) {
    if (expressions.size() != values.size()) {
        throw core::InternalError("evaluation produced " + std::to_string(values.size()) +
                                  " values for " + std::to_string(expressions.size()) + " expressions");
    }

    std::vector<QueryResult> body;
    body.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const auto& expression = expressions[i];

        auto list = values[i].ToSeriesList();
        if (list.ok()) {
            QueryResult result;
            result.query = expression->QueryString();
            result.name = expression->Name();
            result.type = "series";
            result.series = list.take_value().series;
            result.timerange = timerange;
            body.push_back(std::move(result));
            continue;
        }

        auto scalars = values[i].ToScalarSet();
        if (scalars.ok()) {
            QueryResult result;
            result.query = expression->QueryString();
            result.name = expression->Name();
            result.type = "scalars";
            result.scalars = scalars.take_value();
            body.push_back(std::move(result));
            continue;
        }

        throw core::TypeMismatchError(expression->QueryString());
    }
    return body;
}

TagValues DescribeSeries(const std::vector<function::Value>& values) {
    TagValues description;
    for (const auto& value : values) {
        auto list = value.ToSeriesList();
        if (!list.ok()) {
            continue;
        }
        for (const auto& series : list.value().series) {
            for (const auto& [key, tag_value] : series.tagset) {
                description[key].push_back(tag_value);
            }
        }
    }
    for (auto& entry : description) {
        std::vector<std::string>& tag_values = entry.second;
        common::NaturalSort(tag_values);
        std::vector<std::string> filtered;
        filtered.reserve(tag_values.size());
        for (size_t i = 0; i < tag_values.size(); ++i) {
            if (i == 0 || tag_values[i - 1] != tag_values[i]) {
                filtered.push_back(tag_values[i]);
            }
        }
        tag_values = std::move(filtered);
    }
    return description;
}

Result AssembleSelectResult(const std::vector<function::ExpressionPtr>& expressions,
                            const std::vector<function::Value>& values,
                            const core::Timerange& timerange,
                            int64_t resolution,
                            std::vector<std::string> notes) {
    Result result;
    result.body = BuildQueryResults(expressions, values, timerange);
    result.metadata["description"] = DescribeSeries(values);
    result.metadata["notes"] = std::move(notes);
    result.metadata["resolution"] = resolution;
    return result;
}

} // namespace command
} // namespace tsquery
