#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tsquery/command/command.h"
#include "tsquery/core/timerange.h"
#include "tsquery/function/expression.h"
#include "tsquery/function/value.h"

namespace tsquery {
namespace command {

/**
 * @brief Types each evaluated value as "series" or "scalars"
 *
 * values[i] must come from expressions[i].
 * @throws core::TypeMismatchError naming the first value that is neither
 */
std::vector<QueryResult> BuildQueryResults(const std::vector<function::ExpressionPtr>& expressions,
                                           const std::vector<function::Value>& values,
                                           const core::Timerange& timerange);

/**
 * @brief Which tag values occur across all series of the results
 *
 * Per tag key: the values of every series, naturally sorted, without duplicates.
 */
TagValues DescribeSeries(const std::vector<function::Value>& values);

/**
 * @brief Full select result: typed body plus description, notes and resolution metadata
 */
Result AssembleSelectResult(const std::vector<function::ExpressionPtr>& expressions,
                            const std::vector<function::Value>& values,
                            const core::Timerange& timerange,
                            int64_t resolution,
                            std::vector<std::string> notes);

} // namespace command
} // namespace tsquery
