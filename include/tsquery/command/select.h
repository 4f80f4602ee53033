#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tsquery/command/command.h"
#include "tsquery/function/expression.h"

namespace tsquery {
namespace command {

/**
 * @brief Requested range and sampling of a select
 */
struct SelectContext {
    int64_t start = 0;       // Start of data timerange (ms)
    int64_t end = 0;         // End of data timerange (ms)
    int64_t resolution = 0;  // Resolution of data timerange (ms)
    core::SampleMethod sample_method = core::SampleMethod::MEAN;  // to use when up/downsampling
};

/**
 * @brief Evaluates expressions over the series selected by a predicate
 *
 * Execution:
 *   1. Snap the requested range.
 *   2. Let every expression widen the start for lookback.
 *   3. Negotiate the resolution with storage under the slot limit.
 *   4. Evaluate on a separate thread, bounded by the timeout.
 *   5. Type the values and attach description, notes and resolution.
 */
class SelectCommand : public Command {
public:
    SelectCommand(query::PredicatePtr predicate,
                  std::vector<function::ExpressionPtr> expressions,
                  SelectContext context);

    Result Execute(const ExecutionContext& context) const override;
    std::string Name() const override { return "select"; }

    const std::vector<function::ExpressionPtr>& expressions() const { return expressions_; }
    const SelectContext& context() const { return context_; }

private:
    query::PredicatePtr predicate_;
    std::vector<function::ExpressionPtr> expressions_;
    SelectContext context_;
};

} // namespace command
} // namespace tsquery
