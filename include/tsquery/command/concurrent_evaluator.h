#pragma once

#include <chrono>
#include <vector>

#include "tsquery/function/evaluation_context.h"
#include "tsquery/function/expression.h"
#include "tsquery/function/value.h"

namespace tsquery {
namespace command {

/**
 * @brief Evaluates expressions on a separate thread, bounded by a timeout
 *
 * The caller waits for whichever comes first: the values, an evaluation
 * error, or the request scope being done (timeout or cancellation). A
 * running evaluation cannot be interrupted; when the caller gives up, the
 * evaluation thread runs to completion and its outcome is dropped into a
 * completion slot nobody reads. The thread never blocks on that slot.
 *
 * When the timeout is non-zero a derived timeout scope is created from the
 * evaluation context's scope and released on every exit path. The
 * evaluation sees that scope, so cooperative expressions can stop early.
 */
class ConcurrentEvaluator {
public:
    explicit ConcurrentEvaluator(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    /**
     * @throws core::LimitError on timeout or cancellation
     * @throws whatever the evaluation throws, unmodified
     */
    std::vector<function::Value> Evaluate(function::EvaluationContext context,
                                          const std::vector<function::ExpressionPtr>& expressions) const;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace command
} // namespace tsquery
