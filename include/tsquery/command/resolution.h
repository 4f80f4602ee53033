#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "tsquery/core/timerange.h"
#include "tsquery/function/expression.h"
#include "tsquery/storage/timeseries_storage.h"

namespace tsquery {
namespace function {
class Registry;
}

namespace command {

/**
 * @brief Finest resolution that keeps a re-snapped range within the slot limit
 *
 * Two slots are held back so that snapping the chosen resolution onto the
 * user's endpoints cannot overflow the budget. Limits below 3 leave no
 * margin; the divisor is clamped to 1.
 */
int64_t SmallestResolution(const core::Timerange& timerange, int slot_limit);

/**
 * @brief Asks every expression for lookback and returns the range to fetch
 *
 * Starts from the user's start; expressions may only move it earlier. Falls
 * back to the user range if the widened range cannot be snapped.
 */
core::Timerange WidenTimerange(const core::Timerange& user_range,
                               const std::vector<function::ExpressionPtr>& expressions,
                               std::shared_ptr<const function::Registry> registry);

struct NegotiatedRange {
    core::Timerange timerange;  // user's endpoints at the chosen resolution
    int64_t resolution;         // as chosen by storage, ms
};

/**
 * @brief Reconciles the slot budget with the storage backend's resolution advice
 *
 * @throws core::LimitError if the chosen range has more slots than slot_limit
 * @throws whatever the storage backend throws from ChooseResolution
 */
NegotiatedRange NegotiateTimerange(const core::Timerange& user_range,
                                   const core::Timerange& widened_range,
                                   int slot_limit,
                                   storage::TimeseriesStorageAPI& timeseries_storage);

} // namespace command
} // namespace tsquery
