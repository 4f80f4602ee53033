#include "tsquery/command/resolution.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/config.h"
#include "tsquery/core/error.h"
#include "tsquery/function/registry.h"

namespace tsquery {
namespace command {

int64_t SmallestResolution(const core::Timerange& timerange, int slot_limit) {
    // ((end + res/2) - (start - res/2)) / res + 1 <= slots
    // end - start + 2 * res <= slots * res
    // res >= (end - start) / (slots - 2)
    int64_t margin = static_cast<int64_t>(slot_limit) - 2;
    if (margin < 1) {
        margin = 1;
    }
    return timerange.Duration() / margin;
}

core::Timerange WidenTimerange(const core::Timerange& user_range,
                               const std::vector<function::ExpressionPtr>& expressions,
                               std::shared_ptr<const function::Registry> registry) {
    if (!registry) {
        registry = function::Registry::Default();
    }
    function::WidestMode widening(std::move(registry), user_range.Start(), user_range.Resolution());
    for (const auto& expression : expressions) {
        expression->Widen(widening);
    }

    int64_t earliest = widening.Earliest();
    if (earliest == user_range.Start()) {
        return user_range;
    }
    try {
        return core::Timerange::Snapped(earliest, user_range.End(), user_range.Resolution());
    } catch (const core::InvalidRangeError& e) {
        TSQUERY_WARN("widened timerange is invalid, using the requested one: {}", e.what());
        return user_range;
    }
}

NegotiatedRange NegotiateTimerange(const core::Timerange& user_range,
                                   const core::Timerange& widened_range,
                                   int slot_limit,
                                   storage::TimeseriesStorageAPI& timeseries_storage) {
    slot_limit = core::EffectiveSlotLimit(slot_limit);
    int64_t smallest_resolution = SmallestResolution(widened_range, slot_limit);

    int64_t chosen_resolution = timeseries_storage.ChooseResolution(widened_range, smallest_resolution);

    // The widening only affects what is fetched; the reported range keeps the user's endpoints.
    core::Timerange chosen = core::Timerange::Snapped(user_range.Start(), user_range.End(), chosen_resolution);
    if (chosen.Slots() > slot_limit) {
        throw core::LimitError("Requested number of data points exceeds the configured limit",
                               chosen.Slots(), slot_limit);
    }
    TSQUERY_DEBUG("negotiated timerange {} (smallest resolution {}ms, widened {})",
                  chosen.ToString(), smallest_resolution, widened_range.ToString());
    return NegotiatedRange{chosen, chosen_resolution};
}

} // namespace command
} // namespace tsquery
