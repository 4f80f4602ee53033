#pragma once

#include <cstdint>
#include <memory>

#include "tsquery/core/timerange.h"
#include "tsquery/core/types.h"

namespace tsquery {
namespace query {
class Profiler;
}

namespace storage {

/**
 * @brief Parameters of one series fetch
 */
struct FetchRequest {
    core::MetricKey metric;
    core::TagSet tagset;
    core::SampleMethod sample_method = core::SampleMethod::MEAN;
    core::Timerange timerange;
    std::shared_ptr<query::Profiler> profiler;  // optional
};

/**
 * @brief Interface for the backend serving raw samples
 *
 * Implementations report failures by throwing core::BackendError.
 */
class TimeseriesStorageAPI {
public:
    virtual ~TimeseriesStorageAPI() = default;

    /**
     * @brief Picks the resolution used to serve the timerange
     *
     * @param timerange Range the query will fetch, widened for lookback
     * @param smallest_resolution Finest resolution (ms) the slot budget allows
     * @return Resolution in milliseconds, >= smallest_resolution
     */
    virtual int64_t ChooseResolution(const core::Timerange& timerange, int64_t smallest_resolution) = 0;

    /**
     * @brief Fetches one series, one value per slot of request.timerange
     */
    virtual core::Timeseries FetchSingleTimeseries(const FetchRequest& request) = 0;
};

} // namespace storage
} // namespace tsquery
