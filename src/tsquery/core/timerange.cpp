#include "tsquery/core/timerange.h"
#include "tsquery/core/error.h"
#include <limits>

namespace tsquery {
namespace core {

Timerange Timerange::Snapped(int64_t start, int64_t end, int64_t resolution) {
    if (resolution <= 0) {
        throw InvalidRangeError("invalid resolution: " + std::to_string(resolution) +
                                "ms, resolution must be positive");
    }
    if (start > end) {
        throw InvalidRangeError("invalid timerange: start " + std::to_string(start) +
                                " is after end " + std::to_string(end));
    }
    // start <= end, so the unsigned difference is exact.
    uint64_t span = static_cast<uint64_t>(end) - static_cast<uint64_t>(start);
    if (span > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidRangeError("invalid timerange: span from " + std::to_string(start) + " to " +
                                std::to_string(end) + " cannot be represented");
    }
    int64_t slots = static_cast<int64_t>(span) / resolution;
    if (slots >= std::numeric_limits<int>::max()) {
        throw InvalidRangeError("invalid timerange: " + std::to_string(slots) +
                                " slots cannot be represented");
    }
    return Timerange(start, start + slots * resolution, resolution);
}

bool Timerange::Contains(int64_t timestamp) const {
    return timestamp >= start_ && timestamp <= end_ && (timestamp - start_) % resolution_ == 0;
}

std::string Timerange::ToString() const {
    return "[" + std::to_string(start_) + ", " + std::to_string(end_) + "] @ " +
           std::to_string(resolution_) + "ms";
}

} // namespace core
} // namespace tsquery
