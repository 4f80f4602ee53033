#include "tsquery/core/config.h"
#include <spdlog/common.h>

namespace tsquery {
namespace core {

Result<void> QueryConfig::Validate() const {
    if (slot_limit > 0 && slot_limit < 3) {
        return Result<void>::error("slot_limit must be at least 3, got " + std::to_string(slot_limit));
    }
    if (fetch_limit < 0) {
        return Result<void>::error("fetch_limit cannot be negative");
    }
    if (timeout.count() < 0) {
        return Result<void>::error("timeout cannot be negative");
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return Result<void>::error("unknown log_level: " + log_level);
    }
    return Result<void>();
}

} // namespace core
} // namespace tsquery
