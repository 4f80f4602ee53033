#pragma once

#include <chrono>
#include <string>

#include "tsquery/config.h"
#include "tsquery/core/result.h"

namespace tsquery {
namespace core {

/**
 * @brief Limits and defaults applied to every query of a process
 */
struct QueryConfig {
    int slot_limit;                       // Maximum slots per Select (<= 0 means default)
    int fetch_limit;                      // Maximum series fetches per Select
    std::chrono::milliseconds timeout;    // Evaluation timeout (0 disables it)
    std::string log_level;                // spdlog level name

    // Default constructor
    QueryConfig() : slot_limit(0), fetch_limit(0), timeout(0), log_level("info") {}

    static QueryConfig Default() {
        QueryConfig config;
        config.slot_limit = TSQUERY_DEFAULT_SLOT_LIMIT;
        config.fetch_limit = 2000;
        config.timeout = std::chrono::milliseconds(10000);  // 10 seconds
        config.log_level = "info";
        return config;
    }

    Result<void> Validate() const;
};

/**
 * @brief Slot limit with the default substituted for unset (<= 0) values
 */
inline int EffectiveSlotLimit(int slot_limit) {
    return slot_limit <= 0 ? TSQUERY_DEFAULT_SLOT_LIMIT : slot_limit;
}

} // namespace core
} // namespace tsquery
