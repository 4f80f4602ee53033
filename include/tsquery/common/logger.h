#ifndef TSQUERY_COMMON_LOGGER_H_
#define TSQUERY_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace tsquery {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace tsquery

// Macros for convenient logging
#define TSQUERY_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TSQUERY_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TSQUERY_INFO(...)  spdlog::info(__VA_ARGS__)
#define TSQUERY_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TSQUERY_ERROR(...) spdlog::error(__VA_ARGS__)
#define TSQUERY_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TSQUERY_COMMON_LOGGER_H_
