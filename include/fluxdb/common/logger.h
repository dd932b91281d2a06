#ifndef FLUXDB_COMMON_LOGGER_H_
#define FLUXDB_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace fluxdb {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace fluxdb

// Macros for convenient logging
#define FLUXDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define FLUXDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FLUXDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define FLUXDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define FLUXDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define FLUXDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // FLUXDB_COMMON_LOGGER_H_
