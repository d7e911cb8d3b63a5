#pragma once

#include <spdlog/common.h>
#include <string>

namespace cgats {
namespace log {

/// Output pattern of the default logger
constexpr const char* kPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Install a colored stderr logger as the spdlog default.
 *
 * Safe to call more than once; later calls replace the logger.
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off).
 *
 * Matching is case-insensitive; "warning" is accepted for warn.
 *
 * @throws ConfigError for an unknown name
 */
spdlog::level::level_enum parseLevel(const std::string& name);

/// Change the level of the default logger
void setLevel(spdlog::level::level_enum level);

} // namespace log
} // namespace cgats
