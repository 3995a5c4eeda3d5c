#pragma once

#include <optional>
#include <spdlog/common.h>
#include <string_view>

namespace STS {

struct AppConfig;

namespace Logging {

/// Map "trace".."off" (any case) to an spdlog level.
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

/**
 * @brief Install the process-wide default logger
 *
 * Colour console sink, plus a file sink when config.logFile is set.
 * Throws spdlog::spdlog_ex if the log file cannot be opened.
 */
void configure(const AppConfig& config);

} // namespace Logging
} // namespace STS
