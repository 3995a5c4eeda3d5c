#include "STS/Logging.hpp"
#include "STS/AppConfig.hpp"
#include "STS/Helpers.h"
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace STS::Logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    auto lowered = Helpers::toLower(Helpers::trim(name));
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return std::nullopt;
}

void configure(const AppConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile));
    }

    auto logger = std::make_shared<spdlog::logger>("sts", sinks.begin(), sinks.end());
    logger->set_level(parseLevel(config.logLevel).value_or(spdlog::level::info));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging: Level '{}', file '{}'", config.logLevel, config.logFile);
}

} // namespace STS::Logging
