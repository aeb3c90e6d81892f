#include "tus/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace tus::logging {
namespace {

constexpr const char* kLoggerName = "tus";

std::string resolve_level(const LoggingOptions& options) {
    if (const char* level = std::getenv("TUS_LOG_LEVEL")) {
        return level;
    }
    return options.level.empty() ? std::string("info") : options.level;
}

std::string resolve_pattern(const LoggingOptions& options) {
    if (const char* pattern = std::getenv("TUS_LOG_PATTERN")) {
        return pattern;
    }
    return options.pattern.empty() ? std::string("[%H:%M:%S] [%^%l%$] %v") : options.pattern;
}

} // namespace

void init(const LoggingOptions& options) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(resolve_pattern(options));
    logger->set_level(spdlog::level::from_str(resolve_level(options)));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace tus::logging
