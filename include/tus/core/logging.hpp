#pragma once

#include <string>

namespace tus::logging {

struct LoggingOptions {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

/**
 * @brief Install the "tus" stdout logger as the spdlog default
 *
 * TUS_LOG_LEVEL and TUS_LOG_PATTERN override the options when set.
 * Safe to call more than once; later calls reconfigure the same logger.
 */
void init(const LoggingOptions& options = {});

void shutdown();

} // namespace tus::logging
