/**
 * @file logging.hpp
 * @brief Process-wide logging setup for MicroLab.
 *
 * All subsystems log through named spdlog loggers sharing one set of sinks.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * microlab::logging::LogConfig config;
 * config.logDir = "logs";
 * microlab::logging::init(config);
 *
 * auto logger = microlab::logging::getLogger("hardware");
 * logger->info("Hardware initialized");
 * @endcode
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef MICROLAB_LOGGING_LOGGING_HPP
#define MICROLAB_LOGGING_LOGGING_HPP

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace microlab::logging {

/**
 * @brief Logging configuration applied by init().
 */
struct LogConfig {
    bool enableConsole{true};
    bool enableFile{true};
    std::string logDir{"logs"};
    std::string logFilename{"microlab"};
    spdlog::level::level_enum consoleLevel{spdlog::level::info};
    spdlog::level::level_enum fileLevel{spdlog::level::debug};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off").
 * @return The level, or std::nullopt if the name is unknown.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Create the shared sinks and reattach every registered logger.
 *
 * Loggers created earlier through getLogger() keep working and switch to the
 * new sinks.
 *
 * @throws ConfigError if the log file cannot be opened.
 */
void init(const LogConfig& config);

/**
 * @brief Flush and drop all loggers.
 */
void shutdown();

/**
 * @brief Get a named logger, creating it on the shared sinks if needed.
 *
 * Safe to call before init(); such loggers write to a console sink until
 * init() replaces their sinks.
 */
[[nodiscard]] auto getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace microlab::logging

#endif  // MICROLAB_LOGGING_LOGGING_HPP
