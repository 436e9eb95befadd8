/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for the spdlog sinks shared by all MicroLab loggers

**************************************************/

#ifndef MICROLAB_LOGGING_SINK_FACTORY_HPP
#define MICROLAB_LOGGING_SINK_FACTORY_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "logging.hpp"

namespace microlab::logging {

/**
 * @brief Builds the sinks described by a LogConfig.
 *
 * The controller writes to a colored console and to a rotating file in
 * the log directory; either can be disabled.
 */
class SinkFactory {
public:
    /**
     * @brief Create every sink enabled in `config`.
     * @throws ConfigError if the log directory or file cannot be created.
     */
    [[nodiscard]] static auto createSinks(const LogConfig& config)
        -> std::vector<spdlog::sink_ptr>;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level, const std::string& pattern)
        -> spdlog::sink_ptr;

    /**
     * @brief `<logDir>/<logFilename>.log`
     */
    [[nodiscard]] static auto logFilePath(const LogConfig& config)
        -> std::filesystem::path;

private:
    static auto createFileSink(const LogConfig& config) -> spdlog::sink_ptr;
};

}  // namespace microlab::logging

#endif  // MICROLAB_LOGGING_SINK_FACTORY_HPP
