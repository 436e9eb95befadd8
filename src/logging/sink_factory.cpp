/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "exception/exception.hpp"

namespace microlab::logging {

auto SinkFactory::createSinks(const LogConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(createConsoleSink(config.consoleLevel, config.pattern));
    }
    if (config.enableFile) {
        sinks.push_back(createFileSink(config));
    }
    return sinks;
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(level);
    sink->set_pattern(pattern);
    return sink;
}

auto SinkFactory::logFilePath(const LogConfig& config)
    -> std::filesystem::path {
    return std::filesystem::path(config.logDir) /
           (config.logFilename + ".log");
}

auto SinkFactory::createFileSink(const LogConfig& config) -> spdlog::sink_ptr {
    auto path = logFilePath(config);
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), config.maxFileSize, config.maxFiles);
        sink->set_level(config.fileLevel);
        sink->set_pattern(config.pattern);
        return sink;
    } catch (const std::filesystem::filesystem_error& e) {
        THROW_CONFIG_ERROR("Cannot create log directory for ", path.string(),
                           ": ", e.what());
    } catch (const spdlog::spdlog_ex& e) {
        THROW_CONFIG_ERROR("Cannot open log file ", path.string(), ": ",
                           e.what());
    }
}

}  // namespace microlab::logging
