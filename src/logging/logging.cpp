/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

#include "sink_factory.hpp"

namespace microlab::logging {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    std::string pattern{LogConfig{}.pattern};
    spdlog::level::level_enum level{spdlog::level::info};
};

auto state() -> LoggingState& {
    static LoggingState instance;
    return instance;
}

// Must be called with the state mutex held.
void ensureDefaultSinks(LoggingState& st) {
    if (st.sinks.empty()) {
        st.sinks.push_back(
            SinkFactory::createConsoleSink(spdlog::level::info, st.pattern));
    }
}

}  // namespace

auto levelFromString(const std::string& level)
    -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical" || level == "fatal") return spdlog::level::critical;
    if (level == "off" || level == "none") return spdlog::level::off;
    return std::nullopt;
}

void init(const LogConfig& config) {
    auto& st = state();
    std::lock_guard lock(st.mutex);

    st.sinks = SinkFactory::createSinks(config);
    st.pattern = config.pattern;
    // Loggers pass everything any enabled sink wants; sinks filter further.
    st.level = spdlog::level::off;
    if (config.enableConsole) {
        st.level = std::min(st.level, config.consoleLevel);
    }
    if (config.enableFile) {
        st.level = std::min(st.level, config.fileLevel);
    }

    spdlog::apply_all([&st](const std::shared_ptr<spdlog::logger>& logger) {
        logger->sinks() = st.sinks;
        logger->set_level(st.level);
    });
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown() {
    auto& st = state();
    std::lock_guard lock(st.mutex);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
    spdlog::drop_all();
    st.sinks.clear();
}

auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    auto& st = state();
    std::lock_guard lock(st.mutex);

    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    ensureDefaultSinks(st);
    auto logger =
        std::make_shared<spdlog::logger>(name, st.sinks.begin(), st.sinks.end());
    logger->set_level(st.level);
    spdlog::register_logger(logger);
    return logger;
}

}  // namespace microlab::logging
