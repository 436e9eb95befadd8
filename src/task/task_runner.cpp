/*
 * task_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_runner.hpp"

#include "logging/logging.hpp"

namespace microlab::task {

auto runTask(Task& task, hardware::MicroLabHardware& hardware) -> size_t {
    auto logger = logging::getLogger("task");
    logger->info("Running step '{}'", task.getName());
    size_t waits = 0;
    try {
        while (true) {
            auto signal = task.next();
            if (signal.isDone()) {
                break;
            }
            ++waits;
            hardware.sleep(signal.duration);
        }
    } catch (const std::exception& e) {
        logger->error("Step '{}' failed, turning off all hardware: {}",
                      task.getName(), e.what());
        try {
            hardware.turnOffEverything();
        } catch (const std::exception& shutdownError) {
            logger->critical("Hardware shutdown failed: {}",
                             shutdownError.what());
        }
        throw;
    }
    logger->info("Step '{}' finished", task.getName());
    return waits;
}

}  // namespace microlab::task
