/*
 * task.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task.hpp"

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace microlab::task {

Task::Task(std::string name,
           std::shared_ptr<hardware::MicroLabHardware> hardware)
    : logger_(logging::getLogger("task")),
      name_(std::move(name)),
      hardware_(std::move(hardware)) {
    if (!hardware_) {
        THROW_INVALID_TASK_PARAMETER("Task '", name_, "' has no hardware");
    }
}

auto Task::next() -> WaitSignal {
    if (state_ == TaskState::Completed || state_ == TaskState::Exhausted) {
        state_ = TaskState::Exhausted;
        THROW_EXHAUSTED_TASK_ERROR("Task '", name_,
                                   "' was pulled after it finished");
    }
    if (state_ == TaskState::Created) {
        startTime_ = hardware_->uptime();
        state_ = TaskState::Active;
        logger_->debug("{}: started at {:.2f}", name_, startTime_);
    }

    WaitSignal signal;
    try {
        signal = step();
    } catch (const std::exception& e) {
        state_ = TaskState::Exhausted;
        logger_->error("{}: failed: {}", name_, e.what());
        throw;
    }

    if (signal.isDone()) {
        state_ = TaskState::Completed;
        logger_->debug("{}: done after {:.2f} s", name_, elapsed());
    }
    return signal;
}

auto Task::elapsed() const -> double {
    return hardware_->uptime() - startTime_;
}

}  // namespace microlab::task
