/*
 * stir_task.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stir_task.hpp"

namespace microlab::task {

StirTask::StirTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                   double time)
    : Task("stir", std::move(hardware)), time_(time) {}

auto StirTask::step() -> WaitSignal {
    if (elapsed() >= time_) {
        hardware().turnStirrerOff();
        return WaitSignal::done();
    }
    if (!stirring_) {
        hardware().turnStirrerOn();
        stirring_ = true;
    }
    return WaitSignal::wait(POLL_INTERVAL);
}

}  // namespace microlab::task
