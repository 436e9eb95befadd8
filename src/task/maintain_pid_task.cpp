/*
 * maintain_pid_task.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "maintain_pid_task.hpp"

#include <algorithm>
#include <cmath>

#include "exception/exception.hpp"

namespace microlab::task {

MaintainPidTask::MaintainPidTask(
    std::shared_ptr<hardware::MicroLabHardware> hardware, double targetTemp,
    double time)
    : Task("maintain_pid", std::move(hardware)),
      targetTemp_(targetTemp),
      time_(time) {}

auto MaintainPidTask::startWindow(double remaining) -> WaitSignal {
    double temp = hardware().getTemp();
    double output = pid_->update(temp, hardware().uptime());
    double driveTime = std::abs(output) * CONTROL_WINDOW;
    idleTime_ = CONTROL_WINDOW - driveTime;
    logger_->debug("maintain_pid: {:.2f} C, target {:.2f} C, output {:.3f}",
                   temp, targetTemp_, output);

    if (driveTime < MIN_PHASE) {
        hardware().turnHeaterOff();
        hardware().turnCoolerOff();
        phase_ = Phase::WindowStart;
        return WaitSignal::wait(std::min(CONTROL_WINDOW, remaining));
    }

    if (output > 0) {
        hardware().turnHeaterOn();
    } else {
        hardware().turnCoolerOn();
    }
    phase_ = Phase::Drive;
    return WaitSignal::wait(std::min(driveTime, remaining));
}

auto MaintainPidTask::step() -> WaitSignal {
    if (!pid_) {
        auto config = hardware().getPidConfig();
        if (!config) {
            THROW_CONFIG_ERROR(
                "maintain_pid needs a pidConfig on the temperature "
                "controller");
        }
        pid_.emplace(*config, targetTemp_);
        logger_->info(
            "Holding {:.1f} C for {:.0f} s with P={} I={} D={}", targetTemp_,
            time_, config->P, config->I, config->D);
        hardware().turnHeaterPumpOn();
    }

    const double remaining = time_ - elapsed();
    if (remaining <= 0) {
        hardware().turnHeaterOff();
        hardware().turnCoolerOff();
        hardware().turnHeaterPumpOff();
        return WaitSignal::done();
    }

    if (phase_ == Phase::Drive && idleTime_ >= MIN_PHASE) {
        hardware().turnHeaterOff();
        hardware().turnCoolerOff();
        phase_ = Phase::Idle;
        return WaitSignal::wait(std::min(idleTime_, remaining));
    }
    return startWindow(remaining);
}

}  // namespace microlab::task
