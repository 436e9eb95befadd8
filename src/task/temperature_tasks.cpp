/*
 * temperature_tasks.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "temperature_tasks.hpp"

namespace microlab::task {

HeatTask::HeatTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                   double targetTemp)
    : Task("heat", std::move(hardware)), targetTemp_(targetTemp) {}

auto HeatTask::step() -> WaitSignal {
    double temp = hardware().getTemp();
    if (temp >= targetTemp_) {
        hardware().turnHeaterOff();
        logger_->info("Reached {:.1f} C (target {:.1f} C)", temp,
                      targetTemp_);
        return WaitSignal::done();
    }
    hardware().turnHeaterOn();
    return WaitSignal::wait(POLL_INTERVAL);
}

CoolTask::CoolTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                   double targetTemp)
    : Task("cool", std::move(hardware)), targetTemp_(targetTemp) {}

auto CoolTask::step() -> WaitSignal {
    double temp = hardware().getTemp();
    if (temp <= targetTemp_) {
        hardware().turnCoolerOff();
        logger_->info("Reached {:.1f} C (target {:.1f} C)", temp,
                      targetTemp_);
        return WaitSignal::done();
    }
    hardware().turnCoolerOn();
    return WaitSignal::wait(POLL_INTERVAL);
}

MaintainHeatTask::MaintainHeatTask(
    std::shared_ptr<hardware::MicroLabHardware> hardware, double targetTemp,
    double tolerance, double time)
    : Task("maintain_heat", std::move(hardware)),
      targetTemp_(targetTemp),
      tolerance_(tolerance),
      time_(time) {}

auto MaintainHeatTask::step() -> WaitSignal {
    if (elapsed() >= time_) {
        hardware().turnHeaterOff();
        hardware().turnCoolerOff();
        return WaitSignal::done();
    }
    if (hardware().getTemp() < targetTemp_ - tolerance_) {
        hardware().turnHeaterOn();
    } else {
        hardware().turnHeaterOff();
    }
    return WaitSignal::wait(POLL_INTERVAL);
}

MaintainCoolTask::MaintainCoolTask(
    std::shared_ptr<hardware::MicroLabHardware> hardware, double targetTemp,
    double tolerance, double time)
    : Task("maintain_cool", std::move(hardware)),
      targetTemp_(targetTemp),
      tolerance_(tolerance),
      time_(time) {}

auto MaintainCoolTask::step() -> WaitSignal {
    if (elapsed() >= time_) {
        hardware().turnHeaterOff();
        hardware().turnCoolerOff();
        return WaitSignal::done();
    }
    if (hardware().getTemp() > targetTemp_ + tolerance_) {
        hardware().turnCoolerOn();
    } else {
        hardware().turnCoolerOff();
    }
    return WaitSignal::wait(POLL_INTERVAL);
}

}  // namespace microlab::task
