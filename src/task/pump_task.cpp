/*
 * pump_task.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pump_task.hpp"

#include <algorithm>

namespace microlab::task {

PumpTask::PumpTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                   std::string pumpId, double volume,
                   std::optional<double> time)
    : Task("pump", std::move(hardware)),
      pumpId_(std::move(pumpId)),
      volume_(volume),
      time_(time) {}

auto PumpTask::step() -> WaitSignal {
    if (mode_ == Mode::Pending) {
        auto limits = hardware().getPumpSpeedLimits(pumpId_);
        rate_ = time_ ? volume_ / *time_ : limits.maxSpeed;
        if (!time_ || rate_ > limits.maxSpeed) {
            mode_ = Mode::Single;
            time_.reset();
        } else if (rate_ >= limits.minSpeed) {
            mode_ = Mode::Single;
        } else {
            mode_ = Mode::Burst;
            minSpeed_ = limits.minSpeed;
            burstVolume_ = minSpeed_ * BURST_DURATION;
            interval_ = minSpeed_ / rate_ - BURST_DURATION;
            remaining_ = volume_;
            logger_->info(
                "Pump {}: {} ml at {:.4f} ml/s is below the minimum of {} "
                "ml/s, dispensing in bursts every {:.2f} s",
                pumpId_, volume_, rate_, minSpeed_,
                interval_ + BURST_DURATION);
        }
    }

    if (mode_ == Mode::Burst) {
        return dispenseBurst();
    }

    if (dispensed_) {
        return WaitSignal::done();
    }
    dispensed_ = true;
    double duration = hardware().pumpDispense(pumpId_, volume_, time_);
    return WaitSignal::wait(duration);
}

auto PumpTask::dispenseBurst() -> WaitSignal {
    if (remaining_ >= burstVolume_) {
        double before = hardware().uptime();
        hardware().pumpDispense(pumpId_, burstVolume_, BURST_DURATION);
        double execTime = hardware().uptime() - before;
        remaining_ -= burstVolume_;
        return WaitSignal::wait(std::max(0.0, interval_ - execTime));
    }
    if (remaining_ > 0) {
        double last = remaining_;
        remaining_ = 0;
        hardware().pumpDispense(pumpId_, last, last / minSpeed_);
        return WaitSignal::wait(last / rate_);
    }
    return WaitSignal::done();
}

}  // namespace microlab::task
