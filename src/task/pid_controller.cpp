/*
 * pid_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pid_controller.hpp"

#include <algorithm>

namespace microlab::task {

PIDController::PIDController(hardware::PIDConfig config, double setpoint,
                             double outputMin, double outputMax)
    : config_(config),
      setpoint_(setpoint),
      outputMin_(outputMin),
      outputMax_(outputMax) {}

auto PIDController::clamp(double value) const -> double {
    return std::clamp(value, outputMin_, outputMax_);
}

auto PIDController::update(double input, double now) -> double {
    const double error = setpoint_ - input;

    if (!state_.previousSampleTime) {
        state_.previousSampleTime = now;
        state_.previousError = error;
        state_.previousInput = input;
        lastOutput_ =
            config_.proportionalOnMeasurement ? 0.0 : clamp(config_.P * error);
        return lastOutput_;
    }

    const double dt = now - *state_.previousSampleTime;
    if (dt <= 0.0) {
        return lastOutput_;
    }
    const double dInput = input - state_.previousInput;

    double proportional = 0.0;
    if (config_.proportionalOnMeasurement) {
        state_.integral -= config_.P * dInput;
    } else {
        proportional = config_.P * error;
    }

    const double derivative =
        config_.differentialOnMeasurement
            ? -config_.D * dInput / dt
            : config_.D * (error - state_.previousError) / dt;

    // Conditional integration: stop winding up into a saturated output.
    const double trial = proportional + state_.integral + derivative;
    const bool satHigh = trial >= outputMax_ && error > 0.0;
    const bool satLow = trial <= outputMin_ && error < 0.0;
    if (!satHigh && !satLow) {
        state_.integral += config_.I * error * dt;
    }
    state_.integral = clamp(state_.integral);

    lastOutput_ = clamp(proportional + state_.integral + derivative);

    state_.previousError = error;
    state_.previousInput = input;
    state_.previousSampleTime = now;
    return lastOutput_;
}

}  // namespace microlab::task
