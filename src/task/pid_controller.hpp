/*
 * pid_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Discrete PID controller with bounded output

**************************************************/

#ifndef MICROLAB_TASK_PID_CONTROLLER_HPP
#define MICROLAB_TASK_PID_CONTROLLER_HPP

#include <optional>

#include "hardware/template/temp_controller.hpp"

namespace microlab::task {

struct PIDState {
    double integral{0.0};
    double previousError{0.0};
    double previousInput{0.0};
    std::optional<double> previousSampleTime;
};

/**
 * @brief PID over irregular sample times.
 *
 * The output is clamped to [outputMin, outputMax]. The integral is only
 * accumulated while that does not push a saturated output further and is
 * itself clamped to the output range. The first sample has no time base, so
 * it contributes only the proportional term.
 *
 * With proportionalOnMeasurement the proportional term acts on input changes
 * and is folded into the integral. With differentialOnMeasurement the
 * derivative acts on the input instead of the error, which avoids kicks on
 * setpoint changes.
 */
class PIDController {
public:
    PIDController(hardware::PIDConfig config, double setpoint,
                  double outputMin = -1.0, double outputMax = 1.0);

    /**
     * @param input Measured value.
     * @param now Sample time in seconds.
     * @return Controller output within the output limits.
     */
    auto update(double input, double now) -> double;

    [[nodiscard]] auto getState() const -> const PIDState& { return state_; }

private:
    auto clamp(double value) const -> double;

    hardware::PIDConfig config_;
    double setpoint_;
    double outputMin_;
    double outputMax_;
    double lastOutput_{0.0};
    PIDState state_;
};

}  // namespace microlab::task

#endif  // MICROLAB_TASK_PID_CONTROLLER_HPP
