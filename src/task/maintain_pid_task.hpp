/*
 * maintain_pid_task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Time-proportioning PID temperature hold

**************************************************/

#ifndef MICROLAB_TASK_MAINTAIN_PID_TASK_HPP
#define MICROLAB_TASK_MAINTAIN_PID_TASK_HPP

#include <optional>

#include "pid_controller.hpp"
#include "task.hpp"

namespace microlab::task {

/**
 * @brief Hold `targetTemp` for `time` seconds with a PID controller.
 *
 * Control runs in fixed windows. At the start of each window the temperature
 * is sampled and the PID output u in [-1, 1] is computed; the heater (u > 0)
 * or the cooler (u < 0) then runs for |u| of the window and everything is off
 * for the rest. The heater pump runs from the first pull until the task
 * ends.
 */
class MaintainPidTask : public Task {
public:
    static constexpr double CONTROL_WINDOW = 10.0;
    static constexpr double MIN_PHASE = 0.01;

    MaintainPidTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                    double targetTemp, double time);

protected:
    auto step() -> WaitSignal override;

private:
    enum class Phase { WindowStart, Drive, Idle };

    auto startWindow(double remaining) -> WaitSignal;

    double targetTemp_;
    double time_;
    std::optional<PIDController> pid_;
    Phase phase_{Phase::WindowStart};
    double idleTime_{0.0};
};

}  // namespace microlab::task

#endif  // MICROLAB_TASK_MAINTAIN_PID_TASK_HPP
