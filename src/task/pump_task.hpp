/*
 * pump_task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Rate-limited volumetric dispensing

**************************************************/

#ifndef MICROLAB_TASK_PUMP_TASK_HPP
#define MICROLAB_TASK_PUMP_TASK_HPP

#include <optional>
#include <string>

#include "task.hpp"

namespace microlab::task {

/**
 * @brief Dispense `volume` ml on one pump, optionally spread over `time`
 * seconds.
 *
 * With no time, or a rate above the pump's maximum, the whole volume is
 * dispensed at once at full speed. A rate within the pump's range is
 * dispensed in one call targeting `time`. A rate below the pump's minimum
 * is delivered as one-second bursts at minSpeed, each followed by enough
 * idle time to keep the average rate; whatever is left after the last full
 * burst goes out in one final short dispense.
 *
 * The pump's limits are read on the first pull, which is where an unknown
 * pump is reported.
 */
class PumpTask : public Task {
public:
    static constexpr double BURST_DURATION = 1.0;

    PumpTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
             std::string pumpId, double volume,
             std::optional<double> time = std::nullopt);

protected:
    auto step() -> WaitSignal override;

private:
    enum class Mode { Pending, Single, Burst };

    auto dispenseBurst() -> WaitSignal;

    std::string pumpId_;
    double volume_;
    std::optional<double> time_;

    Mode mode_{Mode::Pending};
    bool dispensed_{false};
    double rate_{0.0};
    double minSpeed_{0.0};
    double burstVolume_{0.0};
    double interval_{0.0};
    double remaining_{0.0};
};

}  // namespace microlab::task

#endif  // MICROLAB_TASK_PUMP_TASK_HPP
