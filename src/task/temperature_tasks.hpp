/*
 * temperature_tasks.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Heat, cool and hold-within-band tasks

**************************************************/

#ifndef MICROLAB_TASK_TEMPERATURE_TASKS_HPP
#define MICROLAB_TASK_TEMPERATURE_TASKS_HPP

#include "task.hpp"

namespace microlab::task {

/**
 * @brief Heat until the jacket reaches `targetTemp`.
 *
 * Already warm enough means the heater is switched off and the first pull
 * yields Done.
 */
class HeatTask : public Task {
public:
    HeatTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
             double targetTemp);

protected:
    auto step() -> WaitSignal override;

private:
    double targetTemp_;
};

/**
 * @brief Cool until the jacket reaches `targetTemp`.
 */
class CoolTask : public Task {
public:
    CoolTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
             double targetTemp);

protected:
    auto step() -> WaitSignal override;

private:
    double targetTemp_;
};

/**
 * @brief Keep the temperature from falling below `targetTemp - tolerance`
 * for `time` seconds, using the heater.
 */
class MaintainHeatTask : public Task {
public:
    MaintainHeatTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                     double targetTemp, double tolerance, double time);

protected:
    auto step() -> WaitSignal override;

private:
    double targetTemp_;
    double tolerance_;
    double time_;
};

/**
 * @brief Keep the temperature from rising above `targetTemp + tolerance`
 * for `time` seconds, using the cooler.
 */
class MaintainCoolTask : public Task {
public:
    MaintainCoolTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
                     double targetTemp, double tolerance, double time);

protected:
    auto step() -> WaitSignal override;

private:
    double targetTemp_;
    double tolerance_;
    double time_;
};

}  // namespace microlab::task

#endif  // MICROLAB_TASK_TEMPERATURE_TASKS_HPP
