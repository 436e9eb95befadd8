/*
 * task_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Run one task to completion

**************************************************/

#ifndef MICROLAB_TASK_TASK_RUNNER_HPP
#define MICROLAB_TASK_TASK_RUNNER_HPP

#include <cstddef>

#include "task.hpp"

namespace microlab::task {

/**
 * @brief Pull `task` until Done, sleeping each wait through the hardware's
 * scaled clock.
 *
 * If the task throws, all hardware is switched off and the error is
 * rethrown.
 *
 * @return The number of waits the task yielded.
 */
auto runTask(Task& task, hardware::MicroLabHardware& hardware) -> size_t;

}  // namespace microlab::task

#endif  // MICROLAB_TASK_TASK_RUNNER_HPP
