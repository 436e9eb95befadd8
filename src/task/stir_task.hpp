/*
 * stir_task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Stir for a fixed duration

**************************************************/

#ifndef MICROLAB_TASK_STIR_TASK_HPP
#define MICROLAB_TASK_STIR_TASK_HPP

#include "task.hpp"

namespace microlab::task {

class StirTask : public Task {
public:
    StirTask(std::shared_ptr<hardware::MicroLabHardware> hardware,
             double time);

protected:
    auto step() -> WaitSignal override;

private:
    double time_;
    bool stirring_{false};
};

}  // namespace microlab::task

#endif  // MICROLAB_TASK_STIR_TASK_HPP
