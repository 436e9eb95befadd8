/*
 * task_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Create control tasks by kind

**************************************************/

#ifndef MICROLAB_TASK_TASK_FACTORY_HPP
#define MICROLAB_TASK_TASK_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>

#include "atom/type/json.hpp"
#include "task.hpp"

namespace microlab::task {

using json = nlohmann::json;

/**
 * @brief Create a task for one recipe step.
 *
 * | kind          | parameters                  |
 * |---------------|-----------------------------|
 * | heat, cool    | temp                        |
 * | maintain_heat, maintain_cool, maintain_pid | temp, tolerance, time |
 * | stir          | time                        |
 * | pump          | pump, volume, optional time |
 *
 * @throws InvalidTaskParameterError for an unknown kind or a missing or
 * malformed parameter.
 */
[[nodiscard]] auto makeTask(const std::string& kind,
                            std::shared_ptr<hardware::MicroLabHardware> hw,
                            const json& params) -> std::unique_ptr<Task>;

/**
 * @brief Every kind makeTask() accepts.
 */
[[nodiscard]] auto getTaskKinds() -> std::vector<std::string>;

}  // namespace microlab::task

#endif  // MICROLAB_TASK_TASK_FACTORY_HPP
