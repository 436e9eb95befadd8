/*
 * task_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_factory.hpp"

#include <functional>
#include <map>

#include "exception/exception.hpp"
#include "maintain_pid_task.hpp"
#include "pump_task.hpp"
#include "stir_task.hpp"
#include "temperature_tasks.hpp"

namespace microlab::task {

namespace {

using HardwarePtr = std::shared_ptr<hardware::MicroLabHardware>;
using TaskCreator =
    std::function<std::unique_ptr<Task>(HardwarePtr, const json&)>;

auto number(const std::string& kind, const json& params,
            const std::string& key) -> double {
    if (!params.contains(key)) {
        THROW_INVALID_TASK_PARAMETER(kind, ": missing parameter '", key, "'");
    }
    const auto& value = params.at(key);
    if (!value.is_number()) {
        THROW_INVALID_TASK_PARAMETER(kind, ": parameter '", key,
                                     "' must be a number");
    }
    return value.get<double>();
}

auto positive(const std::string& kind, const json& params,
              const std::string& key) -> double {
    double value = number(kind, params, key);
    if (!(value > 0)) {
        THROW_INVALID_TASK_PARAMETER(kind, ": parameter '", key,
                                     "' must be positive");
    }
    return value;
}

auto nonNegative(const std::string& kind, const json& params,
                 const std::string& key) -> double {
    double value = number(kind, params, key);
    if (value < 0) {
        THROW_INVALID_TASK_PARAMETER(kind, ": parameter '", key,
                                     "' must not be negative");
    }
    return value;
}

auto creators() -> const std::map<std::string, TaskCreator>& {
    static const std::map<std::string, TaskCreator> table = {
        {"heat",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             return std::make_unique<HeatTask>(std::move(hw),
                                               number("heat", p, "temp"));
         }},
        {"cool",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             return std::make_unique<CoolTask>(std::move(hw),
                                               number("cool", p, "temp"));
         }},
        {"maintain_heat",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             const std::string kind = "maintain_heat";
             return std::make_unique<MaintainHeatTask>(
                 std::move(hw), number(kind, p, "temp"),
                 nonNegative(kind, p, "tolerance"),
                 nonNegative(kind, p, "time"));
         }},
        {"maintain_cool",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             const std::string kind = "maintain_cool";
             return std::make_unique<MaintainCoolTask>(
                 std::move(hw), number(kind, p, "temp"),
                 nonNegative(kind, p, "tolerance"),
                 nonNegative(kind, p, "time"));
         }},
        {"maintain_pid",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             const std::string kind = "maintain_pid";
             // The PID loop has no band; tolerance is validated, then unused.
             (void)nonNegative(kind, p, "tolerance");
             return std::make_unique<MaintainPidTask>(
                 std::move(hw), number(kind, p, "temp"),
                 nonNegative(kind, p, "time"));
         }},
        {"stir",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             return std::make_unique<StirTask>(
                 std::move(hw), nonNegative("stir", p, "time"));
         }},
        {"pump",
         [](HardwarePtr hw, const json& p) -> std::unique_ptr<Task> {
             if (!p.contains("pump") || !p.at("pump").is_string()) {
                 THROW_INVALID_TASK_PARAMETER(
                     "pump: parameter 'pump' must be a pump id");
             }
             std::optional<double> time;
             if (p.contains("time") && !p.at("time").is_null()) {
                 time = positive("pump", p, "time");
             }
             return std::make_unique<PumpTask>(
                 std::move(hw), p.at("pump").get<std::string>(),
                 positive("pump", p, "volume"), time);
         }},
    };
    return table;
}

}  // namespace

auto makeTask(const std::string& kind, HardwarePtr hw, const json& params)
    -> std::unique_ptr<Task> {
    auto it = creators().find(kind);
    if (it == creators().end()) {
        THROW_INVALID_TASK_PARAMETER("Unknown task kind '", kind, "'");
    }
    if (!params.is_object()) {
        THROW_INVALID_TASK_PARAMETER(kind, ": parameters must be an object");
    }
    return it->second(std::move(hw), params);
}

auto getTaskKinds() -> std::vector<std::string> {
    std::vector<std::string> kinds;
    for (const auto& [kind, creator] : creators()) {
        kinds.push_back(kind);
    }
    return kinds;
}

}  // namespace microlab::task
