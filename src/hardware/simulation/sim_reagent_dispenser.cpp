/*
 * sim_reagent_dispenser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sim_reagent_dispenser.hpp"

#include <algorithm>

#include "exception/exception.hpp"

namespace microlab::hardware {

SimulatedReagentDispenser::SimulatedReagentDispenser(
    std::string id, std::vector<std::string> pumps, PumpSpeedLimits limits)
    : ReagentDispenser(std::move(id)),
      pumps_(std::move(pumps)),
      limits_(limits),
      dispensed_(pumps_.size(), 0.0) {
    if (pumps_.empty()) {
        THROW_CONFIG_ERROR("Device '", id_, "': no pumps configured");
    }
    if (limits_.minSpeed < 0 || limits_.maxSpeed <= limits_.minSpeed) {
        THROW_CONFIG_ERROR("Device '", id_, "': invalid speed range [",
                           limits_.minSpeed, ", ", limits_.maxSpeed, "]");
    }
}

auto SimulatedReagentDispenser::fromDescriptor(
    const DeviceDescriptor& descriptor)
    -> std::shared_ptr<SimulatedReagentDispenser> {
    PumpSpeedLimits limits{descriptor.valueOr<double>("minSpeed", 0.1),
                           descriptor.valueOr<double>("maxSpeed", 10.0)};
    auto pumps = descriptor.valueOr<std::vector<std::string>>(
        "pumps", {"X", "Y", "Z"});
    return std::make_shared<SimulatedReagentDispenser>(
        descriptor.id, std::move(pumps), limits);
}

void SimulatedReagentDispenser::checkPump(const std::string& pumpId) const {
    if (std::find(pumps_.begin(), pumps_.end(), pumpId) == pumps_.end()) {
        THROW_INVALID_PUMP_ERROR("Dispenser '", id_, "' has no pump '", pumpId,
                                 "'");
    }
}

auto SimulatedReagentDispenser::dispense(const std::string& pumpId,
                                         double volume,
                                         std::optional<double> duration)
    -> double {
    checkPump(pumpId);
    double seconds = duration ? *duration : volume / limits_.maxSpeed;
    auto index = std::distance(
        pumps_.begin(), std::find(pumps_.begin(), pumps_.end(), pumpId));
    dispensed_[index] += volume;
    logger_->info("Dispensing {} ml from pump {} over {:.2f} s", volume,
                  pumpId, seconds);
    return seconds;
}

auto SimulatedReagentDispenser::getPumpSpeedLimits(
    const std::string& pumpId) const -> PumpSpeedLimits {
    checkPump(pumpId);
    return limits_;
}

auto SimulatedReagentDispenser::getDispensedVolume(
    const std::string& pumpId) const -> double {
    checkPump(pumpId);
    auto index = std::distance(
        pumps_.begin(), std::find(pumps_.begin(), pumps_.end(), pumpId));
    return dispensed_[index];
}

}  // namespace microlab::hardware
