/*
 * gcode_pumps.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gcode_pumps.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include "exception/exception.hpp"
#include "hardware/device_graph.hpp"

namespace microlab::hardware {

namespace {

// grbl setting numbers are per axis: $100 steps/mm, $110 max rate.
auto axisIndex(const std::string& axis) -> int {
    if (axis == "X") return 0;
    if (axis == "Y") return 1;
    if (axis == "Z") return 2;
    if (axis == "A") return 3;
    return -1;
}

auto numberAt(const DeviceDescriptor& descriptor, const json& node,
              const std::string& key, const std::string& where) -> double {
    if (!node.contains(key) || !node.at(key).is_number()) {
        THROW_CONFIG_ERROR("Device '", descriptor.id, "': ", where,
                           " needs a numeric '", key, "'");
    }
    double value = node.at(key).get<double>();
    if (value <= 0) {
        THROW_CONFIG_ERROR("Device '", descriptor.id, "': ", where, ".", key,
                           " must be positive");
    }
    return value;
}

}  // namespace

GcodePumpDispenser::GcodePumpDispenser(std::string id,
                                       std::shared_ptr<GcodeDevice> grbl,
                                       std::map<std::string, PumpAxis> axes)
    : ReagentDispenser(std::move(id)),
      grbl_(std::move(grbl)),
      axes_(std::move(axes)) {
    if (axes_.empty()) {
        THROW_CONFIG_ERROR("Device '", id_, "': no pump axes configured");
    }
    for (const auto& [name, cfg] : axes_) {
        if (cfg.minMmPerMin <= 0 || cfg.maxMmPerMin <= cfg.minMmPerMin) {
            THROW_CONFIG_ERROR("Device '", id_, "': axis ", name,
                               " has an invalid feed range");
        }
    }
}

auto GcodePumpDispenser::makeMoveCommand(const std::string& axis, double mm,
                                         double feed) -> std::string {
    return std::format("G91 G1 {}{:.3f} F{:.3f}", axis, mm, feed);
}

auto GcodePumpDispenser::roundToResolution(double mm) -> double {
    return std::round(mm * 1000.0) / 1000.0;
}

auto GcodePumpDispenser::axis(const std::string& pumpId) const
    -> const PumpAxis& {
    auto it = axes_.find(pumpId);
    if (it == axes_.end()) {
        THROW_INVALID_PUMP_ERROR("Dispenser '", id_, "' has no pump '", pumpId,
                                 "'");
    }
    return it->second;
}

auto GcodePumpDispenser::dispense(const std::string& pumpId, double volume,
                                  std::optional<double> duration) -> double {
    const auto& cfg = axis(pumpId);
    double mm = volume * cfg.mmPerMl;
    double feed = cfg.maxMmPerMin;
    if (duration && *duration > 0) {
        feed = std::clamp(mm / (*duration / 60.0), cfg.minMmPerMin,
                          cfg.maxMmPerMin);
    }

    auto& travel = travel_[pumpId];
    double target = roundToResolution(travel.requestedMm + mm);
    double move = roundToResolution(target - travel.commandedMm);
    if (move == 0.0) {
        travel.requestedMm += mm;
        logger_->debug("Pump {}: {} ml is below the move resolution, carried "
                       "over", pumpId, volume);
        return 0.0;
    }
    logger_->info("Dispensing {} ml from pump {} ({:.3f} mm at F{:.3f})",
                  volume, pumpId, move, feed);
    grbl_->writeGcode(makeMoveCommand(pumpId, move, feed));
    travel.requestedMm += mm;
    travel.commandedMm = target;
    return move / feed * 60.0;
}

auto GcodePumpDispenser::getPumpSpeedLimits(const std::string& pumpId) const
    -> PumpSpeedLimits {
    const auto& cfg = axis(pumpId);
    return {cfg.minMmPerMin / 60.0 / cfg.mmPerMl,
            cfg.maxMmPerMin / 60.0 / cfg.mmPerMl};
}

auto GcodePumpDispenser::getPumpIds() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& [name, cfg] : axes_) {
        ids.push_back(name);
    }
    return ids;
}

SyringePump::SyringePump(std::string id, std::shared_ptr<GcodeDevice> grbl,
                         std::map<std::string, PumpAxis> axes,
                         const std::map<std::string, double>& stepsPerMm)
    : GcodePumpDispenser(std::move(id), std::move(grbl), std::move(axes)) {
    for (const auto& [name, cfg] : axes_) {
        int index = axisIndex(name);
        grbl_->writeGcode(
            std::format("$10{}={:.3f}", index, stepsPerMm.at(name)));
        grbl_->writeGcode(std::format("$11{}={:.3f}", index, cfg.maxMmPerMin));
    }
}

auto SyringePump::fromDescriptor(const DeviceDescriptor& descriptor,
                                 const DeviceGraph& graph)
    -> std::shared_ptr<SyringePump> {
    auto grbl =
        graph.getAs<GcodeDevice>(descriptor.require<std::string>("grblID"));
    auto config = descriptor.require<json>("syringePumpsConfig");
    if (!config.is_object()) {
        THROW_CONFIG_ERROR("Device '", descriptor.id,
                           "': syringePumpsConfig must be a map");
    }

    std::map<std::string, PumpAxis> axes;
    std::map<std::string, double> stepsPerMm;
    for (const auto& [name, node] : config.items()) {
        if (axisIndex(name) < 0) {
            THROW_CONFIG_ERROR("Device '", descriptor.id, "': unknown axis '",
                               name, "'");
        }
        std::string where = "syringePumpsConfig." + name;
        PumpAxis cfg;
        cfg.mmPerMl = numberAt(descriptor, node, "mmPerMl", where);
        cfg.maxMmPerMin = numberAt(descriptor, node, "maxMmPerMin", where);
        if (node.contains("minMmPerMin")) {
            cfg.minMmPerMin = numberAt(descriptor, node, "minMmPerMin", where);
        }
        stepsPerMm[name] = numberAt(descriptor, node, "stepsPerRev", where) /
                           numberAt(descriptor, node, "mmPerRev", where);
        axes.emplace(name, cfg);
    }
    return std::make_shared<SyringePump>(descriptor.id, std::move(grbl),
                                         std::move(axes), stepsPerMm);
}

auto PeristalticPump::fromDescriptor(const DeviceDescriptor& descriptor,
                                     const DeviceGraph& graph)
    -> std::shared_ptr<PeristalticPump> {
    auto grbl =
        graph.getAs<GcodeDevice>(descriptor.require<std::string>("grblID"));
    auto config = descriptor.require<json>("peristalticPumpsConfig");
    if (!config.is_object()) {
        THROW_CONFIG_ERROR("Device '", descriptor.id,
                           "': peristalticPumpsConfig must be a map");
    }

    const std::string where = "peristalticPumpsConfig";
    double maxFeed = numberAt(descriptor, config, "F", where);
    double minFeed = config.contains("minF")
                         ? numberAt(descriptor, config, "minF", where)
                         : 1.0;

    std::map<std::string, PumpAxis> axes;
    for (const auto& [name, node] : config.items()) {
        if (name == "F" || name == "minF") {
            continue;
        }
        if (axisIndex(name) < 0) {
            THROW_CONFIG_ERROR("Device '", descriptor.id, "': unknown axis '",
                               name, "'");
        }
        axes.emplace(name, PumpAxis{numberAt(descriptor, node, "mmPerMl",
                                             where + "." + name),
                                    minFeed, maxFeed});
    }
    return std::make_shared<PeristalticPump>(descriptor.id, std::move(grbl),
                                             std::move(axes));
}

}  // namespace microlab::hardware
