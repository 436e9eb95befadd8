/*
 * device_descriptor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_descriptor.hpp"

#include "exception/exception.hpp"

namespace microlab::hardware {

auto deviceTypeFromString(std::string_view typeStr)
    -> std::optional<DeviceType> {
    if (typeStr == "thermometer") return DeviceType::THERMOMETER;
    if (typeStr == "tempController") return DeviceType::TEMP_CONTROLLER;
    if (typeStr == "reagentDispenser") return DeviceType::REAGENT_DISPENSER;
    if (typeStr == "stirrer") return DeviceType::STIRRER;
    if (typeStr == "grbl") return DeviceType::GRBL;
    if (typeStr == "gpiochip") return DeviceType::GPIO_CHIP;
    return std::nullopt;
}

auto deviceTypeToString(DeviceType type) -> std::string {
    switch (type) {
        case DeviceType::THERMOMETER: return "thermometer";
        case DeviceType::TEMP_CONTROLLER: return "tempController";
        case DeviceType::REAGENT_DISPENSER: return "reagentDispenser";
        case DeviceType::STIRRER: return "stirrer";
        case DeviceType::GRBL: return "grbl";
        case DeviceType::GPIO_CHIP: return "gpiochip";
    }
    return "unknown";
}

auto parseLineAliases(const DeviceDescriptor& descriptor)
    -> std::map<std::string, int> {
    std::map<std::string, int> aliases;
    if (!descriptor.params.contains("lineAliases")) {
        return aliases;
    }
    const auto& node = descriptor.params.at("lineAliases");
    if (!node.is_object()) {
        THROW_CONFIG_ERROR("Device '", descriptor.id,
                           "': lineAliases must be a map");
    }
    for (const auto& [alias, offset] : node.items()) {
        if (!offset.is_number_integer() || offset.get<int>() < 0) {
            THROW_CONFIG_ERROR("Device '", descriptor.id, "': line alias '",
                               alias, "' must map to a line number");
        }
        aliases.emplace(alias, offset.get<int>());
    }
    return aliases;
}

}  // namespace microlab::hardware
