/*
 * device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_registry.hpp"

#include <algorithm>

#include "device_graph.hpp"
#include "physical/gcode_pumps.hpp"
#include "physical/gpio_chips.hpp"
#include "physical/gpio_devices.hpp"
#include "physical/serial_grbl.hpp"
#include "physical/thermometers.hpp"
#include "simulation/sim_devices.hpp"
#include "simulation/sim_reagent_dispenser.hpp"
#include "simulation/sim_temp_controller.hpp"

namespace microlab::hardware {

auto DeviceRegistry::makeRegistryKey(DeviceType type,
                                     const std::string& implementation)
    -> std::string {
    return deviceTypeToString(type) + ":" + implementation;
}

void DeviceRegistry::registerCreator(DeviceType type,
                                     const std::string& implementation,
                                     DeviceCreator creator,
                                     std::vector<std::string> referenceKeys) {
    creators_[makeRegistryKey(type, implementation)] =
        Entry{std::move(creator), std::move(referenceKeys)};
}

auto DeviceRegistry::find(DeviceType type,
                          const std::string& implementation) const
    -> const Entry* {
    auto it = creators_.find(makeRegistryKey(type, implementation));
    return it == creators_.end() ? nullptr : &it->second;
}

auto DeviceRegistry::getImplementations(DeviceType type) const
    -> std::vector<std::string> {
    const auto prefix = deviceTypeToString(type) + ":";
    std::vector<std::string> result;
    for (const auto& [key, entry] : creators_) {
        if (key.starts_with(prefix)) {
            result.push_back(key.substr(prefix.size()));
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto DeviceRegistry::withBuiltIns() -> DeviceRegistry {
    DeviceRegistry registry;
    registerBuiltInDevices(registry);
    return registry;
}

void registerBuiltInDevices(DeviceRegistry& registry) {
    // Thermometers
    registry.registerCreator(
        DeviceType::THERMOMETER, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return std::make_shared<SimulatedThermometer>(
                d.id, d.valueOr<double>("temp", 24.0));
        });
    registry.registerCreator(
        DeviceType::THERMOMETER, "w1_therm",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return W1Thermometer::fromDescriptor(d);
        });
    registry.registerCreator(
        DeviceType::THERMOMETER, "serial",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return SerialThermometer::fromDescriptor(d);
        });

    // Temperature controllers
    registry.registerCreator(
        DeviceType::TEMP_CONTROLLER, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return SimulatedTempController::fromDescriptor(d);
        });
    registry.registerCreator(
        DeviceType::TEMP_CONTROLLER, "basic",
        [](const DeviceDescriptor& d, const DeviceGraph& g) {
            return BasicTempController::fromDescriptor(d, g);
        },
        {"thermometerID", "gpioID"});

    // Stirrers
    registry.registerCreator(
        DeviceType::STIRRER, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return std::make_shared<SimulatedStirrer>(d.id);
        });
    registry.registerCreator(
        DeviceType::STIRRER, "gpio_stirrer",
        [](const DeviceDescriptor& d, const DeviceGraph& g) {
            return GpioStirrer::fromDescriptor(d, g);
        },
        {"gpioID"});

    // Reagent dispensers
    registry.registerCreator(
        DeviceType::REAGENT_DISPENSER, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return SimulatedReagentDispenser::fromDescriptor(d);
        });
    registry.registerCreator(
        DeviceType::REAGENT_DISPENSER, "syringepump",
        [](const DeviceDescriptor& d, const DeviceGraph& g) {
            return SyringePump::fromDescriptor(d, g);
        },
        {"grblID"});
    registry.registerCreator(
        DeviceType::REAGENT_DISPENSER, "peristalticpump",
        [](const DeviceDescriptor& d, const DeviceGraph& g) {
            return PeristalticPump::fromDescriptor(d, g);
        },
        {"grblID"});

    // Motion controllers
    registry.registerCreator(
        DeviceType::GRBL, "serial",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return SerialGrbl::fromDescriptor(d);
        });
    registry.registerCreator(
        DeviceType::GRBL, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return std::make_shared<SimulatedGrbl>(d.id);
        });

    // GPIO
    registry.registerCreator(
        DeviceType::GPIO_CHIP, "gpiod",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return GpiodChip::fromDescriptor(d);
        });
    registry.registerCreator(
        DeviceType::GPIO_CHIP, "gpiod_chipset",
        [](const DeviceDescriptor& d, const DeviceGraph& g) {
            return GpiodChipset::fromDescriptor(d, g);
        },
        {"defaultChipID", "additionalChips"});
    registry.registerCreator(
        DeviceType::GPIO_CHIP, "simulation",
        [](const DeviceDescriptor& d, const DeviceGraph&) {
            return std::make_shared<SimulatedGpioChip>(d.id,
                                                       parseLineAliases(d));
        });
}

}  // namespace microlab::hardware
