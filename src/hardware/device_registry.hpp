/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Registry of device backends keyed by (type, implementation)

*************************************************/

#ifndef MICROLAB_HARDWARE_DEVICE_REGISTRY_HPP
#define MICROLAB_HARDWARE_DEVICE_REGISTRY_HPP

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_descriptor.hpp"
#include "template/device.hpp"

namespace microlab::hardware {

class DeviceGraph;

/**
 * @brief Constructs one device from its descriptor. The graph holds every
 * device the descriptor depends on.
 */
using DeviceCreator = std::function<std::shared_ptr<LabDevice>(
    const DeviceDescriptor&, const DeviceGraph&)>;

class DeviceRegistry {
public:
    struct Entry {
        DeviceCreator create;
        /// Parameters whose values are ids of devices this one depends on.
        std::vector<std::string> referenceKeys;
    };

    /**
     * @brief Register (or replace) the creator for a backend.
     */
    void registerCreator(DeviceType type, const std::string& implementation,
                         DeviceCreator creator,
                         std::vector<std::string> referenceKeys = {});

    /**
     * @return The entry, or nullptr if the backend is unknown.
     */
    [[nodiscard]] auto find(DeviceType type,
                            const std::string& implementation) const
        -> const Entry*;

    [[nodiscard]] auto getImplementations(DeviceType type) const
        -> std::vector<std::string>;

    /**
     * @brief Registry with every simulated and physical backend.
     */
    [[nodiscard]] static auto withBuiltIns() -> DeviceRegistry;

private:
    static auto makeRegistryKey(DeviceType type,
                                const std::string& implementation)
        -> std::string;

    std::unordered_map<std::string, Entry> creators_;
};

/**
 * @brief Register the simulated and physical backends shipped with MicroLab.
 */
void registerBuiltInDevices(DeviceRegistry& registry);

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_DEVICE_REGISTRY_HPP
