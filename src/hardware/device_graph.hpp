/*
 * device_graph.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Dependency-ordered construction of the device set

**************************************************/

#ifndef MICROLAB_HARDWARE_DEVICE_GRAPH_HPP
#define MICROLAB_HARDWARE_DEVICE_GRAPH_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_descriptor.hpp"
#include "exception/exception.hpp"
#include "template/device.hpp"

namespace microlab::hardware {

class DeviceRegistry;

/**
 * @brief The constructed devices, keyed by id.
 *
 * Devices are destroyed in reverse construction order, so a device never
 * outlives the devices it depends on.
 */
class DeviceGraph {
public:
    DeviceGraph() = default;
    ~DeviceGraph();

    DeviceGraph(const DeviceGraph&) = delete;
    DeviceGraph& operator=(const DeviceGraph&) = delete;
    DeviceGraph(DeviceGraph&& other) noexcept;
    DeviceGraph& operator=(DeviceGraph&& other) noexcept;

    /**
     * @throws ConfigError if a device with the same id already exists.
     */
    void add(std::shared_ptr<LabDevice> device);

    [[nodiscard]] bool contains(const std::string& id) const;

    /**
     * @return The device, or nullptr if no device has this id.
     */
    [[nodiscard]] auto get(const std::string& id) const
        -> std::shared_ptr<LabDevice>;

    /**
     * @brief Get a device through one of its capability interfaces.
     * @throws ConfigError if the device is missing or lacks the capability.
     */
    template <typename T>
    [[nodiscard]] auto getAs(const std::string& id) const
        -> std::shared_ptr<T> {
        auto device = get(id);
        if (!device) {
            THROW_CONFIG_ERROR("No device with id '", id, "'");
        }
        auto typed = std::dynamic_pointer_cast<T>(device);
        if (!typed) {
            THROW_CONFIG_ERROR("Device '", id, "' of type '",
                               deviceTypeToString(device->getType()),
                               "' does not provide the required capability");
        }
        return typed;
    }

    [[nodiscard]] auto constructionOrder() const
        -> const std::vector<std::string>& {
        return order_;
    }

    [[nodiscard]] auto size() const -> size_t { return order_.size(); }

    /**
     * @brief Destroy all devices, last constructed first.
     */
    void clear() noexcept;

private:
    std::unordered_map<std::string, std::shared_ptr<LabDevice>> devices_;
    std::vector<std::string> order_;
};

/**
 * @brief Builds a DeviceGraph from a flat descriptor list.
 *
 * Descriptors are ordered with Kahn's algorithm over their dependencies
 * (declared ones plus the devices their parameters reference). Ties keep
 * configuration order. Any failure aborts the whole build: devices already
 * constructed are destroyed and nothing is returned.
 */
class DeviceGraphBuilder {
public:
    explicit DeviceGraphBuilder(const DeviceRegistry& registry);

    /**
     * @brief Validate the descriptors and compute the construction order
     * without constructing anything.
     *
     * @throws ConfigError on duplicate ids, unknown implementations, missing
     * dependencies or dependency cycles.
     */
    [[nodiscard]] auto plan(const std::vector<DeviceDescriptor>& descriptors)
        const -> std::vector<const DeviceDescriptor*>;

    /**
     * @brief Construct every device in dependency order.
     * @throws ConfigError on any validation or construction failure.
     */
    [[nodiscard]] auto build(const std::vector<DeviceDescriptor>& descriptors)
        const -> DeviceGraph;

    /**
     * @brief All dependencies of a descriptor, declared and referenced.
     */
    [[nodiscard]] auto resolveDependencies(
        const DeviceDescriptor& descriptor) const -> std::vector<std::string>;

private:
    const DeviceRegistry& registry_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_DEVICE_GRAPH_HPP
