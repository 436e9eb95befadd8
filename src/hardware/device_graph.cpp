/*
 * device_graph.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Dependency-ordered construction of the device set

**************************************************/

#include "device_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_set>

#include "device_registry.hpp"
#include "logging/logging.hpp"

namespace microlab::hardware {

DeviceGraph::~DeviceGraph() { clear(); }

DeviceGraph::DeviceGraph(DeviceGraph&& other) noexcept
    : devices_(std::move(other.devices_)), order_(std::move(other.order_)) {
    other.devices_.clear();
    other.order_.clear();
}

DeviceGraph& DeviceGraph::operator=(DeviceGraph&& other) noexcept {
    if (this != &other) {
        clear();
        devices_ = std::move(other.devices_);
        order_ = std::move(other.order_);
        other.devices_.clear();
        other.order_.clear();
    }
    return *this;
}

void DeviceGraph::add(std::shared_ptr<LabDevice> device) {
    const auto& id = device->getId();
    if (devices_.contains(id)) {
        THROW_CONFIG_ERROR("Duplicate device id '", id, "'");
    }
    order_.push_back(id);
    devices_.emplace(id, std::move(device));
}

bool DeviceGraph::contains(const std::string& id) const {
    return devices_.contains(id);
}

auto DeviceGraph::get(const std::string& id) const
    -> std::shared_ptr<LabDevice> {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : it->second;
}

void DeviceGraph::clear() noexcept {
    // Dependents first.
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        devices_.erase(*it);
    }
    devices_.clear();
    order_.clear();
}

DeviceGraphBuilder::DeviceGraphBuilder(const DeviceRegistry& registry)
    : registry_(registry) {}

auto DeviceGraphBuilder::resolveDependencies(
    const DeviceDescriptor& descriptor) const -> std::vector<std::string> {
    std::vector<std::string> deps = descriptor.dependencies;
    auto addDep = [&deps](const std::string& dep) {
        if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
            deps.push_back(dep);
        }
    };

    const auto* entry =
        registry_.find(descriptor.type, descriptor.implementation);
    if (entry == nullptr) {
        return deps;
    }
    for (const auto& key : entry->referenceKeys) {
        if (!descriptor.params.contains(key)) {
            continue;
        }
        const auto& value = descriptor.params.at(key);
        if (value.is_string()) {
            addDep(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& item : value) {
                if (!item.is_string()) {
                    THROW_CONFIG_ERROR("Device '", descriptor.id,
                                       "': parameter '", key,
                                       "' must list device ids");
                }
                addDep(item.get<std::string>());
            }
        } else if (!value.is_null()) {
            THROW_CONFIG_ERROR("Device '", descriptor.id, "': parameter '", key,
                               "' must be a device id");
        }
    }
    return deps;
}

auto DeviceGraphBuilder::plan(const std::vector<DeviceDescriptor>& descriptors)
    const -> std::vector<const DeviceDescriptor*> {
    std::unordered_map<std::string, size_t> indexById;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& desc = descriptors[i];
        if (desc.id.empty()) {
            THROW_CONFIG_ERROR("Device at position ", i, " has an empty id");
        }
        if (!indexById.emplace(desc.id, i).second) {
            THROW_CONFIG_ERROR("Duplicate device id '", desc.id, "'");
        }
    }

    std::vector<std::vector<size_t>> dependents(descriptors.size());
    std::vector<std::vector<size_t>> edges(descriptors.size());
    std::vector<size_t> inDegree(descriptors.size(), 0);

    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& desc = descriptors[i];
        if (registry_.find(desc.type, desc.implementation) == nullptr) {
            std::string known;
            for (const auto& impl : registry_.getImplementations(desc.type)) {
                known += known.empty() ? impl : ", " + impl;
            }
            THROW_CONFIG_ERROR("Device '", desc.id, "': unknown implementation '",
                               desc.implementation, "' for type '",
                               deviceTypeToString(desc.type),
                               "' (available: ", known, ")");
        }
        for (const auto& dep : resolveDependencies(desc)) {
            if (dep == desc.id) {
                THROW_CONFIG_ERROR("Device '", desc.id,
                                   "' depends on itself");
            }
            auto it = indexById.find(dep);
            if (it == indexById.end()) {
                THROW_CONFIG_ERROR("Device '", desc.id,
                                   "' depends on missing device '", dep, "'");
            }
            edges[i].push_back(it->second);
            dependents[it->second].push_back(i);
            ++inDegree[i];
        }
    }

    // Kahn's algorithm; the min-heap keeps configuration order among ready
    // devices.
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (inDegree[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<const DeviceDescriptor*> order;
    order.reserve(descriptors.size());
    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(&descriptors[current]);
        for (size_t dependent : dependents[current]) {
            if (--inDegree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (order.size() == descriptors.size()) {
        return order;
    }

    // Something is left over, so there is a cycle. Find one to report.
    std::vector<int> color(descriptors.size(), 0);
    std::vector<size_t> path;
    std::string cycle;
    std::function<bool(size_t)> visit = [&](size_t node) -> bool {
        color[node] = 1;
        path.push_back(node);
        for (size_t next : edges[node]) {
            if (color[next] == 1) {
                auto start = std::find(path.begin(), path.end(), next);
                for (auto it = start; it != path.end(); ++it) {
                    cycle += descriptors[*it].id + " -> ";
                }
                cycle += descriptors[next].id;
                return true;
            }
            if (color[next] == 0 && visit(next)) {
                return true;
            }
        }
        path.pop_back();
        color[node] = 2;
        return false;
    };
    for (size_t i = 0; i < descriptors.size() && cycle.empty(); ++i) {
        if (color[i] == 0 && inDegree[i] > 0) {
            visit(i);
        }
    }
    THROW_CONFIG_ERROR("Dependency cycle between devices: ", cycle);
}

auto DeviceGraphBuilder::build(const std::vector<DeviceDescriptor>& descriptors)
    const -> DeviceGraph {
    auto logger = logging::getLogger("device-graph");
    auto order = plan(descriptors);

    DeviceGraph graph;
    for (const auto* desc : order) {
        const auto* entry = registry_.find(desc->type, desc->implementation);
        logger->debug("Constructing device '{}' ({}/{})", desc->id,
                      deviceTypeToString(desc->type), desc->implementation);
        std::shared_ptr<LabDevice> device;
        try {
            device = entry->create(*desc, graph);
        } catch (const std::exception& e) {
            logger->error("Failed to construct device '{}': {}", desc->id,
                          e.what());
            THROW_CONFIG_ERROR("Failed to construct device '", desc->id,
                               "': ", e.what());
        }
        if (!device) {
            THROW_CONFIG_ERROR("Backend '", desc->implementation,
                               "' returned no device for '", desc->id, "'");
        }
        graph.add(std::move(device));
    }
    logger->info("Constructed {} devices", graph.size());
    return graph;
}

}  // namespace microlab::hardware
