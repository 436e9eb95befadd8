/*
 * device_descriptor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device descriptors read from the hardware configuration

**************************************************/

#ifndef MICROLAB_HARDWARE_DEVICE_DESCRIPTOR_HPP
#define MICROLAB_HARDWARE_DEVICE_DESCRIPTOR_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"
#include "exception/exception.hpp"

namespace microlab::hardware {

using json = nlohmann::json;

enum class DeviceType {
    THERMOMETER,
    TEMP_CONTROLLER,
    REAGENT_DISPENSER,
    STIRRER,
    GRBL,
    GPIO_CHIP
};

[[nodiscard]] auto deviceTypeFromString(std::string_view typeStr)
    -> std::optional<DeviceType>;
[[nodiscard]] auto deviceTypeToString(DeviceType type) -> std::string;

/**
 * @brief One entry of the hardware configuration.
 *
 * Everything except id, type, implementation and dependencies ends up in
 * params, untouched, for the backend to interpret.
 */
struct DeviceDescriptor {
    std::string id;
    DeviceType type{DeviceType::THERMOMETER};
    std::string implementation;
    std::vector<std::string> dependencies;
    json params = json::object();

    /**
     * @brief Read a required parameter.
     * @throws ConfigError if the key is missing or has the wrong type.
     */
    template <typename T>
    [[nodiscard]] auto require(const std::string& key) const -> T {
        if (!params.contains(key)) {
            THROW_CONFIG_ERROR("Device '", id, "': missing parameter '", key,
                               "'");
        }
        return convert<T>(key, params.at(key));
    }

    /**
     * @brief Read an optional parameter.
     * @throws ConfigError if the key is present with the wrong type.
     */
    template <typename T>
    [[nodiscard]] auto valueOr(const std::string& key, T fallback) const
        -> T {
        if (!params.contains(key) || params.at(key).is_null()) {
            return fallback;
        }
        return convert<T>(key, params.at(key));
    }

private:
    template <typename T>
    auto convert(const std::string& key, const json& value) const -> T {
        try {
            return value.get<T>();
        } catch (const json::exception& e) {
            THROW_CONFIG_ERROR("Device '", id, "': bad value for parameter '",
                               key, "': ", e.what());
        }
    }
};

/**
 * @brief Parse a descriptor's `lineAliases` map of alias name to GPIO line
 * offset. Missing means no aliases.
 * @throws ConfigError if the map or an offset is malformed.
 */
[[nodiscard]] auto parseLineAliases(const DeviceDescriptor& descriptor)
    -> std::map<std::string, int>;

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_DEVICE_DESCRIPTOR_HPP
