/*
 * microlab_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Process configuration and hardware configuration loading

**************************************************/

#ifndef MICROLAB_CONFIG_MICROLAB_CONFIG_HPP
#define MICROLAB_CONFIG_MICROLAB_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "hardware/device_descriptor.hpp"
#include "logging/logging.hpp"

namespace fs = std::filesystem;

namespace microlab::config {

/**
 * @brief Contents of microlab.yaml.
 *
 * Relative hardware paths are resolved against the directory of the file
 * they were read from.
 */
struct MicrolabConfig {
    std::optional<double> hardwareSpeedup;
    fs::path controllerHardware;
    fs::path labHardware;
    logging::LogConfig logging;
};

/**
 * @throws ConfigError on malformed values or missing required keys.
 */
[[nodiscard]] auto parseMicrolabConfig(const YAML::Node& root,
                                       const fs::path& baseDir = {})
    -> MicrolabConfig;

/**
 * @throws ConfigError if the file cannot be read or is invalid.
 */
[[nodiscard]] auto loadMicrolabConfig(const fs::path& path) -> MicrolabConfig;

/**
 * @brief Parse the `devices:` list of one hardware file.
 *
 * `id`, `type` and `implementation` are required strings, `dependencies` an
 * optional list of ids. Every other key becomes a device parameter.
 *
 * @param source Name used in error messages.
 * @throws ConfigError on any malformed entry.
 */
[[nodiscard]] auto parseDeviceDescriptors(const YAML::Node& root,
                                          const std::string& source)
    -> std::vector<hardware::DeviceDescriptor>;

/**
 * @brief Controller hardware devices followed by lab hardware devices.
 * @throws ConfigError if either file is invalid or ids collide.
 */
[[nodiscard]] auto loadHardwareDescriptors(const MicrolabConfig& config)
    -> std::vector<hardware::DeviceDescriptor>;

}  // namespace microlab::config

#endif  // MICROLAB_CONFIG_MICROLAB_CONFIG_HPP
