/*
 * microlab_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Process configuration and hardware configuration loading

**************************************************/

#include "microlab_config.hpp"

#include <unordered_set>

#include "exception/exception.hpp"
#include "yaml_json.hpp"

namespace microlab::config {

namespace {

const std::unordered_set<std::string> RESERVED_DEVICE_KEYS = {
    "id", "type", "implementation", "dependencies"};

auto resolvePath(const fs::path& baseDir, const std::string& value)
    -> fs::path {
    fs::path path(value);
    if (path.is_relative() && !baseDir.empty()) {
        return baseDir / path;
    }
    return path;
}

template <typename T>
auto scalarAs(const YAML::Node& node, const std::string& key) -> T {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_ERROR("Invalid value for '", key, "': ", e.what());
    }
}

auto requiredString(const YAML::Node& entry, const std::string& key,
                    const std::string& where) -> std::string {
    const auto node = entry[key];
    if (!node || !node.IsScalar()) {
        THROW_CONFIG_ERROR(where, ": '", key, "' is required");
    }
    return node.Scalar();
}

auto parseLevel(const YAML::Node& node, const std::string& key)
    -> spdlog::level::level_enum {
    auto name = scalarAs<std::string>(node, key);
    auto level = logging::levelFromString(name);
    if (!level) {
        THROW_CONFIG_ERROR("Unknown log level '", name, "' for '", key, "'");
    }
    return *level;
}

auto parseLogging(const YAML::Node& node) -> logging::LogConfig {
    logging::LogConfig cfg;
    if (!node) {
        return cfg;
    }
    if (!node.IsMap()) {
        THROW_CONFIG_ERROR("'logging' must be a map");
    }
    if (node["console"]) {
        cfg.enableConsole = scalarAs<bool>(node["console"], "logging.console");
    }
    if (node["file"]) {
        cfg.enableFile = scalarAs<bool>(node["file"], "logging.file");
    }
    if (node["logDir"]) {
        cfg.logDir = scalarAs<std::string>(node["logDir"], "logging.logDir");
    }
    if (node["logFilename"]) {
        cfg.logFilename =
            scalarAs<std::string>(node["logFilename"], "logging.logFilename");
    }
    if (node["consoleLevel"]) {
        cfg.consoleLevel = parseLevel(node["consoleLevel"], "consoleLevel");
    }
    if (node["fileLevel"]) {
        cfg.fileLevel = parseLevel(node["fileLevel"], "fileLevel");
    }
    if (node["maxFileSize"]) {
        cfg.maxFileSize =
            scalarAs<size_t>(node["maxFileSize"], "logging.maxFileSize");
    }
    if (node["maxFiles"]) {
        cfg.maxFiles = scalarAs<size_t>(node["maxFiles"], "logging.maxFiles");
    }
    if (node["pattern"]) {
        cfg.pattern =
            scalarAs<std::string>(node["pattern"], "logging.pattern");
    }
    if (cfg.maxFileSize == 0 || cfg.maxFiles == 0) {
        THROW_CONFIG_ERROR("logging.maxFileSize and logging.maxFiles must be "
                           "positive");
    }
    return cfg;
}

}  // namespace

auto parseMicrolabConfig(const YAML::Node& root, const fs::path& baseDir)
    -> MicrolabConfig {
    if (!root || !root.IsMap()) {
        THROW_CONFIG_ERROR("Configuration root must be a map");
    }

    MicrolabConfig config;
    if (const auto speedup = root["hardwareSpeedup"];
        speedup && !speedup.IsNull()) {
        double value = scalarAs<double>(speedup, "hardwareSpeedup");
        if (!(value > 0)) {
            THROW_CONFIG_ERROR("hardwareSpeedup must be positive, got ",
                               value);
        }
        config.hardwareSpeedup = value;
    }
    config.controllerHardware = resolvePath(
        baseDir, requiredString(root, "controllerHardware", "configuration"));
    config.labHardware = resolvePath(
        baseDir, requiredString(root, "labHardware", "configuration"));
    config.logging = parseLogging(root["logging"]);
    return config;
}

auto loadMicrolabConfig(const fs::path& path) -> MicrolabConfig {
    return parseMicrolabConfig(loadYamlFile(path), path.parent_path());
}

auto parseDeviceDescriptors(const YAML::Node& root, const std::string& source)
    -> std::vector<hardware::DeviceDescriptor> {
    if (!root || !root.IsMap() || !root["devices"]) {
        THROW_CONFIG_ERROR(source, ": missing 'devices' list");
    }
    const auto devices = root["devices"];
    if (devices.IsNull()) {
        return {};
    }
    if (!devices.IsSequence()) {
        THROW_CONFIG_ERROR(source, ": 'devices' must be a list");
    }

    std::vector<hardware::DeviceDescriptor> result;
    std::unordered_set<std::string> seen;
    size_t index = 0;
    for (const auto& entry : devices) {
        std::string where = source + " device #" + std::to_string(index++);
        if (!entry.IsMap()) {
            THROW_CONFIG_ERROR(where, ": must be a map");
        }

        hardware::DeviceDescriptor desc;
        desc.id = requiredString(entry, "id", where);
        where = source + " device '" + desc.id + "'";
        if (!seen.insert(desc.id).second) {
            THROW_CONFIG_ERROR(where, ": duplicate id");
        }

        auto typeName = requiredString(entry, "type", where);
        auto type = hardware::deviceTypeFromString(typeName);
        if (!type) {
            THROW_CONFIG_ERROR(where, ": unknown type '", typeName, "'");
        }
        desc.type = *type;
        desc.implementation = requiredString(entry, "implementation", where);

        if (const auto deps = entry["dependencies"]; deps && !deps.IsNull()) {
            if (!deps.IsSequence()) {
                THROW_CONFIG_ERROR(where, ": 'dependencies' must be a list");
            }
            for (const auto& dep : deps) {
                if (!dep.IsScalar()) {
                    THROW_CONFIG_ERROR(where,
                                       ": dependencies must be device ids");
                }
                desc.dependencies.push_back(dep.Scalar());
            }
        }

        for (const auto& pair : entry) {
            auto key = pair.first.as<std::string>();
            if (!RESERVED_DEVICE_KEYS.contains(key)) {
                desc.params[key] = yamlNodeToJson(pair.second);
            }
        }
        result.push_back(std::move(desc));
    }
    return result;
}

auto loadHardwareDescriptors(const MicrolabConfig& config)
    -> std::vector<hardware::DeviceDescriptor> {
    auto descriptors =
        parseDeviceDescriptors(loadYamlFile(config.controllerHardware),
                               config.controllerHardware.string());
    auto lab = parseDeviceDescriptors(loadYamlFile(config.labHardware),
                                      config.labHardware.string());

    std::unordered_set<std::string> ids;
    for (const auto& desc : descriptors) {
        ids.insert(desc.id);
    }
    for (auto& desc : lab) {
        if (ids.contains(desc.id)) {
            THROW_CONFIG_ERROR("Device id '", desc.id,
                               "' is defined in both hardware files");
        }
        descriptors.push_back(std::move(desc));
    }
    return descriptors;
}

}  // namespace microlab::config
