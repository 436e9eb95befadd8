/*
 * yaml_json.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML to JSON conversion for configuration files

**************************************************/

#include "yaml_json.hpp"

#include <charconv>
#include <string>

#include "exception/exception.hpp"

namespace microlab::config {

namespace {

auto scalarToJson(const YAML::Node& node) -> json {
    const std::string& value = node.Scalar();

    // "!" marks a quoted scalar, which is a string whatever it contains.
    if (node.Tag() == "!") {
        return json(value);
    }

    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" || value == "on" ||
        value == "On" || value == "ON") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" || value == "off" ||
        value == "Off" || value == "OFF") {
        return json(false);
    }

    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }

    const char* begin = value.data();
    const char* end = value.data() + value.size();
    if (*begin == '+') {
        ++begin;
    }

    long long intVal = 0;
    auto [intPtr, intEc] = std::from_chars(begin, end, intVal);
    if (intEc == std::errc() && intPtr == end) {
        return json(intVal);
    }

    double floatVal = 0.0;
    auto [floatPtr, floatEc] = std::from_chars(begin, end, floatVal);
    if (floatEc == std::errc() && floatPtr == end) {
        return json(floatVal);
    }

    return json(value);
}

}  // namespace

auto yamlNodeToJson(const YAML::Node& node, size_t depth, size_t maxDepth)
    -> json {
    if (depth > maxDepth) {
        THROW_CONFIG_ERROR("Maximum nesting depth of ", maxDepth, " exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return json(nullptr);

        case YAML::NodeType::Scalar:
            return scalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1, maxDepth));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1, maxDepth);
            }
            return obj;
        }
    }
    return json(nullptr);
}

auto loadYamlFile(const fs::path& path) -> YAML::Node {
    if (!fs::exists(path)) {
        THROW_CONFIG_ERROR("Configuration file not found: ", path.string());
    }
    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_ERROR("Failed to parse ", path.string(), ": ", e.what());
    }
}

}  // namespace microlab::config
