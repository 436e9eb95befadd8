/*
 * yaml_json.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML to JSON conversion for configuration files

**************************************************/

#ifndef MICROLAB_CONFIG_YAML_JSON_HPP
#define MICROLAB_CONFIG_YAML_JSON_HPP

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "atom/type/json.hpp"

namespace fs = std::filesystem;

namespace microlab::config {

using json = nlohmann::json;

/**
 * @brief Convert a YAML node to JSON.
 *
 * Plain scalars become bool, null, integer or float where they parse as one,
 * otherwise strings. Quoted scalars always stay strings.
 *
 * @throws ConfigError if nesting exceeds `maxDepth`.
 */
[[nodiscard]] auto yamlNodeToJson(const YAML::Node& node, size_t depth = 0,
                                  size_t maxDepth = 100) -> json;

/**
 * @brief Load a YAML file.
 * @throws ConfigError if the file is missing or malformed.
 */
[[nodiscard]] auto loadYamlFile(const fs::path& path) -> YAML::Node;

}  // namespace microlab::config

#endif  // MICROLAB_CONFIG_YAML_JSON_HPP
