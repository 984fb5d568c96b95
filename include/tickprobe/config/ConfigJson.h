// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>

namespace tickprobe {

/// Convert a YAML tree to JSON, typing scalars as bool, integer, double or string.
nlohmann::json yaml_to_json(const YAML::Node& node);

/// Load a YAML config file as JSON without validating it.
std::optional<nlohmann::json> load_config_json(const std::string& path);

} // namespace tickprobe
