// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/config/Config.h"
#include "tickprobe/config/ConfigJson.h"

#include <yaml-cpp/yaml.h>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tickprobe {
namespace {

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, T& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

/**
 * @brief Iterate across alternative keys and copy the first match into @p target.
 */
template <typename T>
void set_if_present_any(const YAML::Node& node,
                        T& target,
                        std::initializer_list<const char*> keys) {
    if (!node) return;
    for (auto key : keys) {
        if (auto child = node[key]) {
            target = child.as<T>();
            return;
        }
    }
}

// Convert YAML scalars to JSON types with best-effort typing.
nlohmann::json yaml_scalar_to_json(const YAML::Node& node) {
    bool b{};
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i{};
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d{};
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

std::optional<nlohmann::json> load_schema(const std::string& config_path) {
    namespace fs = std::filesystem;
    fs::path schema_path = fs::path(config_path).parent_path() / "config_schema.json";
    std::ifstream in(schema_path);
    if (!in) return std::nullopt;
    try {
        nlohmann::json schema;
        in >> schema;
        return schema;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool validate_root(const YAML::Node& root, const nlohmann::json& schema, std::string& error) {
    try {
        nlohmann::json_schema::json_validator validator(
            nullptr,
            nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);
        validator.validate(yaml_to_json(root));
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

void apply_probe_config(const YAML::Node& probe, Config::ProbeConfig& cfg) {
    if (!probe) return;
    set_if_present(probe, "role", cfg.role);
    set_if_present_any(probe, cfg.address, {"address", "ip"});
    set_if_present_any(probe, cfg.duration_seconds, {"duration_seconds", "duration"});
    set_if_present(probe, "tick_rate_hz", cfg.tick_rate_hz);
    set_if_present(probe, "send_rate_hz", cfg.send_rate_hz);
    set_if_present(probe, "login", cfg.login);
    set_if_present(probe, "version", cfg.version);
    set_if_present(probe, "architecture", cfg.architecture);
    set_if_present(probe, "rendering_device", cfg.rendering_device);
}

void apply_transport_config(const YAML::Node& transport, Config::TransportConfig& cfg) {
    if (!transport) return;
    set_if_present(transport, "kind", cfg.kind);

    if (auto udp = transport["udp"]) {
        auto& u = cfg.udp;
        set_if_present(udp, "connect_timeout_seconds", u.connect_timeout_seconds);
        set_if_present(udp, "peer_timeout_seconds", u.peer_timeout_seconds);
        set_if_present(udp, "keepalive_interval_seconds", u.keepalive_interval_seconds);
        set_if_present(udp, "resend_interval_ms", u.resend_interval_ms);
        set_if_present(udp, "max_datagram_bytes", u.max_datagram_bytes);
    }

    if (auto sim = transport["simulated"]) {
        auto& s = cfg.simulated;
        set_if_present(sim, "latency_ms", s.latency_ms);
        set_if_present(sim, "jitter_ms", s.jitter_ms);
        set_if_present(sim, "loss_percent", s.loss_percent);
        set_if_present(sim, "duplicate_percent", s.duplicate_percent);
        set_if_present(sim, "duplicate_every", s.duplicate_every);
        set_if_present(sim, "seed", s.seed);
    }
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& elem : node) arr.push_back(yaml_to_json(elem));
        return arr;
    }
    case YAML::NodeType::Map: {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

std::optional<nlohmann::json> load_config_json(const std::string& path) {
    try {
        return yaml_to_json(YAML::LoadFile(path));
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

std::chrono::steady_clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

std::chrono::steady_clock::duration Config::tick_period() const {
    return seconds_to_duration(1.0 / probe.tick_rate_hz);
}

std::chrono::steady_clock::duration Config::send_interval() const {
    return seconds_to_duration(1.0 / probe.send_rate_hz);
}

std::chrono::steady_clock::duration Config::run_duration() const {
    return seconds_to_duration(probe.duration_seconds);
}

/**
 * @brief Populate a Config structure from a YAML document on disk.
 */
std::optional<Config> Config::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return std::nullopt;
    } catch (const YAML::ParserException&) {
        return std::nullopt;
    }

    Config cfg;

    auto schema = load_schema(path);
    if (!schema) {
        std::cerr << "Failed to load config schema near " << path << '\n';
        return std::nullopt;
    }

    std::string validation_error;
    if (!validate_root(root, *schema, validation_error)) {
        std::cerr << "Config validation failed: " << validation_error << '\n';
        return std::nullopt;
    }

    try {
        if (auto log = root["log"]) {
            set_if_present(log, "mode", cfg.log_mode);
            set_if_present(log, "level", cfg.log_level);
            set_if_present(log, "file", cfg.log_file);
        }
        apply_probe_config(root["probe"], cfg.probe);
        apply_transport_config(root["transport"], cfg.transport);
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }

    if (cfg.probe.tick_rate_hz <= 0.0 || cfg.probe.send_rate_hz <= 0.0) {
        return std::nullopt;
    }
    if (cfg.probe.duration_seconds < 0.0) {
        return std::nullopt;
    }

    return cfg;
}

} // namespace tickprobe
