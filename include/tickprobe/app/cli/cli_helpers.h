// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"

#include <optional>
#include <string>

namespace tickprobe::cli {

struct CliOptions {
    std::string config_path = "configs/tickprobe.yaml";
    bool config_given = false;
    std::optional<std::string> role;      // server|client|local
    std::optional<std::string> address;   // host:port
    std::optional<double> duration_seconds;
    std::optional<std::string> log_level;
    bool json = false;
};

std::string to_lower(std::string value);
CliOptions parse_args(int argc, char** argv);
CliOptions normalize_options(CliOptions opts);

/// Copy every option given on the command line over the config file values.
void apply_overrides(const CliOptions& opts, Config& cfg);

} // namespace tickprobe::cli
