// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/cli/cli_helpers.h"
#include "tickprobe/config/Config.h"

#include <cassert>
#include <string>
#include <vector>

namespace {

tickprobe::cli::CliOptions parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return tickprobe::cli::parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

int main() {
    // Defaults: nothing given, nothing overridden.
    auto defaults = parse({"tickprobe_cli"});
    assert(defaults.config_path == "configs/tickprobe.yaml");
    assert(!defaults.config_given);
    assert(!defaults.role && !defaults.address && !defaults.duration_seconds);
    assert(!defaults.json);

    auto opts = parse({"tickprobe_cli", "-t", "CLIENT", "--ip", "10.1.2.3", "-d", "2.5",
                       "--log", "debug", "--json", "-c", "my.yaml"});
    assert(opts.role && *opts.role == "client");
    assert(opts.address && *opts.address == "10.1.2.3");
    assert(opts.duration_seconds && *opts.duration_seconds == 2.5);
    assert(opts.log_level && *opts.log_level == "debug");
    assert(opts.json);
    assert(opts.config_given && opts.config_path == "my.yaml");

    // A bare host gets the default port.
    auto normalized = tickprobe::cli::normalize_options(opts);
    assert(*normalized.address == "10.1.2.3:25570");
    opts.address = "example.org:9000";
    assert(*tickprobe::cli::normalize_options(opts).address == "example.org:9000");

    tickprobe::Config cfg;
    tickprobe::cli::apply_overrides(normalized, cfg);
    assert(cfg.probe.role == "client");
    assert(cfg.probe.address == "10.1.2.3:25570");
    assert(cfg.probe.duration_seconds == 2.5);
    assert(cfg.log_level == "debug");

    // Unset options leave the config alone.
    tickprobe::Config untouched;
    tickprobe::cli::apply_overrides(defaults, untouched);
    assert(untouched.probe.role == "server");
    assert(untouched.probe.duration_seconds == 10.0);

    assert(tickprobe::cli::to_lower("LoCaL") == "local");

    return 0;
}
