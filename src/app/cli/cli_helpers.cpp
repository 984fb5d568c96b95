// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/cli/cli_helpers.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

namespace tickprobe::cli {

std::string to_lower(std::string value) {
    for (auto& ch : value) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return value;
}

namespace {

constexpr const char* kDefaultPort = "25570";

bool parse_seconds(const std::string& text, double& out) {
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v < 0.0) {
        return false;
    }
    out = v;
    return true;
}

bool valid_level(const std::string& lvl) {
    return lvl == "trace" || lvl == "debug" || lvl == "info" || lvl == "warn" || lvl == "error";
}

} // namespace

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
            opts.config_given = true;
        } else if ((arg == "--role" || arg == "-t") && i + 1 < argc) {
            std::string role = to_lower(argv[++i]);
            if (role != "server" && role != "client" && role != "local") {
                std::cerr << "Invalid --role value: " << role << " (use server|client|local)\n";
                std::exit(1);
            }
            opts.role = role;
        } else if ((arg == "--address" || arg == "--ip" || arg == "-i") && i + 1 < argc) {
            opts.address = argv[++i];
        } else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
            std::string value = argv[++i];
            double seconds = 0.0;
            if (!parse_seconds(value, seconds)) {
                std::cerr << "Invalid duration: " << value << '\n';
                std::exit(1);
            }
            opts.duration_seconds = seconds;
        } else if (arg == "--log" && i + 1 < argc) {
            std::string lvl = to_lower(argv[++i]);
            if (!valid_level(lvl)) {
                std::cerr << "Invalid --log value: " << lvl << " (use trace|debug|info|warn|error)\n";
                std::exit(1);
            }
            opts.log_level = lvl;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: tickprobe_cli [options]\n"
                      << "  -c, --config <path>          Configuration file (default configs/tickprobe.yaml)\n"
                      << "  -t, --role <server|client|local>  Role to run (default from config, server)\n"
                      << "  -i, --address <host:port>    Server address (default 127.0.0.1:25570)\n"
                      << "  -d, --duration <seconds>     Measurement duration once connected (default 10)\n"
                      << "  --log <level>                trace|debug|info|warn|error\n"
                      << "  --json                       Also print the JSON summary\n"
                      << "\nThe server waits for a client before the run can end.\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << '\n';
            std::exit(1);
        }
    }

    return opts;
}

CliOptions normalize_options(CliOptions opts) {
    if (opts.address && opts.address->find(':') == std::string::npos) {
        *opts.address += ":";
        *opts.address += kDefaultPort;
    }
    if (opts.role) {
        opts.role = to_lower(*opts.role);
    }
    return opts;
}

void apply_overrides(const CliOptions& opts, Config& cfg) {
    if (opts.role) cfg.probe.role = *opts.role;
    if (opts.address) cfg.probe.address = *opts.address;
    if (opts.duration_seconds) cfg.probe.duration_seconds = *opts.duration_seconds;
    if (opts.log_level) cfg.log_level = *opts.log_level;
}

} // namespace tickprobe::cli
