// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ProbeDriver.h"
#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/probe/Report.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct Args {
    std::string config{"tickprobe.yaml"};
    std::string probe_id{"worker"};
    std::optional<std::string> role;
    std::optional<std::string> address;
    std::optional<double> duration;
    std::optional<std::string> log_level;
};

Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            a.config = argv[++i];
        } else if (arg == "--probe-id" && i + 1 < argc) {
            a.probe_id = argv[++i];
        } else if (arg == "--role" && i + 1 < argc) {
            a.role = argv[++i];
        } else if (arg == "--address" && i + 1 < argc) {
            a.address = argv[++i];
        } else if (arg == "--duration" && i + 1 < argc) {
            std::string v = argv[++i];
            char* end = nullptr;
            errno = 0;
            const double d = std::strtod(v.c_str(), &end);
            if (errno != 0 || end == v.c_str() || *end != '\0' || d < 0.0) {
                std::cout << "status=error\nerror=invalid_duration\n";
                std::exit(1);
            }
            a.duration = d;
        } else if (arg == "--log" && i + 1 < argc) {
            a.log_level = argv[++i];
        }
    }
    return a;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    auto cfg = tickprobe::Config::from_file(args.config);
    if (!cfg) {
        std::cout << "status=error\nprobe_id=" << args.probe_id << "\nerror=failed_to_load_config\n";
        return 1;
    }
    if (args.role) cfg->probe.role = *args.role;
    if (args.address) cfg->probe.address = *args.address;
    if (args.duration) cfg->probe.duration_seconds = *args.duration;
    if (args.log_level) cfg->log_level = *args.log_level;

    const auto role = tickprobe::parse_role(cfg->probe.role);
    if (!role) {
        std::cout << "status=error\nprobe_id=" << args.probe_id << "\nerror=invalid_role\n";
        return 1;
    }

    tickprobe::ProbeOptions opts;
    opts.role = *role;
    const auto summary = tickprobe::drive_probe(*cfg, opts);

    if (!summary.setup_error.empty()) {
        std::cout << "status=error\n";
        std::cout << "probe_id=" << args.probe_id << "\n";
        std::cout << "role=" << tickprobe::to_string(*role) << "\n";
        std::cout << "error=" << summary.setup_error << "\n";
        return 0;
    }

    std::cout << "status=" << (summary.client_aborted ? "aborted" : "ok") << "\n";
    std::cout << "probe_id=" << args.probe_id << "\n";
    std::cout << "role=" << tickprobe::to_string(*role) << "\n";
    if (summary.client_aborted) {
        std::cout << "error=" << summary.client_error << "\n";
    }

    nlohmann::json j;
    j["probe_id"] = args.probe_id;
    j["role"] = tickprobe::to_string(*role);
    j["status"] = summary.client_aborted ? "aborted" : "ok";

    // Single role: plain keys. Local: server keys plain, client keys prefixed.
    if (summary.server) {
        tickprobe::write_server_kv(std::cout, *summary.server);
        j["server"] = tickprobe::to_json(*summary.server);
    }
    if (summary.client) {
        tickprobe::write_client_kv(std::cout, *summary.client, summary.server ? "client_" : "");
        j["client"] = tickprobe::to_json(*summary.client);
    }
    std::cout << "json=" << j.dump() << "\n";
    return 0;
}
