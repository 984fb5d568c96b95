// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/cli/cli_helpers.h"
#include "tickprobe/app/core/ProbeDriver.h"
#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/probe/Report.h"

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

volatile sig_atomic_t g_stop_requested = 0;

void handle_signal(int sig) {
    // Runners poll the flag once per tick.
    g_stop_requested = 1;
    std::signal(sig, handle_signal);
}

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

} // namespace

int main(int argc, char** argv) {
    auto opts = tickprobe::cli::normalize_options(tickprobe::cli::parse_args(argc, argv));

    tickprobe::Config cfg;
    if (opts.config_given || std::filesystem::exists(opts.config_path)) {
        auto loaded = tickprobe::Config::from_file(opts.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << opts.config_path << '\n';
            return 1;
        }
        cfg = *loaded;
    }
    tickprobe::cli::apply_overrides(opts, cfg);

    auto log = tickprobe::make_logger(tickprobe::logger_config_from(cfg), "cli");

    const auto role = tickprobe::parse_role(cfg.probe.role);
    if (!role) {
        TPLOG_ERROR(log, "Unknown role '%s'", cfg.probe.role.c_str());
        return 1;
    }

    install_signal_handlers();

    tickprobe::ProbeOptions probe_opts;
    probe_opts.role = *role;
    probe_opts.should_stop = []() { return g_stop_requested != 0; };

    TPLOG_DEBUG(log, "role=%s address=%s duration=%.2fs transport=%s",
                tickprobe::to_string(*role),
                cfg.probe.address.c_str(),
                cfg.probe.duration_seconds,
                cfg.transport.kind.c_str());

    const auto summary = tickprobe::drive_probe(cfg, probe_opts);
    if (!summary.setup_error.empty()) {
        TPLOG_ERROR(log, "Probe setup failed: %s", summary.setup_error.c_str());
        return 1;
    }

    nlohmann::json j;
    j["role"] = tickprobe::to_string(*role);
    if (summary.server) {
        tickprobe::write_server_report(std::cout, *summary.server);
        j["server"] = tickprobe::to_json(*summary.server);
    }
    if (summary.client) {
        tickprobe::write_client_report(std::cout, *summary.client);
        j["client"] = tickprobe::to_json(*summary.client);
    }
    if (opts.json) {
        std::cout << j.dump(2) << "\n";
    }

    if (summary.client_aborted) {
        TPLOG_ERROR(log, "Client aborted: %s", summary.client_error.c_str());
        return 2;
    }
    return 0;
}
