// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/probe/Clock.h"
#include "tickprobe/probe/StatsCollector.h"

#include <functional>
#include <optional>
#include <string>

namespace tickprobe {
namespace net {
class ITransportFactory;
}

/**
 * @brief Options for one drive_probe() invocation.
 */
struct ProbeOptions {
    enum class Role {
        Server,
        Client,
        Local    ///< Server and client on two threads of this process.
    };

    Role role{Role::Server};

    std::function<bool()> should_stop; // Cooperative cancellation callback.

    // Optional overrides; defaults are the process steady clock and a factory
    // chosen from cfg.transport.kind.
    Clock* clock = nullptr;
    net::ITransportFactory* transport_factory = nullptr;

    // Optional sinks; when unset loggers are built from the config.
    LoggerPtr server_log;
    LoggerPtr client_log;
};

/**
 * @brief Outcome of a probe run.
 */
struct ProbeSummary {
    std::optional<ServerStats> server;
    std::optional<ClientStats> client;

    bool client_aborted = false;    ///< The client hit a transport error.
    std::string client_error;
    std::string setup_error;        ///< Transport could not be created.

    bool ok() const { return setup_error.empty() && !client_aborted; }
};

std::optional<ProbeOptions::Role> parse_role(const std::string& text);
const char* to_string(ProbeOptions::Role role);

/// LoggerConfig built from the log_* fields of @p cfg.
LoggerConfig logger_config_from(const Config& cfg);

/**
 * @brief Build the transport and run the requested role(s) to completion.
 *
 * Setup failures (unknown transport kind, bind errors) are reported through
 * ProbeSummary::setup_error rather than thrown.
 */
ProbeSummary drive_probe(const Config& cfg, const ProbeOptions& opts);

} // namespace tickprobe
