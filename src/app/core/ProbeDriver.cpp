// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ProbeDriver.h"

#include "tickprobe/app/core/ClientRunner.h"
#include "tickprobe/app/core/ServerRunner.h"
#include "tickprobe/net/TransportFactory.h"

#include <atomic>
#include <cctype>
#include <memory>
#include <system_error>
#include <thread>

namespace tickprobe {
namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

LoggerPtr role_logger(const LoggerPtr& given, const Config& cfg, const char* tag) {
    if (given) return given;
    return make_logger(logger_config_from(cfg), tag);
}

void run_client_into(ProbeSummary& summary, app::ClientRunner& runner) {
    auto stats = runner.run();
    if (stats) {
        summary.client = std::move(stats);
    } else {
        summary.client_aborted = true;
        summary.client_error = runner.abort_reason();
    }
}

} // namespace

std::optional<ProbeOptions::Role> parse_role(const std::string& text) {
    const auto r = lower(text);
    if (r == "server") return ProbeOptions::Role::Server;
    if (r == "client") return ProbeOptions::Role::Client;
    if (r == "local") return ProbeOptions::Role::Local;
    return std::nullopt;
}

const char* to_string(ProbeOptions::Role role) {
    switch (role) {
    case ProbeOptions::Role::Server: return "server";
    case ProbeOptions::Role::Client: return "client";
    case ProbeOptions::Role::Local: return "local";
    }
    return "unknown";
}

LoggerConfig logger_config_from(const Config& cfg) {
    LoggerConfig lc;
    lc.level = parse_log_level(cfg.log_level);
    lc.mode = parse_log_mode(cfg.log_mode);
    lc.file_path = cfg.log_file;
    return lc;
}

ProbeSummary drive_probe(const Config& cfg, const ProbeOptions& opts) {
    ProbeSummary summary;
    Clock& clock = opts.clock ? *opts.clock : steady_clock();

    std::unique_ptr<net::ITransportFactory> owned_factory;
    net::ITransportFactory* factory = opts.transport_factory;
    if (!factory) {
        owned_factory = net::make_transport_factory(cfg);
        factory = owned_factory.get();
    }
    if (!factory) {
        summary.setup_error = "unknown transport kind: " + cfg.transport.kind;
        return summary;
    }

    const bool want_server = opts.role != ProbeOptions::Role::Client;
    const bool want_client = opts.role != ProbeOptions::Role::Server;
    LoggerPtr server_log = want_server ? role_logger(opts.server_log, cfg, "server") : nullptr;
    LoggerPtr client_log = want_client ? role_logger(opts.client_log, cfg, "client") : nullptr;

    // The server must be listening before the client starts its handshake.
    net::ServerTransportPtr server_transport;
    net::ClientTransportPtr client_transport;
    try {
        if (want_server) server_transport = factory->create_server(cfg, clock, server_log);
        if (want_client) client_transport = factory->create_client(cfg, clock, client_log);
    } catch (const std::system_error& ex) {
        summary.setup_error = ex.what();
        TPLOG_ERROR(want_server ? server_log : client_log, "Transport setup failed: %s", ex.what());
        return summary;
    }

    switch (opts.role) {
    case ProbeOptions::Role::Server: {
        app::ServerRunner runner(cfg, *server_transport, clock, server_log);
        runner.set_should_stop(opts.should_stop);
        summary.server = runner.run();
        break;
    }
    case ProbeOptions::Role::Client: {
        app::ClientRunner runner(cfg, *client_transport, clock, client_log);
        runner.set_should_stop(opts.should_stop);
        run_client_into(summary, runner);
        break;
    }
    case ProbeOptions::Role::Local: {
        // An aborted client would leave the server waiting for a peer forever.
        std::atomic<bool> client_aborted{false};
        app::ServerRunner server(cfg, *server_transport, clock, server_log);
        app::ClientRunner client(cfg, *client_transport, clock, client_log);
        server.set_should_stop([&]() {
            return client_aborted.load() || (opts.should_stop && opts.should_stop());
        });
        client.set_should_stop(opts.should_stop);

        std::thread server_thread([&]() { summary.server = server.run(); });
        run_client_into(summary, client);
        client_aborted = summary.client_aborted;
        server_thread.join();
        break;
    }
    }
    return summary;
}

} // namespace tickprobe
