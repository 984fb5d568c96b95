// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Config.h
 * @brief Configuration holder parsed from YAML.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tickprobe {

/**
 * @brief In-memory representation of the YAML configuration file.
 */
struct Config {
    /**
     * @brief Parameters of a single measurement run.
     */
    struct ProbeConfig {
        std::string role = "server";          // server|client|local
        std::string address = "127.0.0.1:25570";
        double duration_seconds = 10.0;       // Run length once a connection was seen.
        double tick_rate_hz = 64.0;           // Scheduler cadence.
        double send_rate_hz = 64.0;           // Client PlayerMove cadence.

        // Handshake payload sent by the client after AllowConnection.
        std::string login = "consistency-test";
        std::string version = "test";
        std::string architecture = "test";
        std::string rendering_device = "test";
    };

    /**
     * @brief UDP transport tuning.
     */
    struct UdpConfig {
        double connect_timeout_seconds = 5.0;    // Client gives up waiting for ACCEPT.
        double peer_timeout_seconds = 5.0;       // Silence before a peer is considered gone.
        double keepalive_interval_seconds = 0.5; // Idle keepalive cadence.
        unsigned resend_interval_ms = 100;       // Reliable-ordered resend period.
        unsigned max_datagram_bytes = 1400;      // Receive buffer / send limit.
    };

    /**
     * @brief Link conditions applied to unreliable traffic by the simulated transport.
     */
    struct SimulatedConfig {
        double latency_ms = 0.0;
        double jitter_ms = 0.0;          // +/- around latency; may reorder deliveries.
        double loss_percent = 0.0;
        double duplicate_percent = 0.0;
        unsigned duplicate_every = 0;    // Duplicate every Nth unreliable message (0 disables).
        std::uint64_t seed = 1;
    };

    struct TransportConfig {
        std::string kind = "udp";        // udp|simulated
        UdpConfig udp{};
        SimulatedConfig simulated{};
    };

    ProbeConfig probe{};
    TransportConfig transport{};

    // Logging
    std::string log_mode     = "console"; // console|file|silent
    std::string log_level    = "info";    // trace|debug|info|warn|error
    std::string log_file     = "tickprobe.log"; // Only used when mode==file.

    /// Scheduler period derived from tick_rate_hz.
    std::chrono::steady_clock::duration tick_period() const;

    /// Client send interval derived from send_rate_hz.
    std::chrono::steady_clock::duration send_interval() const;

    /// Run duration as a steady_clock duration.
    std::chrono::steady_clock::duration run_duration() const;

    /**
     * @brief Parse configuration from a YAML document validated against
     *        config_schema.json in the same directory.
     *
     * @param path File path to read.
     * @return Populated config on success, std::nullopt on failure.
     */
    static std::optional<Config> from_file(const std::string& path);
};

/// Convert a duration in seconds into a steady_clock duration.
std::chrono::steady_clock::duration seconds_to_duration(double seconds);

} // namespace tickprobe
