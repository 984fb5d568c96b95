// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file StatsCollector.h
 * @brief Raw per-run recording and the derived consistency statistics.
 *
 * Recording happens on the role loop (append-only, unsynchronised). Derivation
 * is a pure function over the finalised buffers and runs once at run end.
 */

#include "tickprobe/probe/Clock.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tickprobe {

/**
 * @brief Server-side record of one received PlayerMove.
 */
struct ServerObservation {
    Clock::time_point received_at{};
    std::uint32_t sequence = 0;
};

/**
 * @brief Client-side record of one received EntityMove echo.
 */
struct ClientObservation {
    Clock::time_point received_at{};
    std::uint32_t echoed_sequence = 0;
    float server_timestamp = 0.0f;   ///< Seconds since the server's tick start.
};

/**
 * @brief Append-only buffers owned by a role loop.
 */
template <typename Observation>
class StatsRecorder {
public:
    /// One entry per connected tick, zero included.
    void record_tick(std::size_t count) { tick_counts_.push_back(count); }

    void record(const Observation& obs) { observations_.push_back(obs); }

    const std::vector<std::size_t>& tick_counts() const { return tick_counts_; }
    const std::vector<Observation>& observations() const { return observations_; }

private:
    std::vector<std::size_t> tick_counts_;
    std::vector<Observation> observations_;
};

using ServerRecorder = StatsRecorder<ServerObservation>;
using ClientRecorder = StatsRecorder<ClientObservation>;

struct DistributionEntry {
    std::size_t messages_per_tick = 0;
    std::uint64_t ticks = 0;
    double percent = 0.0;
};

/**
 * @brief Interval between receipt instants of consecutive non-empty ticks.
 */
struct ArrivalTiming {
    double min_ms = 0.0;
    double mean_ms = 0.0;
    double max_ms = 0.0;
};

/**
 * @brief Metrics shared by both roles, computed over the per-tick counts.
 */
struct TickSummary {
    std::uint64_t total_ticks = 0;
    std::uint64_t messages_received = 0;
    std::vector<DistributionEntry> distribution;   ///< Ascending messages_per_tick.
    std::uint64_t batched_ticks = 0;               ///< Ticks with more than one message.
    double batched_percent = 0.0;
    std::uint64_t empty_ticks = 0;
    double empty_percent = 0.0;
    std::uint64_t max_batch = 0;
    std::optional<ArrivalTiming> arrival;
};

struct ServerStats {
    bool has_data = false;
    TickSummary ticks;
    std::uint64_t echoes_sent = 0;
    std::uint64_t out_of_order = 0;
    std::optional<std::uint32_t> sequence_first;   ///< First received, in receipt order.
    std::optional<std::uint32_t> sequence_last;    ///< Last received, in receipt order.
    std::uint64_t expected = 0;
    std::uint64_t lost = 0;
    double loss_percent = 0.0;
};

struct ClientStats {
    bool has_data = false;
    TickSummary ticks;
    std::uint64_t messages_sent = 0;
    std::uint64_t lost = 0;
    double loss_percent = 0.0;
    std::uint64_t echo_out_of_order = 0;
    double echo_timestamp_mean_ms = 0.0;
    double echo_timestamp_max_ms = 0.0;
};

/// Adjacent pairs with seq[i] <= seq[i-1].
std::uint64_t count_out_of_order(const std::vector<std::uint32_t>& sequences);

/**
 * @brief Distribution, batching and timing over the per-tick counts.
 *
 * @param tick_counts  One entry per connected tick.
 * @param receipt_instants Receipt instants of the observations, in order.
 */
TickSummary summarize_ticks(const std::vector<std::size_t>& tick_counts,
                            const std::vector<Clock::time_point>& receipt_instants);

ServerStats derive_server_stats(const ServerRecorder& recorder, std::uint64_t echoes_sent);

ClientStats derive_client_stats(const ClientRecorder& recorder, std::uint64_t messages_sent);

} // namespace tickprobe
