// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/StatsCollector.h"

#include <algorithm>
#include <map>

namespace tickprobe {
namespace {

double percent_of(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

std::optional<ArrivalTiming> arrival_timing(const std::vector<Clock::time_point>& instants) {
    // All observations of one tick share its receipt instant.
    std::vector<Clock::time_point> distinct;
    for (const auto& t : instants) {
        if (distinct.empty() || distinct.back() != t) distinct.push_back(t);
    }
    if (distinct.size() < 2) return std::nullopt;

    ArrivalTiming timing;
    double sum = 0.0;
    for (std::size_t i = 1; i < distinct.size(); ++i) {
        const double ms = std::chrono::duration<double, std::milli>(distinct[i] - distinct[i - 1]).count();
        if (i == 1) {
            timing.min_ms = ms;
            timing.max_ms = ms;
        } else {
            timing.min_ms = std::min(timing.min_ms, ms);
            timing.max_ms = std::max(timing.max_ms, ms);
        }
        sum += ms;
    }
    timing.mean_ms = sum / static_cast<double>(distinct.size() - 1);
    return timing;
}

} // namespace

std::uint64_t count_out_of_order(const std::vector<std::uint32_t>& sequences) {
    std::uint64_t n = 0;
    for (std::size_t i = 1; i < sequences.size(); ++i) {
        if (sequences[i] <= sequences[i - 1]) ++n;
    }
    return n;
}

TickSummary summarize_ticks(const std::vector<std::size_t>& tick_counts,
                            const std::vector<Clock::time_point>& receipt_instants) {
    TickSummary s;
    s.total_ticks = tick_counts.size();

    std::map<std::size_t, std::uint64_t> histogram;
    for (auto count : tick_counts) {
        ++histogram[count];
        s.messages_received += count;
        if (count > 1) ++s.batched_ticks;
        if (count == 0) ++s.empty_ticks;
        s.max_batch = std::max<std::uint64_t>(s.max_batch, count);
    }
    for (const auto& [messages, ticks] : histogram) {
        s.distribution.push_back(DistributionEntry{messages, ticks, percent_of(ticks, s.total_ticks)});
    }
    s.batched_percent = percent_of(s.batched_ticks, s.total_ticks);
    s.empty_percent = percent_of(s.empty_ticks, s.total_ticks);
    s.arrival = arrival_timing(receipt_instants);
    return s;
}

ServerStats derive_server_stats(const ServerRecorder& recorder, std::uint64_t echoes_sent) {
    const auto& obs = recorder.observations();

    std::vector<std::uint32_t> sequences;
    std::vector<Clock::time_point> instants;
    sequences.reserve(obs.size());
    instants.reserve(obs.size());
    for (const auto& o : obs) {
        sequences.push_back(o.sequence);
        instants.push_back(o.received_at);
    }

    ServerStats stats;
    stats.ticks = summarize_ticks(recorder.tick_counts(), instants);
    // Counts come from the observations, not the tick buffer.
    stats.ticks.messages_received = obs.size();
    stats.has_data = !recorder.tick_counts().empty();
    stats.echoes_sent = echoes_sent;
    stats.out_of_order = count_out_of_order(sequences);

    if (!sequences.empty()) {
        const auto first = sequences.front();
        const auto last = sequences.back();
        stats.sequence_first = first;
        stats.sequence_last = last;
        stats.expected = last >= first ? static_cast<std::uint64_t>(last - first) + 1 : 0;
        const auto received = static_cast<std::uint64_t>(sequences.size());
        stats.lost = stats.expected > received ? stats.expected - received : 0;
        stats.loss_percent = percent_of(stats.lost, stats.expected);
    }
    return stats;
}

ClientStats derive_client_stats(const ClientRecorder& recorder, std::uint64_t messages_sent) {
    const auto& obs = recorder.observations();

    std::vector<std::uint32_t> echoed;
    std::vector<Clock::time_point> instants;
    echoed.reserve(obs.size());
    instants.reserve(obs.size());
    double ts_sum = 0.0;
    double ts_max = 0.0;
    for (const auto& o : obs) {
        echoed.push_back(o.echoed_sequence);
        instants.push_back(o.received_at);
        const double ms = static_cast<double>(o.server_timestamp) * 1000.0;
        ts_sum += ms;
        ts_max = std::max(ts_max, ms);
    }

    ClientStats stats;
    stats.ticks = summarize_ticks(recorder.tick_counts(), instants);
    stats.ticks.messages_received = obs.size();
    stats.has_data = !recorder.tick_counts().empty();
    stats.messages_sent = messages_sent;

    const auto received = static_cast<std::uint64_t>(obs.size());
    stats.lost = messages_sent > received ? messages_sent - received : 0;
    stats.loss_percent = percent_of(stats.lost, messages_sent);
    stats.echo_out_of_order = count_out_of_order(echoed);
    if (!obs.empty()) {
        stats.echo_timestamp_mean_ms = ts_sum / static_cast<double>(obs.size());
        stats.echo_timestamp_max_ms = ts_max;
    }
    return stats;
}

} // namespace tickprobe
