// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/Report.h"

#include <cstdio>

namespace tickprobe {
namespace {

std::string pct(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value);
    return buf;
}

std::string ms(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fms", value);
    return buf;
}

void write_distribution(std::ostream& os, const TickSummary& t, const char* what) {
    os << "\n" << what << " per tick distribution:\n";
    for (const auto& e : t.distribution) {
        os << "  " << e.messages_per_tick << " msg/tick: " << e.ticks << " ticks (" << pct(e.percent) << ")\n";
    }
    os << "\nBatched ticks (>1 msg): " << t.batched_ticks << " (" << pct(t.batched_percent) << ")\n";
}

void write_arrival(std::ostream& os, const TickSummary& t) {
    if (!t.arrival) return;
    os << "Arrival interval: min " << ms(t.arrival->min_ms)
       << " / mean " << ms(t.arrival->mean_ms)
       << " / max " << ms(t.arrival->max_ms) << "\n";
}

nlohmann::json ticks_json(const TickSummary& t) {
    nlohmann::json dist = nlohmann::json::array();
    for (const auto& e : t.distribution) {
        dist.push_back({{"messages_per_tick", e.messages_per_tick},
                        {"ticks", e.ticks},
                        {"percent", e.percent}});
    }
    nlohmann::json j = {
        {"total", t.total_ticks},
        {"distribution", dist},
        {"batched", t.batched_ticks},
        {"batched_percent", t.batched_percent},
        {"empty", t.empty_ticks},
        {"empty_percent", t.empty_percent},
        {"max_batch", t.max_batch}
    };
    if (t.arrival) {
        j["arrival_interval_ms"] = {{"min", t.arrival->min_ms},
                                    {"mean", t.arrival->mean_ms},
                                    {"max", t.arrival->max_ms}};
    }
    return j;
}

} // namespace

void write_server_report(std::ostream& os, const ServerStats& s) {
    os << "\n========== SERVER RECEIVE STATS ==========\n";
    os << "Total ticks: " << s.ticks.total_ticks << "\n";
    os << "Total messages received: " << s.ticks.messages_received << "\n";
    os << "EntityMove sent back: " << s.echoes_sent << "\n";

    if (!s.has_data) {
        os << "No data received.\n";
        os << "==========================================\n\n";
        return;
    }

    write_distribution(os, s.ticks, "Messages");
    os << "Empty ticks (0 msg): " << s.ticks.empty_ticks << " (" << pct(s.ticks.empty_percent) << ")\n";
    os << "Out of order messages: " << s.out_of_order << "\n";
    if (s.sequence_first && s.sequence_last) {
        os << "Sequence range: " << *s.sequence_first << " .. " << *s.sequence_last
           << " (expected " << s.expected << ", got " << s.ticks.messages_received
           << ", lost " << s.lost << ", " << pct(s.loss_percent) << ")\n";
    }
    write_arrival(os, s.ticks);
    os << "Max messages in single tick: " << s.ticks.max_batch << "\n";
    os << "==========================================\n\n";
}

void write_client_report(std::ostream& os, const ClientStats& s) {
    os << "\n========== CLIENT STATS ==========\n";
    os << "Total PlayerMove sent: " << s.messages_sent << "\n";
    os << "Total EntityMove received: " << s.ticks.messages_received << "\n";
    os << "Client ticks: " << s.ticks.total_ticks << "\n";

    if (s.has_data) {
        write_distribution(os, s.ticks, "EntityMove");
        os << "Max messages in single tick: " << s.ticks.max_batch << "\n";
        if (s.ticks.messages_received > 0) {
            os << "Echo out of order: " << s.echo_out_of_order << "\n";
            os << "Echo server timestamp: mean " << ms(s.echo_timestamp_mean_ms)
               << " / max " << ms(s.echo_timestamp_max_ms) << "\n";
        }
        write_arrival(os, s.ticks);
    } else {
        os << "No data received.\n";
    }
    os << "\nMessage loss: " << s.lost << " (" << pct(s.loss_percent) << ")\n";
    os << "==================================\n\n";
}

void write_server_kv(std::ostream& os, const ServerStats& s, const std::string& p) {
    os << p << "has_data=" << (s.has_data ? 1 : 0) << "\n";
    os << p << "total_ticks=" << s.ticks.total_ticks << "\n";
    os << p << "messages_received=" << s.ticks.messages_received << "\n";
    os << p << "echoes_sent=" << s.echoes_sent << "\n";
    os << p << "out_of_order=" << s.out_of_order << "\n";
    os << p << "lost=" << s.lost << "\n";
    os << p << "loss_percent=" << s.loss_percent << "\n";
    os << p << "batched_ticks=" << s.ticks.batched_ticks << "\n";
    os << p << "empty_ticks=" << s.ticks.empty_ticks << "\n";
    os << p << "max_batch=" << s.ticks.max_batch << "\n";
    if (s.sequence_first) os << p << "sequence_first=" << *s.sequence_first << "\n";
    if (s.sequence_last) os << p << "sequence_last=" << *s.sequence_last << "\n";
}

void write_client_kv(std::ostream& os, const ClientStats& s, const std::string& p) {
    os << p << "has_data=" << (s.has_data ? 1 : 0) << "\n";
    os << p << "total_ticks=" << s.ticks.total_ticks << "\n";
    os << p << "messages_received=" << s.ticks.messages_received << "\n";
    os << p << "messages_sent=" << s.messages_sent << "\n";
    os << p << "out_of_order=" << s.echo_out_of_order << "\n";
    os << p << "lost=" << s.lost << "\n";
    os << p << "loss_percent=" << s.loss_percent << "\n";
    os << p << "batched_ticks=" << s.ticks.batched_ticks << "\n";
    os << p << "empty_ticks=" << s.ticks.empty_ticks << "\n";
    os << p << "max_batch=" << s.ticks.max_batch << "\n";
}

nlohmann::json to_json(const ServerStats& s) {
    nlohmann::json j;
    j["role"] = "server";
    j["has_data"] = s.has_data;
    j["ticks"] = ticks_json(s.ticks);
    j["messages"] = {
        {"received", s.ticks.messages_received},
        {"echoes_sent", s.echoes_sent},
        {"out_of_order", s.out_of_order}
    };
    nlohmann::json seq = {
        {"expected", s.expected},
        {"lost", s.lost},
        {"loss_percent", s.loss_percent}
    };
    if (s.sequence_first) seq["first"] = *s.sequence_first;
    if (s.sequence_last) seq["last"] = *s.sequence_last;
    j["sequence"] = seq;
    return j;
}

nlohmann::json to_json(const ClientStats& s) {
    nlohmann::json j;
    j["role"] = "client";
    j["has_data"] = s.has_data;
    j["ticks"] = ticks_json(s.ticks);
    j["messages"] = {
        {"sent", s.messages_sent},
        {"received", s.ticks.messages_received},
        {"lost", s.lost},
        {"loss_percent", s.loss_percent}
    };
    j["echo"] = {
        {"out_of_order", s.echo_out_of_order},
        {"server_timestamp_mean_ms", s.echo_timestamp_mean_ms},
        {"server_timestamp_max_ms", s.echo_timestamp_max_ms}
    };
    return j;
}

} // namespace tickprobe
