// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/Report.h"
#include "tickprobe/probe/StatsCollector.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <sstream>
#include <string>

using namespace std::chrono;
using tickprobe::ClientObservation;
using tickprobe::ClientRecorder;
using tickprobe::ServerObservation;
using tickprobe::ServerRecorder;

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

int main() {
    const auto t0 = tickprobe::Clock::time_point{} + seconds(1);

    // Server: ticks 1,0,2,1 with sequences 1,2,4,5 (3 lost).
    {
        ServerRecorder rec;
        rec.record_tick(1);
        rec.record(ServerObservation{t0, 1});
        rec.record_tick(0);
        rec.record_tick(2);
        rec.record(ServerObservation{t0 + milliseconds(30), 2});
        rec.record(ServerObservation{t0 + milliseconds(30), 4});
        rec.record_tick(1);
        rec.record(ServerObservation{t0 + milliseconds(40), 5});

        const auto s = tickprobe::derive_server_stats(rec, 4);
        assert(s.has_data);
        assert(s.ticks.total_ticks == 4);
        assert(s.ticks.messages_received == 4);
        assert(s.echoes_sent == 4);
        assert(s.ticks.batched_ticks == 1);
        assert(near(s.ticks.batched_percent, 25.0));
        assert(s.ticks.empty_ticks == 1);
        assert(near(s.ticks.empty_percent, 25.0));
        assert(s.ticks.max_batch == 2);

        assert(s.ticks.distribution.size() == 3);
        assert(s.ticks.distribution[0].messages_per_tick == 0);
        assert(s.ticks.distribution[1].messages_per_tick == 1);
        assert(s.ticks.distribution[1].ticks == 2);
        assert(near(s.ticks.distribution[1].percent, 50.0));
        assert(s.ticks.distribution[2].messages_per_tick == 2);

        assert(s.out_of_order == 0);
        assert(*s.sequence_first == 1 && *s.sequence_last == 5);
        assert(s.expected == 5);
        assert(s.lost == 1);
        assert(near(s.loss_percent, 20.0));

        // Distinct instants t0, +30, +40.
        assert(s.ticks.arrival);
        assert(near(s.ticks.arrival->min_ms, 10.0));
        assert(near(s.ticks.arrival->max_ms, 30.0));
        assert(near(s.ticks.arrival->mean_ms, 20.0));
    }

    // Last below first in receipt order: nothing expected, nothing lost.
    {
        ServerRecorder rec;
        rec.record_tick(2);
        rec.record(ServerObservation{t0, 9});
        rec.record(ServerObservation{t0, 3});
        const auto s = tickprobe::derive_server_stats(rec, 2);
        assert(*s.sequence_first == 9);
        assert(*s.sequence_last == 3);
        assert(s.expected == 0);
        assert(s.lost == 0);
        assert(s.loss_percent == 0.0);
        assert(s.out_of_order == 1);
        assert(!s.ticks.arrival);
    }

    // Nothing recorded at all.
    {
        ServerRecorder rec;
        const auto s = tickprobe::derive_server_stats(rec, 0);
        assert(!s.has_data);
        assert(s.ticks.total_ticks == 0);
        assert(s.ticks.batched_percent == 0.0);
        assert(!s.sequence_first);
        assert(s.lost == 0);
    }

    // Client: 4 sent, 3 echoed.
    {
        ClientRecorder rec;
        rec.record_tick(0);
        rec.record_tick(1);
        rec.record(ClientObservation{t0, 1, 0.002f});
        rec.record_tick(2);
        rec.record(ClientObservation{t0 + milliseconds(16), 2, 0.004f});
        rec.record(ClientObservation{t0 + milliseconds(16), 3, 0.0f});

        const auto c = tickprobe::derive_client_stats(rec, 4);
        assert(c.has_data);
        assert(c.messages_sent == 4);
        assert(c.ticks.messages_received == 3);
        assert(c.lost == 1);
        assert(near(c.loss_percent, 25.0));
        assert(c.echo_out_of_order == 0);
        assert(std::fabs(c.echo_timestamp_mean_ms - 2.0) < 1e-3);
        assert(std::fabs(c.echo_timestamp_max_ms - 4.0) < 1e-3);
        assert(c.ticks.max_batch == 2);
    }

    // Client that sent nothing during one connected tick.
    {
        ClientRecorder rec;
        rec.record_tick(0);
        const auto c = tickprobe::derive_client_stats(rec, 0);
        assert(c.has_data);
        assert(c.lost == 0);
        assert(c.loss_percent == 0.0);
        assert(near(c.ticks.empty_percent, 100.0));
    }

    // Client connected for ten ticks with every echo lost.
    {
        ClientRecorder rec;
        for (int i = 0; i < 10; ++i) rec.record_tick(0);
        const auto c = tickprobe::derive_client_stats(rec, 5);
        assert(c.has_data);
        assert(c.ticks.total_ticks == 10);
        assert(c.ticks.messages_received == 0);
        assert(c.lost == 5);
        assert(near(c.loss_percent, 100.0));
        assert(c.ticks.distribution.size() == 1);
        assert(near(c.ticks.distribution[0].percent, 100.0));

        std::ostringstream os;
        tickprobe::write_client_report(os, c);
        const auto text = os.str();
        assert(text.find("No data received.") == std::string::npos);
        assert(text.find("0 msg/tick: 10 ticks (100.0%)") != std::string::npos);
        assert(text.find("Message loss: 5 (100.0%)") != std::string::npos);
    }

    // Server connected for four ticks that all arrived empty.
    {
        ServerRecorder rec;
        for (int i = 0; i < 4; ++i) rec.record_tick(0);
        const auto s = tickprobe::derive_server_stats(rec, 0);
        assert(s.has_data);
        assert(s.ticks.empty_ticks == 4);
        assert(!s.sequence_first);
        assert(s.lost == 0);

        std::ostringstream os;
        tickprobe::write_server_report(os, s);
        const auto text = os.str();
        assert(text.find("No data received.") == std::string::npos);
        assert(text.find("Empty ticks (0 msg): 4 (100.0%)") != std::string::npos);
        assert(text.find("Sequence range") == std::string::npos);
    }

    return 0;
}
