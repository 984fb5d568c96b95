// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/ReliableChannel.h"

#include <cassert>
#include <chrono>
#include <string>

using namespace std::chrono;
using tickprobe::net::ReliableChannel;

int main() {
    const auto t0 = steady_clock::time_point{} + seconds(1);

    // Sender: ids from 1, resent until acked.
    {
        ReliableChannel ch(milliseconds(100));
        assert(ch.enqueue("a") == 1);
        assert(ch.enqueue("b") == 2);

        auto due = ch.collect_due(t0);
        assert(due.size() == 2);
        assert(due[0].id == 1 && due[0].payload == "a");
        assert(due[1].id == 2 && due[1].payload == "b");
        assert(ch.unacked() == 2);

        // Nothing due before the resend interval.
        assert(ch.collect_due(t0 + milliseconds(50)).empty());

        ch.on_ack(1);
        assert(ch.unacked() == 1);
        due = ch.collect_due(t0 + milliseconds(100));
        assert(due.size() == 1 && due[0].id == 2);

        // Newly queued payloads go out at once, independent of older ones.
        assert(ch.enqueue("c") == 3);
        due = ch.collect_due(t0 + milliseconds(110));
        assert(due.size() == 1 && due[0].id == 3);

        ch.on_ack(3);
        assert(ch.unacked() == 0);
        assert(ch.collect_due(t0 + seconds(5)).empty());
    }

    // Receiver: in-order release, exactly once.
    {
        ReliableChannel ch(milliseconds(100));
        assert(ch.cumulative_ack() == 0);

        assert(ch.on_receive(2, "two"));
        assert(ch.drain_ordered().empty());
        assert(ch.cumulative_ack() == 0);

        // Buffered twice: rejected.
        assert(!ch.on_receive(2, "two"));

        assert(ch.on_receive(1, "one"));
        auto ready = ch.drain_ordered();
        assert(ready.size() == 2);
        assert(ready[0] == "one" && ready[1] == "two");
        assert(ch.cumulative_ack() == 2);

        // Already delivered: rejected.
        assert(!ch.on_receive(1, "one"));
        assert(ch.drain_ordered().empty());

        assert(ch.on_receive(4, "four"));
        assert(ch.on_receive(3, "three"));
        ready = ch.drain_ordered();
        assert(ready.size() == 2 && ready[0] == "three" && ready[1] == "four");
        assert(ch.cumulative_ack() == 4);
    }

    // Receiver: ids past the reorder window are not buffered.
    {
        ReliableChannel ch(milliseconds(100));
        const auto window = ReliableChannel::kReorderWindow;
        assert(!ch.on_receive(1 + window, "far"));
        assert(!ch.on_receive(1'000'000'000ULL, "farther"));
        assert(ch.on_receive(window, "edge"));

        assert(ch.on_receive(1, "one"));
        const auto ready = ch.drain_ordered();
        assert(ready.size() == 1 && ready[0] == "one");
        assert(ch.cumulative_ack() == 1);

        // The window moves with delivery.
        assert(ch.on_receive(1 + window, "now inside"));
    }

    return 0;
}
