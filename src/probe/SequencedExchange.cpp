// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/SequencedExchange.h"

#include <limits>

namespace tickprobe {

net::PlayerMove make_sequenced_move(std::uint32_t sequence) {
    net::PlayerMove move;
    move.position = net::Vector3{static_cast<float>(sequence), 0.0f, 0.0f};
    move.rotation = net::Rotation{0.0f, 0.0f};
    return move;
}

std::uint32_t sequence_of(const net::Vector3& position) {
    const double x = position.x;
    if (!(x > 0.0)) return 0;
    if (x >= static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(x);
}

net::EntityMove make_echo(const net::PlayerMove& move, float since_tick_start) {
    net::EntityMove echo;
    echo.world_slug.clear();
    echo.id = 1;
    echo.position = move.position;
    echo.rotation = move.rotation;
    echo.timestamp = since_tick_start;
    return echo;
}

ClientSequencer::ClientSequencer(Clock::duration send_interval)
    : send_interval_(send_interval) {}

std::optional<std::uint32_t> ClientSequencer::maybe_send(Clock::time_point tick_start,
                                                         net::ClientTransport& transport) {
    if (tick_start - last_send_ < send_interval_) return std::nullopt;
    ++sequence_;
    transport.send_message(net::DeliveryClass::Unreliable, make_sequenced_move(sequence_));
    last_send_ = tick_start;
    return sequence_;
}

} // namespace tickprobe
