// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/SequencedExchange.h"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono;

namespace {

class CapturingTransport final : public tickprobe::net::ClientTransport {
public:
    void step(tickprobe::net::Duration) override {}
    std::vector<std::string> drain_errors() override { return {}; }
    std::vector<tickprobe::net::ServerMessage> drain_server_messages() override { return {}; }
    void send_message(tickprobe::net::DeliveryClass cls, const tickprobe::net::ClientMessage& msg) override {
        assert(cls == tickprobe::net::DeliveryClass::Unreliable);
        moves.push_back(std::get<tickprobe::net::PlayerMove>(msg));
    }

    std::vector<tickprobe::net::PlayerMove> moves;
};

} // namespace

int main() {
    const auto t0 = tickprobe::Clock::time_point{} + seconds(1);
    const auto interval = milliseconds(20);

    tickprobe::ClientSequencer seq(interval);
    CapturingTransport transport;
    seq.on_connected(t0);

    // Not due on the AllowConnection tick itself.
    assert(!seq.maybe_send(t0, transport));
    assert(!seq.maybe_send(t0 + milliseconds(19), transport));

    auto s = seq.maybe_send(t0 + milliseconds(20), transport);
    assert(s && *s == 1);
    assert(seq.last_send() == t0 + milliseconds(20));

    // Ticks at 10ms against a 20ms interval: every other tick sends.
    for (int i = 3; i <= 20; ++i) {
        seq.maybe_send(t0 + milliseconds(10 * i), transport);
    }
    assert(seq.sent() == transport.moves.size());

    for (std::size_t i = 0; i < transport.moves.size(); ++i) {
        const auto& m = transport.moves[i];
        assert(tickprobe::sequence_of(m.position) == i + 1);
        assert(m.position.y == 0.0f && m.position.z == 0.0f);
    }

    // Echo keeps position and rotation, stamps the offset.
    const auto move = tickprobe::make_sequenced_move(42);
    const auto echo = tickprobe::make_echo(move, 0.0015f);
    assert(tickprobe::sequence_of(echo.position) == 42);
    assert(echo.world_slug.empty());
    assert(echo.id == 1);
    assert(echo.timestamp == 0.0015f);

    // Non-positive x decodes as 0.
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{0.0f, 0.0f, 0.0f}) == 0);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{-3.0f, 0.0f, 0.0f}) == 0);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{16777216.0f, 0.0f, 0.0f}) == 16777216u);

    // Fractions truncate; values past the 32-bit range saturate.
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{7.9f, 0.0f, 0.0f}) == 7);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{0.6f, 0.0f, 0.0f}) == 0);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{1e12f, 0.0f, 0.0f}) == UINT32_MAX);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{std::numeric_limits<float>::infinity(), 0.0f, 0.0f})
           == UINT32_MAX);
    assert(tickprobe::sequence_of(tickprobe::net::Vector3{std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f})
           == 0);

    return 0;
}
