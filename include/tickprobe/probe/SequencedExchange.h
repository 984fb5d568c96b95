// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file SequencedExchange.h
 * @brief Sequence-numbered PlayerMove stream and its EntityMove echo.
 *
 * The sequence number travels in PlayerMove::position.x. It is exact while it
 * fits the float mantissa (2^24 sends, well beyond any realistic run).
 */

#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/Clock.h"

#include <cstdint>
#include <optional>

namespace tickprobe {

/// PlayerMove carrying @p sequence with a fixed placeholder rotation.
net::PlayerMove make_sequenced_move(std::uint32_t sequence);

/// Sequence number decoded from a PlayerMove or an echoed EntityMove.
std::uint32_t sequence_of(const net::Vector3& position);

/**
 * @brief Echo of @p move stamped with the seconds elapsed since tick start.
 */
net::EntityMove make_echo(const net::PlayerMove& move, float since_tick_start);

/**
 * @brief Client send cadence.
 *
 * The counter is incremented before each send so the first sequence is 1.
 * A send happens when tick_start - last_send >= send_interval.
 */
class ClientSequencer {
public:
    explicit ClientSequencer(Clock::duration send_interval);

    /// Reset the cadence reference to the AllowConnection receipt instant.
    void on_connected(Clock::time_point at) { last_send_ = at; }

    /**
     * @brief Send one unreliable PlayerMove if the interval elapsed.
     * @return The sequence sent, or std::nullopt when not due.
     */
    std::optional<std::uint32_t> maybe_send(Clock::time_point tick_start, net::ClientTransport& transport);

    std::uint32_t sent() const { return sequence_; }
    Clock::time_point last_send() const { return last_send_; }

private:
    Clock::duration send_interval_;
    Clock::time_point last_send_{};
    std::uint32_t sequence_ = 0;
};

} // namespace tickprobe
