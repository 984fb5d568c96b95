// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file ReliableChannel.h
 * @brief Reliable-ordered delivery state for one peer of a datagram transport.
 *
 * Sender side: payloads get ids starting at 1 and are resent every
 * resend_interval until a cumulative ack covers them.
 * Receiver side: ids arriving out of order are buffered and payloads are
 * released strictly in id order, each exactly once.
 *
 * The channel performs no I/O; the transport owns the socket.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tickprobe::net {

class ReliableChannel {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    struct Outgoing {
        std::uint64_t id{0};
        std::string payload;
    };

    /// Ids further than this past the next expected one are dropped on receipt.
    static constexpr std::uint64_t kReorderWindow = 1024;

    explicit ReliableChannel(duration resend_interval);

    /// Queue a payload for delivery and return its id.
    std::uint64_t enqueue(std::string payload);

    /**
     * @brief Payloads that must go on the wire at @p now: never sent before,
     *        or last sent at least resend_interval ago. Marks them as sent.
     */
    std::vector<Outgoing> collect_due(time_point now);

    /// Forget every queued payload with id <= @p cumulative.
    void on_ack(std::uint64_t cumulative);

    /**
     * @brief Accept a received payload.
     * @return false for ids already delivered, already buffered, or beyond
     *         the reorder window. The sender resends those after the gap fills.
     */
    bool on_receive(std::uint64_t id, std::string payload);

    /// Payloads that became deliverable in order since the last call.
    std::vector<std::string> drain_ordered();

    /// Highest id received with no gap below it (0 before the first).
    std::uint64_t cumulative_ack() const { return next_expected_ - 1; }

    /// Number of sent payloads still waiting for an ack.
    std::size_t unacked() const { return pending_.size(); }

private:
    struct Pending {
        std::string payload;
        std::optional<time_point> last_sent;
    };

    duration resend_interval_;
    std::uint64_t next_id_{1};
    std::map<std::uint64_t, Pending> pending_;

    std::uint64_t next_expected_{1};
    std::map<std::uint64_t, std::string> reorder_;
    std::vector<std::string> ready_;
};

} // namespace tickprobe::net
