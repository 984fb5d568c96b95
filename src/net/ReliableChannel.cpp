// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/ReliableChannel.h"

#include <utility>

namespace tickprobe::net {

ReliableChannel::ReliableChannel(duration resend_interval)
    : resend_interval_(resend_interval) {}

std::uint64_t ReliableChannel::enqueue(std::string payload) {
    const auto id = next_id_++;
    pending_.emplace(id, Pending{std::move(payload), std::nullopt});
    return id;
}

std::vector<ReliableChannel::Outgoing> ReliableChannel::collect_due(time_point now) {
    std::vector<Outgoing> due;
    for (auto& [id, entry] : pending_) {
        if (entry.last_sent && now - *entry.last_sent < resend_interval_) continue;
        entry.last_sent = now;
        due.push_back(Outgoing{id, entry.payload});
    }
    return due;
}

void ReliableChannel::on_ack(std::uint64_t cumulative) {
    pending_.erase(pending_.begin(), pending_.upper_bound(cumulative));
}

bool ReliableChannel::on_receive(std::uint64_t id, std::string payload) {
    if (id < next_expected_) return false;
    if (id - next_expected_ >= kReorderWindow) return false;
    if (!reorder_.emplace(id, std::move(payload)).second) return false;

    // Release the contiguous run starting at next_expected_.
    auto it = reorder_.begin();
    while (it != reorder_.end() && it->first == next_expected_) {
        ready_.push_back(std::move(it->second));
        it = reorder_.erase(it);
        ++next_expected_;
    }
    return true;
}

std::vector<std::string> ReliableChannel::drain_ordered() {
    std::vector<std::string> out;
    out.swap(ready_);
    return out;
}

} // namespace tickprobe::net
