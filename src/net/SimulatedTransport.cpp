// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/SimulatedTransport.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace tickprobe::net {
namespace {

Clock::duration millis(double ms) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double, std::milli>(ms));
}

template <typename Message>
std::vector<Message> drain(std::vector<Message>& queue) {
    std::vector<Message> out;
    out.swap(queue);
    return out;
}

} // namespace

LinkConditions LinkConditions::from_config(const Config::SimulatedConfig& cfg) {
    LinkConditions cond;
    cond.latency_ms = cfg.latency_ms;
    cond.jitter_ms = cfg.jitter_ms;
    cond.loss_percent = cfg.loss_percent;
    cond.duplicate_percent = cfg.duplicate_percent;
    cond.duplicate_every = cfg.duplicate_every;
    return cond;
}

/**
 * @brief Server-side handle for one simulated client.
 */
class SimulatedNetwork::Connection final : public ServerConnection {
public:
    Connection(std::weak_ptr<SimulatedNetwork> net, std::uint64_t id)
        : net_(std::move(net)), id_(id) {}

    std::uint64_t client_id() const override { return id_; }

    std::vector<ClientMessage> drain_client_messages() override {
        auto net = net_.lock();
        if (!net) return {};
        return net->server_drain_messages(id_);
    }

    void send_message(DeliveryClass cls, const ServerMessage& msg) override {
        if (auto net = net_.lock()) net->server_send(id_, cls, msg);
    }

private:
    std::weak_ptr<SimulatedNetwork> net_;
    std::uint64_t id_;
};

SimulatedNetwork::SimulatedNetwork(Clock& clock, const Config::SimulatedConfig& cfg)
    : SimulatedNetwork(clock,
                       LinkConditions::from_config(cfg),
                       LinkConditions::from_config(cfg),
                       cfg.seed) {}

SimulatedNetwork::SimulatedNetwork(Clock& clock,
                                   LinkConditions to_server,
                                   LinkConditions to_client,
                                   std::uint64_t seed)
    : clock_(clock), to_server_(to_server), to_client_(to_client), rng_(seed) {}

std::unique_ptr<SimulatedServerTransport> SimulatedNetwork::server_transport() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (server_taken_) {
            throw std::logic_error("simulated network already has a server transport");
        }
        server_taken_ = true;
    }
    return std::make_unique<SimulatedServerTransport>(shared_from_this());
}

std::unique_ptr<SimulatedClientTransport> SimulatedNetwork::connect_client() {
    auto self = shared_from_this();
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = next_client_id_++;
        clients_[id].id = id;
        server_events_.push_back(
            ConnectionEvent::connect(std::make_shared<Connection>(self, id)));
    }
    return std::make_unique<SimulatedClientTransport>(std::move(self), id);
}

void SimulatedNetwork::inject_server_error(std::string error) {
    std::lock_guard<std::mutex> lock(mtx_);
    server_errors_.push_back(std::move(error));
}

void SimulatedNetwork::inject_client_error(std::uint64_t client_id, std::string error) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(client_id);
    if (it != clients_.end()) it->second.client_errors.push_back(std::move(error));
}

LinkCounters SimulatedNetwork::client_to_server() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return c2s_;
}

LinkCounters SimulatedNetwork::server_to_client() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return s2c_;
}

std::size_t SimulatedNetwork::connected_clients() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<std::size_t>(std::count_if(clients_.begin(), clients_.end(),
                                                  [](const auto& kv) { return kv.second.connected; }));
}

bool SimulatedNetwork::roll_percent(double percent) {
    if (percent <= 0.0) return false;
    if (percent >= 100.0) return true;
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    return dist(rng_) < percent;
}

template <typename Message>
void SimulatedNetwork::enqueue(Lane<Message>& lane,
                               const LinkConditions& cond,
                               LinkCounters& counters,
                               DeliveryClass cls,
                               const Message& msg) {
    const auto now = clock_.now();

    if (cls == DeliveryClass::ReliableOrdered) {
        ++counters.reliable_sent;
        const auto at = std::max(now + millis(cond.latency_ms), lane.last_reliable_at);
        lane.last_reliable_at = at;
        lane.in_flight.push_back(InFlight<Message>{at, next_order_++, msg});
        return;
    }

    ++counters.unreliable_sent;
    if (roll_percent(cond.loss_percent)) {
        ++counters.dropped;
        return;
    }

    double delay_ms = cond.latency_ms;
    if (cond.jitter_ms > 0.0) {
        std::uniform_real_distribution<double> jitter(-cond.jitter_ms, cond.jitter_ms);
        delay_ms = std::max(0.0, delay_ms + jitter(rng_));
    }
    const auto at = now + millis(delay_ms);
    lane.in_flight.push_back(InFlight<Message>{at, next_order_++, msg});

    const bool every_nth = cond.duplicate_every > 0 &&
                           counters.unreliable_sent % cond.duplicate_every == 0;
    if (every_nth || roll_percent(cond.duplicate_percent)) {
        ++counters.duplicated;
        lane.in_flight.push_back(InFlight<Message>{at, next_order_++, msg});
    }
}

template <typename Message>
std::vector<Message> SimulatedNetwork::take_due(Lane<Message>& lane,
                                                LinkCounters& counters,
                                                Clock::time_point now) {
    auto& q = lane.in_flight;
    std::sort(q.begin(), q.end(), [](const InFlight<Message>& a, const InFlight<Message>& b) {
        if (a.deliver_at != b.deliver_at) return a.deliver_at < b.deliver_at;
        return a.order < b.order;
    });
    auto end = std::find_if(q.begin(), q.end(),
                            [now](const InFlight<Message>& f) { return f.deliver_at > now; });
    std::vector<Message> out;
    out.reserve(static_cast<std::size_t>(end - q.begin()));
    for (auto it = q.begin(); it != end; ++it) out.push_back(std::move(it->message));
    q.erase(q.begin(), end);
    counters.delivered += out.size();
    return out;
}

// -----------------------------------------------------------------------------
// Client-side entry points
// -----------------------------------------------------------------------------

void SimulatedNetwork::client_send(std::uint64_t id, DeliveryClass cls, const ClientMessage& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end() || !it->second.connected) return;
    enqueue(it->second.to_server, to_server_, c2s_, cls, msg);
}

void SimulatedNetwork::client_step(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end() || !it->second.connected) return;
    auto due = take_due(it->second.to_client, s2c_, clock_.now());
    auto& inbox = it->second.client_inbox;
    std::move(due.begin(), due.end(), std::back_inserter(inbox));
}

std::vector<std::string> SimulatedNetwork::client_drain_errors(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end()) return {};
    return drain(it->second.client_errors);
}

std::vector<ServerMessage> SimulatedNetwork::client_drain_messages(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end()) return {};
    return drain(it->second.client_inbox);
}

void SimulatedNetwork::client_disconnect(std::uint64_t id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end() || !it->second.connected) return;
    it->second.connected = false;
    it->second.to_server.in_flight.clear();
    it->second.to_client.in_flight.clear();
    server_events_.push_back(ConnectionEvent::disconnect(id, reason));
}

// -----------------------------------------------------------------------------
// Server-side entry points
// -----------------------------------------------------------------------------

void SimulatedNetwork::server_send(std::uint64_t id, DeliveryClass cls, const ServerMessage& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end() || !it->second.connected) return;
    enqueue(it->second.to_client, to_client_, s2c_, cls, msg);
}

void SimulatedNetwork::server_step() {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto now = clock_.now();
    for (auto& [id, client] : clients_) {
        if (!client.connected) continue;
        auto due = take_due(client.to_server, c2s_, now);
        std::move(due.begin(), due.end(), std::back_inserter(client.server_inbox));
    }
}

std::vector<std::string> SimulatedNetwork::server_drain_errors() {
    std::lock_guard<std::mutex> lock(mtx_);
    return drain(server_errors_);
}

std::vector<ConnectionEvent> SimulatedNetwork::server_drain_connections() {
    std::lock_guard<std::mutex> lock(mtx_);
    return drain(server_events_);
}

std::vector<ClientMessage> SimulatedNetwork::server_drain_messages(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end()) return {};
    return drain(it->second.server_inbox);
}

// -----------------------------------------------------------------------------
// Facades
// -----------------------------------------------------------------------------

SimulatedServerTransport::SimulatedServerTransport(std::shared_ptr<SimulatedNetwork> net)
    : net_(std::move(net)) {}

void SimulatedServerTransport::step(Duration) {
    net_->server_step();
}

std::vector<std::string> SimulatedServerTransport::drain_errors() {
    return net_->server_drain_errors();
}

std::vector<ConnectionEvent> SimulatedServerTransport::drain_connections() {
    return net_->server_drain_connections();
}

SimulatedClientTransport::SimulatedClientTransport(std::shared_ptr<SimulatedNetwork> net, std::uint64_t id)
    : net_(std::move(net)), id_(id) {}

SimulatedClientTransport::~SimulatedClientTransport() {
    if (!disconnected_) net_->client_disconnect(id_, "client closed");
}

void SimulatedClientTransport::step(Duration) {
    net_->client_step(id_);
}

std::vector<std::string> SimulatedClientTransport::drain_errors() {
    return net_->client_drain_errors(id_);
}

std::vector<ServerMessage> SimulatedClientTransport::drain_server_messages() {
    return net_->client_drain_messages(id_);
}

void SimulatedClientTransport::send_message(DeliveryClass cls, const ClientMessage& msg) {
    net_->client_send(id_, cls, msg);
}

void SimulatedClientTransport::disconnect(const std::string& reason) {
    if (disconnected_) return;
    disconnected_ = true;
    net_->client_disconnect(id_, reason);
}

} // namespace tickprobe::net
