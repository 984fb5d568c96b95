// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file SimulatedTransport.h
 * @brief In-process transport with configurable link conditions.
 *
 * One SimulatedNetwork hosts a single server endpoint and any number of
 * clients. Unreliable messages pass through per-direction link conditions
 * (loss, duplication, latency, jitter); reliable-ordered messages are
 * delayed by the base latency only and are never dropped, duplicated or
 * reordered. A duplicate is delivered immediately after its original.
 *
 * All state is guarded by one mutex so a server and a client loop may run
 * on different threads. Create the network with std::make_shared.
 */

#include "tickprobe/config/Config.h"
#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/Clock.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace tickprobe::net {

/**
 * @brief Impairments applied to unreliable traffic in one direction.
 */
struct LinkConditions {
    double latency_ms = 0.0;
    double jitter_ms = 0.0;
    double loss_percent = 0.0;
    double duplicate_percent = 0.0;
    unsigned duplicate_every = 0;  ///< Duplicate every Nth unreliable message (0 disables).

    static LinkConditions from_config(const Config::SimulatedConfig& cfg);
};

/**
 * @brief Per-direction traffic counters.
 */
struct LinkCounters {
    std::uint64_t unreliable_sent = 0;
    std::uint64_t reliable_sent = 0;
    std::uint64_t dropped = 0;      ///< Unreliable messages discarded by the loss model.
    std::uint64_t duplicated = 0;   ///< Extra copies injected.
    std::uint64_t delivered = 0;    ///< Messages handed to the receiver (copies included).
};

class SimulatedClientTransport;
class SimulatedServerTransport;

class SimulatedNetwork : public std::enable_shared_from_this<SimulatedNetwork> {
public:
    /// Same conditions for both directions.
    SimulatedNetwork(Clock& clock, const Config::SimulatedConfig& cfg);

    SimulatedNetwork(Clock& clock,
                     LinkConditions to_server,
                     LinkConditions to_client,
                     std::uint64_t seed);

    /// Facade for the server role. Only one server transport may exist.
    std::unique_ptr<SimulatedServerTransport> server_transport();

    /**
     * @brief Attach a new client. The server observes a Connect event on its
     *        next step.
     */
    std::unique_ptr<SimulatedClientTransport> connect_client();

    /// Queue an error for the server's next drain_errors().
    void inject_server_error(std::string error);

    /// Queue an error for the given client's next drain_errors().
    void inject_client_error(std::uint64_t client_id, std::string error);

    LinkCounters client_to_server() const;
    LinkCounters server_to_client() const;

    std::size_t connected_clients() const;

private:
    friend class SimulatedClientTransport;
    friend class SimulatedServerTransport;
    class Connection;

    template <typename Message>
    struct InFlight {
        Clock::time_point deliver_at;
        std::uint64_t order = 0;
        Message message;
    };

    template <typename Message>
    struct Lane {
        std::vector<InFlight<Message>> in_flight;
        Clock::time_point last_reliable_at{};
    };

    struct ClientState {
        std::uint64_t id = 0;
        bool connected = true;
        Lane<ClientMessage> to_server;
        Lane<ServerMessage> to_client;
        std::vector<ClientMessage> server_inbox;
        std::vector<ServerMessage> client_inbox;
        std::vector<std::string> client_errors;
    };

    template <typename Message>
    void enqueue(Lane<Message>& lane,
                 const LinkConditions& cond,
                 LinkCounters& counters,
                 DeliveryClass cls,
                 const Message& msg);

    template <typename Message>
    std::vector<Message> take_due(Lane<Message>& lane, LinkCounters& counters, Clock::time_point now);

    bool roll_percent(double percent);

    // Entry points used by the facades (lock held inside).
    void client_send(std::uint64_t id, DeliveryClass cls, const ClientMessage& msg);
    void client_step(std::uint64_t id);
    std::vector<std::string> client_drain_errors(std::uint64_t id);
    std::vector<ServerMessage> client_drain_messages(std::uint64_t id);
    void client_disconnect(std::uint64_t id, const std::string& reason);

    void server_send(std::uint64_t id, DeliveryClass cls, const ServerMessage& msg);
    void server_step();
    std::vector<std::string> server_drain_errors();
    std::vector<ConnectionEvent> server_drain_connections();
    std::vector<ClientMessage> server_drain_messages(std::uint64_t id);

    Clock& clock_;
    LinkConditions to_server_;
    LinkConditions to_client_;

    mutable std::mutex mtx_;
    std::mt19937_64 rng_;
    std::uint64_t next_client_id_{1};
    std::uint64_t next_order_{0};
    std::map<std::uint64_t, ClientState> clients_;
    std::vector<std::string> server_errors_;
    std::vector<ConnectionEvent> server_events_;
    LinkCounters c2s_{};
    LinkCounters s2c_{};
    bool server_taken_ = false;
};

class SimulatedServerTransport final : public ServerTransport {
public:
    explicit SimulatedServerTransport(std::shared_ptr<SimulatedNetwork> net);

    void step(Duration max_duration) override;
    std::vector<std::string> drain_errors() override;
    std::vector<ConnectionEvent> drain_connections() override;

private:
    std::shared_ptr<SimulatedNetwork> net_;
};

class SimulatedClientTransport final : public ClientTransport {
public:
    SimulatedClientTransport(std::shared_ptr<SimulatedNetwork> net, std::uint64_t id);
    ~SimulatedClientTransport() override;

    void step(Duration max_duration) override;
    std::vector<std::string> drain_errors() override;
    std::vector<ServerMessage> drain_server_messages() override;
    void send_message(DeliveryClass cls, const ClientMessage& msg) override;

    /// Leave the network; the server sees Disconnect with @p reason.
    void disconnect(const std::string& reason);

    std::uint64_t client_id() const { return id_; }

private:
    std::shared_ptr<SimulatedNetwork> net_;
    std::uint64_t id_;
    bool disconnected_ = false;
};

} // namespace tickprobe::net
