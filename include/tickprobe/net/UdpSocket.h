// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace tickprobe::net {

/**
 * @brief Resolve "host:port" into an IPv4 socket address.
 * @return std::nullopt when the text is malformed or the host does not resolve.
 */
std::optional<sockaddr_in> resolve_endpoint(const std::string& host_port);

/// Render an IPv4 socket address as "a.b.c.d:port".
std::string endpoint_to_string(const sockaddr_in& addr);

/**
 * @brief Owning wrapper around a non-blocking IPv4 UDP socket.
 *
 * Setup failures throw std::system_error; per-datagram failures are returned
 * to the caller so transports can surface them through drain_errors().
 */
class UdpSocket {
public:
    struct Received {
        sockaddr_in from{};
        std::string bytes;
    };

    /// Bind to @p address ("host:port", port 0 picks an ephemeral one).
    static UdpSocket bind_to(const std::string& address);

    /// Unbound socket for the connecting side; the kernel assigns a port on first send.
    static UdpSocket open();

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    ~UdpSocket();

    int fd() const { return fd_; }

    /// Locally bound address (useful after binding port 0).
    sockaddr_in local_endpoint() const;

    /// Wait up to @p timeout for readability. Zero polls without blocking.
    bool wait_readable(std::chrono::steady_clock::duration timeout) const;

    /**
     * @brief Read one datagram if available.
     * @param max_bytes Receive buffer size; longer datagrams are truncated.
     * @param error Set when the read fails for a reason other than "nothing queued".
     */
    std::optional<Received> receive(std::size_t max_bytes, std::string& error) const;

    /// Send @p bytes to @p to. Returns false and fills @p error on failure.
    bool send_to(const sockaddr_in& to, const std::string& bytes, std::string& error) const;

private:
    explicit UdpSocket(int fd) : fd_(fd) {}
    void reset();

    int fd_ = -1;
};

} // namespace tickprobe::net
