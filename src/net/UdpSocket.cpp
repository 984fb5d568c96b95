// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/UdpSocket.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace tickprobe::net {
namespace {

bool split_host_port(const std::string& text, std::string& host, std::string& port) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) return false;
    host = text.substr(0, colon);
    port = text.substr(colon + 1);
    return true;
}

int make_nonblocking_udp() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket(AF_INET, SOCK_DGRAM)");
    }
    return fd;
}

} // namespace

std::optional<sockaddr_in> resolve_endpoint(const std::string& host_port) {
    std::string host, port;
    if (!split_host_port(host_port, host, port)) return std::nullopt;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), port.c_str(), &hints, &res) != 0 || !res) {
        return std::nullopt;
    }
    sockaddr_in out{};
    std::memcpy(&out, res->ai_addr, sizeof(out));
    ::freeaddrinfo(res);
    return out;
}

std::string endpoint_to_string(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

UdpSocket UdpSocket::bind_to(const std::string& address) {
    auto endpoint = resolve_endpoint(address);
    if (!endpoint) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "cannot resolve address " + address);
    }
    UdpSocket sock(make_nonblocking_udp());
    int one = 1;
    (void)::setsockopt(sock.fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(sock.fd_, reinterpret_cast<const sockaddr*>(&*endpoint), sizeof(*endpoint)) != 0) {
        throw std::system_error(errno, std::generic_category(), "bind " + address);
    }
    return sock;
}

UdpSocket UdpSocket::open() {
    return UdpSocket(make_nonblocking_udp());
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

UdpSocket::~UdpSocket() {
    reset();
}

void UdpSocket::reset() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

sockaddr_in UdpSocket::local_endpoint() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        throw std::system_error(errno, std::generic_category(), "getsockname");
    }
    return addr;
}

bool UdpSocket::wait_readable(std::chrono::steady_clock::duration timeout) const {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, ms > 0 ? static_cast<int>(ms) : 0);
    return rc > 0 && (pfd.revents & POLLIN);
}

std::optional<UdpSocket::Received> UdpSocket::receive(std::size_t max_bytes, std::string& error) const {
    std::vector<char> buf(max_bytes);
    Received out;
    socklen_t len = sizeof(out.from);
    const ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0,
                                 reinterpret_cast<sockaddr*>(&out.from), &len);
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            error = std::string("recvfrom failed: ") + std::strerror(errno);
        }
        return std::nullopt;
    }
    out.bytes.assign(buf.data(), static_cast<std::size_t>(n));
    return out;
}

bool UdpSocket::send_to(const sockaddr_in& to, const std::string& bytes, std::string& error) const {
    const ssize_t n = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                               reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    if (n < 0) {
        error = "sendto " + endpoint_to_string(to) + " failed: " + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace tickprobe::net
