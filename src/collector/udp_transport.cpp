#include "collector/udp_transport.hpp"
#include "collector/collector_type.h"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <arpa/inet.h>
#include <cerrno>     // errno
#include <cstring>    // strerror
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

constexpr std::size_t kMaxDatagram = 65535;

bool isUnreachable(int err)
{
    return err == ECONNREFUSED || err == EHOSTUNREACH || err == ENETUNREACH ||
           err == EHOSTDOWN || err == ENETDOWN;
}

} // namespace

UdpTransport::UdpTransport(const std::string& host, std::uint16_t port)
    : peer_(fmt::format("{}:{}", host, port))
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* res = nullptr;
    const auto service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw CollectError(ErrorKind::ConnectivityTimeout,
                           fmt::format("cannot resolve {}: {}", host, gai_strerror(rc)));
    }

    int lastErr = 0;
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            lastErr = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        lastErr = errno;
        ::close(fd);
    }
    freeaddrinfo(res);

    if (fd_ < 0) {
        throw CollectError(ErrorKind::ConnectivityTimeout,
                           fmt::format("cannot open udp socket to {}: {}", peer_, strerror(lastErr)));
    }
    spdlog::trace("UdpTransport: opened fd {} to {}", fd_, peer_);
}

UdpTransport::~UdpTransport()
{
    if (fd_ >= 0) {
        ::close(fd_);
        spdlog::trace("UdpTransport: closed fd {} to {}", fd_, peer_);
    }
}

void UdpTransport::send(const std::vector<std::uint8_t>& datagram)
{
    ssize_t n = ::send(fd_, datagram.data(), datagram.size(), 0);
    if (n < 0) {
        int err = errno;
        throw CollectError(isUnreachable(err) ? ErrorKind::ConnectivityTimeout : ErrorKind::ProtocolError,
                           fmt::format("send to {} failed: {}", peer_, strerror(err)));
    }
    if (static_cast<std::size_t>(n) != datagram.size()) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("short send to {}: {} of {} bytes", peer_, n, datagram.size()));
    }
}

std::optional<std::vector<std::uint8_t>> UdpTransport::receive(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::nullopt;

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw CollectError(ErrorKind::ProtocolError,
                               fmt::format("poll on {} failed: {}", peer_, strerror(errno)));
        }
        if (rc == 0) return std::nullopt;

        std::vector<std::uint8_t> buf(kMaxDatagram);
        ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
        if (n < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) continue;
            throw CollectError(isUnreachable(err) ? ErrorKind::ConnectivityTimeout : ErrorKind::ProtocolError,
                               fmt::format("receive from {} failed: {}", peer_, strerror(err)));
        }
        buf.resize(static_cast<std::size_t>(n));
        return buf;
    }
}

TransportFactory UdpTransport::factory()
{
    return [](const std::string& host, std::uint16_t port) -> std::unique_ptr<DatagramTransport> {
        return std::make_unique<UdpTransport>(host, port);
    };
}
