#include "hamgate/socket.hpp"

#include <cerrno>
#include <cstring>  // memset, memcpy
#include <utility>

// Platform headers
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace hamgate {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

socklen_t endpoint_to_sockaddr(const Endpoint& endpoint, sockaddr_storage& out) noexcept {
    std::memset(&out, 0, sizeof(out));

    if (endpoint.address.is_v4()) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&out);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(endpoint.port);
        std::memcpy(&sin->sin_addr.s_addr, endpoint.address.bytes().data(), 4);
        return sizeof(sockaddr_in);
    }

    auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
    sin6->sin6_family = AF_INET6;
    sin6->sin6_port = htons(endpoint.port);
    std::memcpy(sin6->sin6_addr.s6_addr, endpoint.address.bytes().data(), 16);
    return sizeof(sockaddr_in6);
}

std::optional<Endpoint> endpoint_from_sockaddr(const sockaddr_storage& addr,
                                               socklen_t len) noexcept {
    if (addr.ss_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&addr);
        return Endpoint{
            .address = IpAddress::v4(ntohl(sin->sin_addr.s_addr)),
            .port = ntohs(sin->sin_port)
        };
    }

    if (addr.ss_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        std::array<std::uint8_t, 16> bytes{};
        std::memcpy(bytes.data(), sin6->sin6_addr.s6_addr, bytes.size());
        return Endpoint{
            .address = IpAddress::v6(bytes),
            .port = ntohs(sin6->sin6_port)
        };
    }

    return std::nullopt;
}

BindResult bind_server_socket(SocketKind kind, const ServerConfig& config) {
    if (auto error = validate_server_config(config, kind == SocketKind::Datagram)) {
        return SetupError{.code = *error};
    }

    // validate_server_config() guarantees both of these
    const Endpoint local{
        .address = *IpAddress::parse(config.address),
        .port = static_cast<std::uint16_t>(config.port)
    };

    const int family = local.address.is_v4() ? AF_INET : AF_INET6;
    const int type = (kind == SocketKind::Datagram ? SOCK_DGRAM : SOCK_STREAM) | SOCK_CLOEXEC;

    UniqueFd fd(::socket(family, type, 0));
    if (!fd.valid()) {
        return SetupError{.code = SetupErrorCode::SocketFailed, .sys_errno = errno};
    }

    if (config.reuse_address) {
        int opt = 1;
        if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            return SetupError{.code = SetupErrorCode::SocketOptionFailed, .sys_errno = errno};
        }
    }

    sockaddr_storage addr{};
    socklen_t addr_len = endpoint_to_sockaddr(local, addr);
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
        return SetupError{.code = SetupErrorCode::BindFailed, .sys_errno = errno};
    }

    if (kind == SocketKind::Stream && ::listen(fd.get(), SOMAXCONN) < 0) {
        return SetupError{.code = SetupErrorCode::ListenFailed, .sys_errno = errno};
    }

    return BindResult{std::move(fd)};
}

std::optional<Endpoint> local_endpoint(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return std::nullopt;
    }
    return endpoint_from_sockaddr(addr, len);
}

WaitResult wait_readable(int fd, std::chrono::milliseconds timeout) noexcept {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        return errno == EINTR ? WaitResult::Timeout : WaitResult::Error;
    }
    if (rc == 0) {
        return WaitResult::Timeout;
    }
    if (pfd.revents & POLLNVAL) {
        errno = EBADF;
        return WaitResult::Error;
    }
    return WaitResult::Ready;
}

}  // namespace hamgate
