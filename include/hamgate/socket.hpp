#pragma once

#include "hamgate/config.hpp"
#include "hamgate/ip_address.hpp"
#include "hamgate/validate_config.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

#include <sys/socket.h>

namespace hamgate {

// Owning file descriptor. Closes exactly once; move-only.
class UniqueFd {
public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    // Give up ownership without closing
    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    // Close the current descriptor (if any) and adopt `fd`
    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

using BindResult = std::variant<UniqueFd, SetupError>;

// Create a socket for the configured address, apply SO_REUSEADDR, bind it
// and (for Stream) start listening. Validates the configuration first, so
// no descriptor is ever created for an invalid one.
BindResult bind_server_socket(SocketKind kind, const ServerConfig& config);

// Address actually bound (resolves port 0)
std::optional<Endpoint> local_endpoint(int fd);

// Convert a kernel-supplied peer address; nullopt for non-IP families
std::optional<Endpoint> endpoint_from_sockaddr(const sockaddr_storage& addr,
                                               socklen_t len) noexcept;

// Fill a sockaddr for sendto()/connect(); returns its length
socklen_t endpoint_to_sockaddr(const Endpoint& endpoint, sockaddr_storage& out) noexcept;

enum class WaitResult : std::uint8_t {
    Ready,     // readable (or peer closed / error pending)
    Timeout,   // nothing within the timeout
    Error      // poll() failed; errno is set
};

// Wait until fd is readable. EINTR counts as a timeout so callers loop
// back to their cancellation check.
WaitResult wait_readable(int fd, std::chrono::milliseconds timeout) noexcept;

}  // namespace hamgate
