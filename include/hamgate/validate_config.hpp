#pragma once

#include "hamgate/config.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace hamgate {

// ============================================================================
// Listener setup errors
//
// Everything that can go wrong before a listener exists. Reported from
// create(), never from start().
// ============================================================================

enum class SetupErrorCode : std::uint8_t {
    InvalidAddress,      // not an IPv4/IPv6 literal
    InvalidPort,         // outside 1-65535
    InvalidBufferSize,   // larger than kMaxBufferSize
    InvalidRateLimit,    // zero requests per minute, or zero window
    InvalidWorkerCount,  // zero workers or zero pending-task capacity
    SocketFailed,        // socket() failed
    SocketOptionFailed,  // setsockopt() failed
    BindFailed,          // bind() failed
    ListenFailed,        // listen() failed
};

struct SetupError {
    SetupErrorCode code;
    int sys_errno = 0;   // errno for the OS-level codes, 0 otherwise
};

inline constexpr std::size_t kMaxBufferSize = 16 * 1024 * 1024;

constexpr std::string_view to_string(SetupErrorCode code) noexcept {
    switch (code) {
        case SetupErrorCode::InvalidAddress:     return "invalid address";
        case SetupErrorCode::InvalidPort:        return "port must be between 1 and 65535";
        case SetupErrorCode::InvalidBufferSize:  return "buffer size too large";
        case SetupErrorCode::InvalidRateLimit:   return "invalid rate limit";
        case SetupErrorCode::InvalidWorkerCount: return "invalid worker configuration";
        case SetupErrorCode::SocketFailed:       return "socket creation failed";
        case SetupErrorCode::SocketOptionFailed: return "socket option failed";
        case SetupErrorCode::BindFailed:         return "bind failed";
        case SetupErrorCode::ListenFailed:       return "listen failed";
    }
    return "unknown";
}

// Checks that need no OS resources.
// Returns nullopt when the configuration can be handed to bind_server_socket().
// rate_limited: also check the per-source limit (UDP listeners)
std::optional<SetupErrorCode> validate_server_config(
    const ServerConfig& config,
    bool rate_limited
) noexcept;

// Port range check: 1-65535
constexpr bool validate_port(int port) noexcept {
    return port >= 1 && port <= 65535;
}

}  // namespace hamgate
