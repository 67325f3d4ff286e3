#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace hamgate {

// Transport a server binds to
enum class SocketKind : std::uint8_t {
    Datagram,  // UDP
    Stream     // TCP
};

// Protocol default buffer sizes (used when ServerConfig::buffer_size is unset)
inline constexpr std::size_t kDefaultDatagramBufferSize = 1500;   // one Ethernet MTU
inline constexpr std::size_t kDefaultStreamBufferSize = 16384;    // one read burst per connection

// Per-source fixed-window rate limiting
// Controls per-source fairness and bounded state growth
struct RateLimiterConfig {
    std::chrono::milliseconds window = std::chrono::minutes(1);
    std::chrono::milliseconds expiry = std::chrono::minutes(15);         // idle time before a source is forgotten
    std::chrono::milliseconds sweep_interval = std::chrono::minutes(5);  // cadence of the idle-source sweep
    std::size_t shard_count = 16;                                         // independent lock domains
};

// Listener configuration. Immutable once a listener has been created from it.
struct ServerConfig {
    std::string address = "::1";             // IPv4 or IPv6 literal
    int port = 0;                            // 1-65535
    std::optional<std::size_t> buffer_size;  // protocol default when unset
    bool reuse_address = true;               // SO_REUSEADDR
    std::uint32_t requests_per_minute_per_source = 60;  // UDP only

    // Detached work (one task per datagram / per connection)
    std::size_t worker_threads = 4;
    std::size_t max_pending_tasks = 1024;    // tasks beyond this are dropped

    // Blocking calls wake up this often to observe cancellation
    std::chrono::milliseconds poll_interval{100};
    // A TCP connection silent for this long ends its read sequence
    std::chrono::milliseconds read_timeout{5000};
    // How long stop() waits for the receive loop to exit
    std::chrono::milliseconds stop_timeout{1000};

    RateLimiterConfig rate_limiter;
};

// Buffer size actually used by a server of the given kind
inline std::size_t effective_buffer_size(const ServerConfig& config, SocketKind kind) noexcept {
    if (config.buffer_size && *config.buffer_size > 0) {
        return *config.buffer_size;
    }
    return kind == SocketKind::Datagram ? kDefaultDatagramBufferSize
                                        : kDefaultStreamBufferSize;
}

}  // namespace hamgate
