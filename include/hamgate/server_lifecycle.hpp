#pragma once

#include "hamgate/ip_address.hpp"
#include "hamgate/log.hpp"
#include "hamgate/socket.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

namespace hamgate {

enum class LifecycleState : std::uint8_t {
    Stopped,
    Running,
    Disposed,   // terminal
};

// Outcome of start()/stop(). Anything but Ok is caller misuse.
enum class [[nodiscard]] LifecycleResult : std::uint8_t {
    Ok,
    AlreadyRunning,   // start() while Running
    NotRunning,       // stop() while Stopped
    Disposed,         // any call after dispose()
};

constexpr std::string_view to_string(LifecycleResult r) noexcept {
    switch (r) {
        case LifecycleResult::Ok:             return "ok";
        case LifecycleResult::AlreadyRunning: return "already running";
        case LifecycleResult::NotRunning:     return "not running";
        case LifecycleResult::Disposed:       return "disposed";
    }
    return "unknown";
}

constexpr std::string_view to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::Stopped:  return "stopped";
        case LifecycleState::Running:  return "running";
        case LifecycleState::Disposed: return "disposed";
    }
    return "unknown";
}

// Protocol-specific receive loop. Runs on the lifecycle's loop thread and
// must return soon after `stop` is requested.
using ReceiveLoop = std::function<void(int fd, std::stop_token stop)>;

// ============================================================================
// ServerLifecycle
//
// Owns one bound socket and the thread running a ReceiveLoop over it.
//
//   Stopped --start()--> Running --stop()--> Stopped
//   any     --dispose()--> Disposed
//
// stop() waits at most stop_timeout for the loop to exit. A loop that is
// still running then is joined by the next start() or by dispose().
//
// Thread safety: all members may be called concurrently; transitions are
// serialized by one mutex.
// ============================================================================

class ServerLifecycle {
public:
    ServerLifecycle(UniqueFd socket,
                    std::size_t buffer_size,
                    ReceiveLoop loop,
                    Logger& logger,
                    std::chrono::milliseconds stop_timeout = std::chrono::seconds(1));
    ~ServerLifecycle();

    ServerLifecycle(const ServerLifecycle&) = delete;
    ServerLifecycle& operator=(const ServerLifecycle&) = delete;

    // Launch the loop bound to `source` (or a fresh stop_source).
    LifecycleResult start(std::optional<std::stop_source> source = std::nullopt);

    // Request stop and wait for the loop (bounded by stop_timeout).
    LifecycleResult stop();

    // Stop if running, join the loop, close the socket. Idempotent.
    void dispose() noexcept;

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] LifecycleState state() const;

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_size_; }

    // Bound address; nullopt once disposed
    [[nodiscard]] std::optional<Endpoint> local_endpoint() const;

private:
    // Caller holds mutex_
    void join_loop() noexcept;
    void collect_loop_result() noexcept;

    const std::size_t buffer_size_;
    const ReceiveLoop loop_;
    Logger& logger_;
    const std::chrono::milliseconds stop_timeout_;

    mutable std::mutex mutex_;
    LifecycleState state_ = LifecycleState::Stopped;
    UniqueFd socket_;
    std::optional<std::stop_source> stop_source_;
    std::thread loop_thread_;
    std::future<void> loop_done_;
};

}  // namespace hamgate
