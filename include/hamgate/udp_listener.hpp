#pragma once

#include "hamgate/blacklist.hpp"
#include "hamgate/buffer_pool.hpp"
#include "hamgate/config.hpp"
#include "hamgate/log.hpp"
#include "hamgate/message_router.hpp"
#include "hamgate/rate_limiter.hpp"
#include "hamgate/server_lifecycle.hpp"
#include "hamgate/task_runner.hpp"
#include "hamgate/validate_config.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <variant>

namespace hamgate {

// Counters for the UDP receive path
struct UdpListenerMetrics {
    std::uint64_t received = 0;          // datagrams read from the socket
    std::uint64_t no_source = 0;         // sender address unusable
    std::uint64_t blacklisted = 0;
    std::uint64_t rate_limited = 0;
    std::uint64_t empty = 0;             // zero-length datagrams
    std::uint64_t oversized = 0;         // larger than the receive buffer
    std::uint64_t queued = 0;            // handed to the router
    std::uint64_t queue_drops = 0;       // worker queue full
    std::uint64_t loop_faults = 0;       // exceptions caught and survived by the loop
    std::uint64_t transport_errors = 0;  // poll()/recvfrom() failures
};

// ============================================================================
// UdpListener
//
// One datagram = one candidate message. Per datagram, in order:
//   sender address -> blacklist -> rate limit -> empty -> oversize
// then a right-sized copy is routed on a worker thread.
//
// Invariants enforced:
// - The receive loop never waits on message processing
// - Oversized datagrams are dropped whole
// - Every rented buffer returns to the pool on every path
//
// Thread safety: lifecycle calls may come from any thread.
// ============================================================================

class UdpListener {
private:
    struct ConstructToken {
        explicit ConstructToken() = default;
    };

public:
    using CreateResult = std::variant<std::unique_ptr<UdpListener>, SetupError>;

    // Validate, bind, and build the listener. Nothing runs until start().
    // router, blacklist and logger must outlive the listener.
    static CreateResult create(const ServerConfig& config,
                               MessageRouter& router,
                               const Blacklist& blacklist,
                               Logger& logger,
                               Clock clock = default_clock);

    // Use create()
    UdpListener(ConstructToken,
                UniqueFd socket,
                const ServerConfig& config,
                MessageRouter& router,
                const Blacklist& blacklist,
                Logger& logger,
                Clock clock);

    ~UdpListener();

    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    LifecycleResult start(std::optional<std::stop_source> source = std::nullopt) {
        return lifecycle_->start(std::move(source));
    }
    LifecycleResult stop() { return lifecycle_->stop(); }

    // Stop, join the loop and the workers, close the socket. Idempotent.
    void dispose() noexcept;

    [[nodiscard]] bool is_running() const { return lifecycle_->is_running(); }
    [[nodiscard]] LifecycleState state() const { return lifecycle_->state(); }
    [[nodiscard]] std::optional<Endpoint> local_endpoint() const { return lifecycle_->local_endpoint(); }
    [[nodiscard]] std::size_t buffer_size() const noexcept { return lifecycle_->buffer_size(); }

    [[nodiscard]] UdpListenerMetrics metrics() const noexcept;
    [[nodiscard]] const SourceRateLimiter& rate_limiter() const noexcept { return limiter_; }
    [[nodiscard]] const BufferPool& buffer_pool() const noexcept { return pool_; }

private:

    void receive_loop(int fd, std::stop_token stop);
    // One sweep check plus at most one datagram
    void poll_once(int fd, const std::stop_token& stop);
    void receive_one(int fd, const std::stop_token& stop);

    const ServerConfig config_;
    MessageRouter& router_;
    const Blacklist& blacklist_;
    Logger& logger_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> no_source_{0};
    std::atomic<std::uint64_t> blacklisted_{0};
    std::atomic<std::uint64_t> rate_limited_{0};
    std::atomic<std::uint64_t> empty_{0};
    std::atomic<std::uint64_t> oversized_{0};
    std::atomic<std::uint64_t> queued_{0};
    std::atomic<std::uint64_t> queue_drops_{0};
    std::atomic<std::uint64_t> loop_faults_{0};
    std::atomic<std::uint64_t> transport_errors_{0};

    SourceRateLimiter limiter_;
    BufferPool pool_;
    TaskRunner runner_;                          // destroyed before pool_
    std::unique_ptr<ServerLifecycle> lifecycle_; // destroyed first: joins the loop
};

}  // namespace hamgate
