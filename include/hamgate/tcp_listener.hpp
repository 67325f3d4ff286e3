#pragma once

#include "hamgate/blacklist.hpp"
#include "hamgate/buffer_pool.hpp"
#include "hamgate/config.hpp"
#include "hamgate/log.hpp"
#include "hamgate/message_router.hpp"
#include "hamgate/server_lifecycle.hpp"
#include "hamgate/socket.hpp"
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

// Counters for the TCP accept and connection paths
struct TcpListenerMetrics {
    std::uint64_t accepted = 0;
    std::uint64_t no_source = 0;         // peer address unusable
    std::uint64_t blacklisted = 0;       // closed without reading
    std::uint64_t empty = 0;             // closed without sending anything
    std::uint64_t truncated = 0;         // more data than one buffer
    std::uint64_t read_timeouts = 0;     // read sequence ended by read_timeout
    std::uint64_t forwarded = 0;         // handed to the router
    std::uint64_t queue_drops = 0;       // worker queue full
    std::uint64_t loop_faults = 0;       // exceptions caught and survived by the loop
    std::uint64_t transport_errors = 0;  // poll()/accept()/recv() failures
};

// ============================================================================
// TcpListener
//
// Unframed: each connection carries one message, read until the peer stops
// sending, the buffer fills, or read_timeout passes. Excess bytes are not
// read (the message is truncated and a warning logged).
//
// Invariants enforced:
// - The accept loop never waits on a connection
// - A blacklisted peer is closed before any byte is read
// - The connection is closed on every path, before routing
//
// Thread safety: lifecycle calls may come from any thread.
// ============================================================================

class TcpListener {
private:
    struct ConstructToken {
        explicit ConstructToken() = default;
    };

public:
    using CreateResult = std::variant<std::unique_ptr<TcpListener>, SetupError>;

    // Validate, bind, listen, and build the listener. Nothing runs until start().
    // router, blacklist and logger must outlive the listener.
    static CreateResult create(const ServerConfig& config,
                               MessageRouter& router,
                               const Blacklist& blacklist,
                               Logger& logger);

    // Use create()
    TcpListener(ConstructToken,
                UniqueFd socket,
                const ServerConfig& config,
                MessageRouter& router,
                const Blacklist& blacklist,
                Logger& logger);

    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

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

    [[nodiscard]] TcpListenerMetrics metrics() const noexcept;
    [[nodiscard]] const BufferPool& buffer_pool() const noexcept { return pool_; }

private:

    void accept_loop(int fd, std::stop_token stop);
    void accept_one(int fd, const std::stop_token& stop);

    // Runs on a worker; owns the connection until it returns
    void handle_connection(UniqueFd connection,
                           std::optional<Endpoint> peer,
                           const std::stop_token& stop);

    const ServerConfig config_;
    MessageRouter& router_;
    const Blacklist& blacklist_;
    Logger& logger_;

    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> no_source_{0};
    std::atomic<std::uint64_t> blacklisted_{0};
    std::atomic<std::uint64_t> empty_{0};
    std::atomic<std::uint64_t> truncated_{0};
    std::atomic<std::uint64_t> read_timeouts_{0};
    std::atomic<std::uint64_t> forwarded_{0};
    std::atomic<std::uint64_t> queue_drops_{0};
    std::atomic<std::uint64_t> loop_faults_{0};
    std::atomic<std::uint64_t> transport_errors_{0};

    BufferPool pool_;
    TaskRunner runner_;                          // destroyed before pool_
    std::unique_ptr<ServerLifecycle> lifecycle_; // destroyed first: joins the loop
};

}  // namespace hamgate
