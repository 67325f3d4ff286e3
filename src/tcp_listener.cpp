#include "hamgate/tcp_listener.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>  // memcpy, strerror
#include <exception>
#include <string>
#include <thread>

// Platform headers
#include <sys/socket.h>
#include <sys/types.h>

namespace hamgate {

TcpListener::CreateResult TcpListener::create(const ServerConfig& config,
                                              MessageRouter& router,
                                              const Blacklist& blacklist,
                                              Logger& logger) {
    auto bound = bind_server_socket(SocketKind::Stream, config);
    if (auto* error = std::get_if<SetupError>(&bound)) {
        logf(logger, Severity::Error, "tcp listener on %s port %d: %.*s (errno %d)",
             config.address.c_str(), config.port,
             static_cast<int>(to_string(error->code).size()), to_string(error->code).data(),
             error->sys_errno);
        return *error;
    }

    return std::make_unique<TcpListener>(ConstructToken{},
        std::move(std::get<UniqueFd>(bound)), config, router, blacklist, logger);
}

TcpListener::TcpListener(ConstructToken,
                         UniqueFd socket,
                         const ServerConfig& config,
                         MessageRouter& router,
                         const Blacklist& blacklist,
                         Logger& logger)
    : config_(config)
    , router_(router)
    , blacklist_(blacklist)
    , logger_(logger)
    , pool_()
    , runner_(config.worker_threads, config.max_pending_tasks, logger)
    , lifecycle_(std::make_unique<ServerLifecycle>(
          std::move(socket),
          effective_buffer_size(config, SocketKind::Stream),
          [this](int fd, std::stop_token stop) { accept_loop(fd, std::move(stop)); },
          logger,
          config.stop_timeout)) {}

TcpListener::~TcpListener() {
    dispose();
}

void TcpListener::dispose() noexcept {
    lifecycle_->dispose();
    runner_.shutdown();
}

TcpListenerMetrics TcpListener::metrics() const noexcept {
    return TcpListenerMetrics{
        .accepted = accepted_.load(),
        .no_source = no_source_.load(),
        .blacklisted = blacklisted_.load(),
        .empty = empty_.load(),
        .truncated = truncated_.load(),
        .read_timeouts = read_timeouts_.load(),
        .forwarded = forwarded_.load(),
        .queue_drops = queue_drops_.load(),
        .loop_faults = loop_faults_.load(),
        .transport_errors = transport_errors_.load(),
    };
}

void TcpListener::accept_loop(int fd, std::stop_token stop) {
    if (auto local = hamgate::local_endpoint(fd)) {
        logf(logger_, Severity::Info, "tcp listening on %s", local->to_string().c_str());
    }

    while (!stop.stop_requested()) {
        switch (wait_readable(fd, config_.poll_interval)) {
            case WaitResult::Ready:
                try {
                    accept_one(fd, stop);
                } catch (const std::exception& ex) {
                    ++loop_faults_;
                    logf(logger_, Severity::Error, "tcp accept loop fault: %s", ex.what());
                    std::this_thread::sleep_for(config_.poll_interval);
                } catch (...) {
                    ++loop_faults_;
                    logf(logger_, Severity::Error, "tcp accept loop fault: unknown exception");
                    std::this_thread::sleep_for(config_.poll_interval);
                }
                break;
            case WaitResult::Timeout:
                break;
            case WaitResult::Error:
                ++transport_errors_;
                logf(logger_, Severity::Error, "tcp poll failed: %s", std::strerror(errno));
                std::this_thread::sleep_for(config_.poll_interval);
                break;
        }
    }

    logf(logger_, Severity::Info, "tcp accept loop stopped");
}

void TcpListener::accept_one(int fd, const std::stop_token& stop) {
    sockaddr_storage from{};
    socklen_t from_len = sizeof(from);

    UniqueFd connection(::accept4(fd, reinterpret_cast<sockaddr*>(&from), &from_len,
                                  SOCK_CLOEXEC | SOCK_NONBLOCK));
    if (!connection.valid()) {
        const int err = errno;
        switch (err) {
            case EAGAIN:
#if EWOULDBLOCK != EAGAIN
            case EWOULDBLOCK:
#endif
            case EINTR:
            case ECONNABORTED:
                return;  // peer gave up before we got to it
            case EBADF:
            case ENOTSOCK:
            case EINVAL:
                // Listening socket closed or no longer listening underneath us
                ++transport_errors_;
                logf(logger_, Severity::Warn, "tcp accept on unusable socket: %s", std::strerror(err));
                std::this_thread::sleep_for(config_.poll_interval);
                return;
            default:
                ++transport_errors_;
                logf(logger_, Severity::Error, "tcp accept failed: %s", std::strerror(err));
                return;
        }
    }
    ++accepted_;

    auto peer = endpoint_from_sockaddr(from, from_len);
    auto result = runner_.try_submit(
        [this, connection = std::move(connection), peer, stop]() mutable {
            handle_connection(std::move(connection), peer, stop);
        });

    if (result != SubmitResult::Queued) {
        ++queue_drops_;
        logf(logger_, Severity::Warn, "closing connection from %s: worker queue %s",
             peer ? peer->to_string().c_str() : "unknown peer",
             result == SubmitResult::DroppedQueueFull ? "full" : "shut down");
    }
}

void TcpListener::handle_connection(UniqueFd connection,
                                    std::optional<Endpoint> peer,
                                    const std::stop_token& stop) {
    using Clock = std::chrono::steady_clock;

    if (!peer) {
        ++no_source_;
        logf(logger_, Severity::Warn, "closing connection without a peer address");
        return;
    }
    const std::string peer_text = peer->to_string();

    if (auto label = blacklist_.check(peer->address)) {
        ++blacklisted_;
        logf(logger_, Severity::Warn, "closing connection from blacklisted %s (%s)",
             peer_text.c_str(), label->c_str());
        return;
    }

    // =========================================================================
    // Single read sequence into one buffer
    // =========================================================================

    PooledBuffer buffer = pool_.rent(lifecycle_->buffer_size());
    std::size_t total = 0;
    const auto deadline = Clock::now() + config_.read_timeout;

    while (total < buffer.size() && !stop.stop_requested()) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            ++read_timeouts_;
            if (logger_.enabled(Severity::Debug)) {
                logf(logger_, Severity::Debug, "read timeout on connection from %s after %zu bytes",
                     peer_text.c_str(), total);
            }
            break;
        }

        const WaitResult wait = wait_readable(connection.get(), std::min(remaining, config_.poll_interval));
        if (wait == WaitResult::Timeout) {
            continue;
        }
        if (wait == WaitResult::Error) {
            ++transport_errors_;
            logf(logger_, Severity::Error, "poll failed on connection from %s: %s",
                 peer_text.c_str(), std::strerror(errno));
            break;
        }

        ssize_t n = ::recv(connection.get(), buffer.data() + total, buffer.size() - total, 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            ++transport_errors_;
            logf(logger_, Severity::Error, "read failed on connection from %s: %s",
                 peer_text.c_str(), std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // peer finished sending
        }
        total += static_cast<std::size_t>(n);
    }

    if (stop.stop_requested()) {
        if (logger_.enabled(Severity::Debug)) {
            logf(logger_, Severity::Debug, "abandoning connection from %s: stopping", peer_text.c_str());
        }
        return;
    }

    if (total == buffer.size()) {
        std::byte probe{};
        if (::recv(connection.get(), &probe, 1, MSG_PEEK | MSG_DONTWAIT) > 0) {
            ++truncated_;
            logf(logger_, Severity::Warn, "message from %s exceeds %zu-byte buffer; truncated",
                 peer_text.c_str(), buffer.size());
        }
    }

    connection.reset();

    if (total == 0) {
        ++empty_;
        logf(logger_, Severity::Warn, "no data received from %s", peer_text.c_str());
        return;
    }

    if (logger_.enabled(Severity::Debug)) {
        logf(logger_, Severity::Debug, "received %zu bytes from %s", total, peer_text.c_str());
    }

    PooledBuffer message = pool_.rent(total);
    std::memcpy(message.data(), buffer.data(), total);
    buffer.release();

    ++forwarded_;
    router_.route(message.span(), *peer, stop);
}

}  // namespace hamgate
