#include "hamgate/udp_listener.hpp"

#include "hamgate/socket.hpp"

#include <cerrno>
#include <cstring>  // memcpy, strerror
#include <exception>
#include <thread>

// Platform headers
#include <sys/socket.h>
#include <sys/types.h>

namespace hamgate {

UdpListener::CreateResult UdpListener::create(const ServerConfig& config,
                                              MessageRouter& router,
                                              const Blacklist& blacklist,
                                              Logger& logger,
                                              Clock clock) {
    auto bound = bind_server_socket(SocketKind::Datagram, config);
    if (auto* error = std::get_if<SetupError>(&bound)) {
        logf(logger, Severity::Error, "udp listener on %s port %d: %.*s (errno %d)",
             config.address.c_str(), config.port,
             static_cast<int>(to_string(error->code).size()), to_string(error->code).data(),
             error->sys_errno);
        return *error;
    }

    return std::make_unique<UdpListener>(ConstructToken{},
        std::move(std::get<UniqueFd>(bound)), config, router, blacklist, logger, std::move(clock));
}

UdpListener::UdpListener(ConstructToken,
                         UniqueFd socket,
                         const ServerConfig& config,
                         MessageRouter& router,
                         const Blacklist& blacklist,
                         Logger& logger,
                         Clock clock)
    : config_(config)
    , router_(router)
    , blacklist_(blacklist)
    , logger_(logger)
    , limiter_(config.requests_per_minute_per_source, config.rate_limiter, std::move(clock))
    , pool_()
    , runner_(config.worker_threads, config.max_pending_tasks, logger)
    , lifecycle_(std::make_unique<ServerLifecycle>(
          std::move(socket),
          effective_buffer_size(config, SocketKind::Datagram),
          [this](int fd, std::stop_token stop) { receive_loop(fd, std::move(stop)); },
          logger,
          config.stop_timeout)) {}

UdpListener::~UdpListener() {
    dispose();
}

void UdpListener::dispose() noexcept {
    lifecycle_->dispose();
    runner_.shutdown();
}

UdpListenerMetrics UdpListener::metrics() const noexcept {
    return UdpListenerMetrics{
        .received = received_.load(),
        .no_source = no_source_.load(),
        .blacklisted = blacklisted_.load(),
        .rate_limited = rate_limited_.load(),
        .empty = empty_.load(),
        .oversized = oversized_.load(),
        .queued = queued_.load(),
        .queue_drops = queue_drops_.load(),
        .loop_faults = loop_faults_.load(),
        .transport_errors = transport_errors_.load(),
    };
}

void UdpListener::receive_loop(int fd, std::stop_token stop) {
    if (auto local = hamgate::local_endpoint(fd)) {
        logf(logger_, Severity::Info, "udp listening on %s", local->to_string().c_str());
    }

    while (!stop.stop_requested()) {
        try {
            poll_once(fd, stop);
        } catch (const std::exception& ex) {
            ++loop_faults_;
            logf(logger_, Severity::Error, "udp receive loop fault: %s", ex.what());
            std::this_thread::sleep_for(config_.poll_interval);
        } catch (...) {
            ++loop_faults_;
            logf(logger_, Severity::Error, "udp receive loop fault: unknown exception");
            std::this_thread::sleep_for(config_.poll_interval);
        }
    }

    logf(logger_, Severity::Info, "udp receive loop stopped");
}

void UdpListener::poll_once(int fd, const std::stop_token& stop) {
    // Idle sources are forgotten on the loop's own cadence
    if (limiter_.maybe_sweep() && logger_.enabled(Severity::Debug)) {
        logf(logger_, Severity::Debug, "rate limiter sweep: %zu sources tracked",
             limiter_.tracked_count());
    }

    switch (wait_readable(fd, config_.poll_interval)) {
        case WaitResult::Ready:
            receive_one(fd, stop);
            break;
        case WaitResult::Timeout:
            break;
        case WaitResult::Error:
            ++transport_errors_;
            logf(logger_, Severity::Error, "udp poll failed: %s", std::strerror(errno));
            std::this_thread::sleep_for(config_.poll_interval);
            break;
    }
}

void UdpListener::receive_one(int fd, const std::stop_token& stop) {
    PooledBuffer buffer = pool_.rent(lifecycle_->buffer_size());

    sockaddr_storage from{};
    socklen_t from_len = sizeof(from);

    // MSG_TRUNC: returns the real datagram length even if it did not fit
    ssize_t n = ::recvfrom(fd, buffer.data(), buffer.size(), MSG_TRUNC | MSG_DONTWAIT,
                           reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        ++transport_errors_;
        logf(logger_, Severity::Error, "udp receive failed: %s", std::strerror(errno));
        return;
    }
    ++received_;

    auto source = endpoint_from_sockaddr(from, from_len);
    if (!source) {
        ++no_source_;
        logf(logger_, Severity::Warn, "dropping datagram without a sender address");
        return;
    }

    if (auto label = blacklist_.check(source->address)) {
        ++blacklisted_;
        logf(logger_, Severity::Warn, "dropping datagram from blacklisted %s (%s)",
             source->to_string().c_str(), label->c_str());
        return;
    }

    if (limiter_.admit(source->address) == Admit::Drop) {
        ++rate_limited_;
        logf(logger_, Severity::Warn, "rate limit exceeded by %s", source->to_string().c_str());
        return;
    }

    if (n == 0) {
        ++empty_;
        logf(logger_, Severity::Warn, "dropping empty datagram from %s", source->to_string().c_str());
        return;
    }

    const auto length = static_cast<std::size_t>(n);
    if (length > buffer.size()) {
        ++oversized_;
        logf(logger_, Severity::Warn, "dropping %zu-byte datagram from %s: buffer is %zu bytes",
             length, source->to_string().c_str(), buffer.size());
        return;
    }

    if (logger_.enabled(Severity::Debug)) {
        logf(logger_, Severity::Debug, "received %zu bytes from %s", length, source->to_string().c_str());
    }

    // Copy exactly the received range; the receive buffer goes straight back
    PooledBuffer message = pool_.rent(length);
    std::memcpy(message.data(), buffer.data(), length);
    buffer.release();

    const Endpoint sender = *source;
    auto result = runner_.try_submit(
        [this, message = std::move(message), sender, stop]() mutable {
            router_.route(message.span(), sender, stop);
        });

    if (result == SubmitResult::Queued) {
        ++queued_;
    } else {
        ++queue_drops_;
        logf(logger_, Severity::Warn, "dropping datagram from %s: worker queue %s",
             sender.to_string().c_str(),
             result == SubmitResult::DroppedQueueFull ? "full" : "shut down");
    }
}

}  // namespace hamgate
