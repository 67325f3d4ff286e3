#include "hamgate/server_lifecycle.hpp"

#include <exception>
#include <utility>

namespace hamgate {

ServerLifecycle::ServerLifecycle(UniqueFd socket,
                                 std::size_t buffer_size,
                                 ReceiveLoop loop,
                                 Logger& logger,
                                 std::chrono::milliseconds stop_timeout)
    : buffer_size_(buffer_size)
    , loop_(std::move(loop))
    , logger_(logger)
    , stop_timeout_(stop_timeout)
    , socket_(std::move(socket)) {}

ServerLifecycle::~ServerLifecycle() {
    dispose();
}

LifecycleResult ServerLifecycle::start(std::optional<std::stop_source> source) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == LifecycleState::Disposed) {
        return LifecycleResult::Disposed;
    }
    if (state_ == LifecycleState::Running) {
        return LifecycleResult::AlreadyRunning;
    }

    // A loop that outlived the previous stop() has been told to exit
    join_loop();

    stop_source_ = source ? std::move(*source) : std::stop_source{};

    std::packaged_task<void()> task(
        [this, fd = socket_.get(), token = stop_source_->get_token()] {
            loop_(fd, token);
        });
    loop_done_ = task.get_future();
    loop_thread_ = std::thread(std::move(task));

    state_ = LifecycleState::Running;
    return LifecycleResult::Ok;
}

LifecycleResult ServerLifecycle::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == LifecycleState::Disposed) {
        return LifecycleResult::Disposed;
    }
    if (state_ != LifecycleState::Running) {
        return LifecycleResult::NotRunning;
    }

    stop_source_->request_stop();

    if (loop_done_.wait_for(stop_timeout_) == std::future_status::ready) {
        collect_loop_result();
        loop_thread_.join();
    } else {
        logf(logger_, Severity::Warn, "receive loop still running %lld ms after stop",
             static_cast<long long>(stop_timeout_.count()));
    }

    state_ = LifecycleState::Stopped;
    return LifecycleResult::Ok;
}

void ServerLifecycle::dispose() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == LifecycleState::Disposed) {
        return;
    }

    if (stop_source_) {
        stop_source_->request_stop();
    }
    join_loop();

    socket_.reset();
    stop_source_.reset();
    state_ = LifecycleState::Disposed;
}

bool ServerLifecycle::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == LifecycleState::Running;
}

LifecycleState ServerLifecycle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Endpoint> ServerLifecycle::local_endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_.valid()) {
        return std::nullopt;
    }
    return hamgate::local_endpoint(socket_.get());
}

void ServerLifecycle::join_loop() noexcept {
    if (!loop_thread_.joinable()) {
        return;
    }
    loop_thread_.join();
    collect_loop_result();
}

void ServerLifecycle::collect_loop_result() noexcept {
    if (!loop_done_.valid()) {
        return;
    }
    try {
        loop_done_.get();
    } catch (const std::exception& ex) {
        // Faults raised while cancelling are expected
        const bool cancelling = stop_source_ && stop_source_->stop_requested();
        logf(logger_, cancelling ? Severity::Debug : Severity::Error,
             "receive loop ended with error: %s", ex.what());
    }
}

}  // namespace hamgate
