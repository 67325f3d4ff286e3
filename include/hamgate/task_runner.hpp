#pragma once

#include "hamgate/log.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace hamgate {

// Move-only nullary callable. Unlike std::function it can own move-only
// captures such as a PooledBuffer.
class Task {
public:
    Task() noexcept = default;

    template <typename F,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Task>>>
    Task(F fn)  // NOLINT(google-explicit-constructor)
        : impl_(std::make_unique<Model<F>>(std::move(fn))) {}

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;

    void operator()() { impl_->run(); }

    explicit operator bool() const noexcept { return impl_ != nullptr; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual void run() = 0;
    };

    template <typename F>
    struct Model final : Concept {
        explicit Model(F fn) : fn_(std::move(fn)) {}
        void run() override { fn_(); }
        F fn_;
    };

    std::unique_ptr<Concept> impl_;
};

// Result of attempting to hand work to the runner
enum class SubmitResult : std::uint8_t {
    Queued,
    DroppedQueueFull,   // backlog at capacity
    DroppedShutdown,    // runner no longer accepts work
};

// ============================================================================
// TaskRunner
//
// Fixed worker pool fed by a bounded ring buffer. Work that does not fit is
// dropped rather than queued without bound; a dropped Task is destroyed
// immediately, releasing whatever it owned.
//
// Invariants enforced:
// - Pending tasks bounded by capacity
// - A task that throws is logged; the worker keeps running
//
// Thread safety: try_submit() may be called from any thread.
// ============================================================================

class TaskRunner {
public:
    TaskRunner(std::size_t worker_count, std::size_t capacity, Logger& logger);
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // Non-blocking: returns immediately with result
    [[nodiscard]] SubmitResult try_submit(Task task);

    // Stop accepting work, discard queued tasks, join workers.
    // Tasks already running are allowed to finish. Idempotent.
    void shutdown() noexcept;

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

    // Metrics
    [[nodiscard]] std::uint64_t total_executed() const noexcept { return executed_.load(); }
    [[nodiscard]] std::uint64_t total_dropped() const noexcept { return dropped_.load(); }
    [[nodiscard]] std::uint64_t total_failed() const noexcept { return failed_.load(); }

private:
    void worker_main() noexcept;

    Logger& logger_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::vector<Task> ring_;
    std::size_t head_ = 0;   // index of next task to run
    std::size_t tail_ = 0;   // index of next free slot
    std::size_t size_ = 0;   // queued tasks
    bool accepting_ = true;

    std::vector<std::thread> workers_;
    std::atomic<bool> shut_down_{false};

    std::atomic<std::uint64_t> executed_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_{0};
};

}  // namespace hamgate
