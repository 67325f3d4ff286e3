#include "hamgate/task_runner.hpp"

#include <exception>

namespace hamgate {

TaskRunner::TaskRunner(std::size_t worker_count, std::size_t capacity, Logger& logger)
    : logger_(logger)
    , capacity_(capacity > 0 ? capacity : 1)
    , ring_(capacity_) {
    const std::size_t count = worker_count > 0 ? worker_count : 1;
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_main(); });
    }
}

TaskRunner::~TaskRunner() {
    shutdown();
}

SubmitResult TaskRunner::try_submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            ++dropped_;
            return SubmitResult::DroppedShutdown;
        }
        if (size_ >= capacity_) {
            ++dropped_;
            return SubmitResult::DroppedQueueFull;
        }
        ring_[tail_] = std::move(task);
        tail_ = (tail_ + 1) % capacity_;
        ++size_;
    }
    ready_.notify_one();
    return SubmitResult::Queued;
}

void TaskRunner::shutdown() noexcept {
    if (shut_down_.exchange(true)) {
        return;
    }

    std::vector<Task> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;

        // Destroy queued work outside the lock
        discarded.reserve(size_);
        while (size_ > 0) {
            discarded.push_back(std::move(ring_[head_]));
            head_ = (head_ + 1) % capacity_;
            --size_;
        }
    }
    ready_.notify_all();

    dropped_ += discarded.size();
    discarded.clear();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t TaskRunner::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

void TaskRunner::worker_main() noexcept {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return size_ > 0 || !accepting_; });
            if (size_ == 0) {
                return;  // shut down and drained
            }
            task = std::move(ring_[head_]);
            head_ = (head_ + 1) % capacity_;
            --size_;
        }

        try {
            task();
            ++executed_;
        } catch (const std::exception& ex) {
            ++failed_;
            logf(logger_, Severity::Error, "task failed: %s", ex.what());
        } catch (...) {
            ++failed_;
            logf(logger_, Severity::Error, "task failed: unknown exception");
        }
    }
}

}  // namespace hamgate
