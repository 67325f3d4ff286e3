#pragma once

#include "hamgate/config.hpp"
#include "hamgate/ip_address.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hamgate {

// Result of admission check
enum class Admit : std::uint8_t {
    Allow,   // Source is under its limit, request allowed
    Drop     // Source exhausted its window, request dropped
};

// Clock abstraction for testing
// Default uses steady_clock, tests can inject fake clock
using Clock = std::function<std::chrono::steady_clock::time_point()>;

inline std::chrono::steady_clock::time_point default_clock() {
    return std::chrono::steady_clock::now();
}

// Request counter for a single source.
//
// Keeps the acceptance timestamps of the current window (at most
// max_requests of them). Stale timestamps are only evicted once a full
// window has passed since the previous eviction, which bounds eviction work
// per request.
//
// Thread safety: thread-safe (internal mutex).
class RateLimiter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    RateLimiter(std::uint32_t max_requests, Duration window, TimePoint now);

    // Record a request at `now`.
    // Allow iff fewer than max_requests live timestamps remain in the window.
    Admit allow_request(TimePoint now);

    // Time of the last allow_request() call (accepted or not)
    [[nodiscard]] TimePoint last_accessed() const;

    // Timestamps currently held
    [[nodiscard]] std::size_t live_count() const;

private:
    void evict_expired(TimePoint now);

    const std::uint32_t max_requests_;
    const Duration window_;

    mutable std::mutex mutex_;
    std::deque<TimePoint> accepted_;
    TimePoint last_eviction_;
    TimePoint last_accessed_;
};

// Per-source rate limiting keyed by sender IP address.
//
// Invariants enforced:
// - Bounds each source to max_requests per window
// - Bounds state growth: sources idle longer than expiry are swept
//
// Thread safety: thread-safe. Sources are spread over independently locked
// shards, so unrelated senders rarely contend.
class SourceRateLimiter {
public:
    explicit SourceRateLimiter(std::uint32_t max_requests,
                               RateLimiterConfig config = {},
                               Clock clock = default_clock);

    // Check if a request from this source should be admitted.
    // Creates the source's limiter on first sight.
    Admit admit(const IpAddress& source);

    // Drop every source idle for longer than config.expiry.
    // Returns the number of sources removed.
    std::size_t sweep();

    // sweep() if config.sweep_interval has elapsed since the last sweep.
    // Returns true if a sweep ran.
    bool maybe_sweep();

    [[nodiscard]] std::size_t tracked_count() const;
    [[nodiscard]] bool is_tracked(const IpAddress& source) const;

    [[nodiscard]] std::uint32_t max_requests() const noexcept { return max_requests_; }

    // Metrics
    [[nodiscard]] std::uint64_t total_admits() const noexcept { return total_admits_.load(); }
    [[nodiscard]] std::uint64_t total_drops() const noexcept { return total_drops_.load(); }
    [[nodiscard]] std::uint64_t eviction_count() const noexcept { return eviction_count_.load(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<IpAddress, std::shared_ptr<RateLimiter>> limiters;
    };

    Shard& shard_for(const IpAddress& key);
    const Shard& shard_for(const IpAddress& key) const;

    const std::uint32_t max_requests_;
    RateLimiterConfig config_;
    Clock clock_;
    std::vector<Shard> shards_;

    std::mutex sweep_mutex_;
    std::chrono::steady_clock::time_point last_sweep_;

    // Metrics
    std::atomic<std::uint64_t> total_admits_{0};
    std::atomic<std::uint64_t> total_drops_{0};
    std::atomic<std::uint64_t> eviction_count_{0};
};

}  // namespace hamgate
