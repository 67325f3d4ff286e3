#include "hamgate/rate_limiter.hpp"

namespace hamgate {

// ============================================================================
// RateLimiter Implementation
// ============================================================================

RateLimiter::RateLimiter(std::uint32_t max_requests, Duration window, TimePoint now)
    : max_requests_(max_requests)
    , window_(window)
    , last_eviction_(now)
    , last_accessed_(now) {}

Admit RateLimiter::allow_request(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_accessed_ = now;

    evict_expired(now);

    if (accepted_.size() >= max_requests_) {
        return Admit::Drop;
    }

    accepted_.push_back(now);
    return Admit::Allow;
}

void RateLimiter::evict_expired(TimePoint now) {
    // Only evict once a full window has passed since the last eviction
    if (now - last_eviction_ <= window_) {
        return;
    }

    const TimePoint cutoff = now - window_;
    while (!accepted_.empty() && accepted_.front() < cutoff) {
        accepted_.pop_front();
    }
    last_eviction_ = now;
}

RateLimiter::TimePoint RateLimiter::last_accessed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_accessed_;
}

std::size_t RateLimiter::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_.size();
}

// ============================================================================
// SourceRateLimiter Implementation
// ============================================================================

SourceRateLimiter::SourceRateLimiter(std::uint32_t max_requests,
                                     RateLimiterConfig config,
                                     Clock clock)
    : max_requests_(max_requests)
    , config_(config)
    , clock_(std::move(clock))
    , shards_(config.shard_count > 0 ? config.shard_count : 1)
    , last_sweep_(clock_()) {}

SourceRateLimiter::Shard& SourceRateLimiter::shard_for(const IpAddress& key) {
    return shards_[std::hash<IpAddress>{}(key) % shards_.size()];
}

const SourceRateLimiter::Shard& SourceRateLimiter::shard_for(const IpAddress& key) const {
    return shards_[std::hash<IpAddress>{}(key) % shards_.size()];
}

Admit SourceRateLimiter::admit(const IpAddress& source) {
    const IpAddress key = source.normalized();
    const auto now = clock_();

    std::shared_ptr<RateLimiter> limiter;
    {
        Shard& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto& slot = shard.limiters[key];
        if (!slot) {
            slot = std::make_shared<RateLimiter>(max_requests_, config_.window, now);
        }
        limiter = slot;
    }

    // Shard lock released: a slow source only blocks itself
    if (limiter->allow_request(now) == Admit::Allow) {
        ++total_admits_;
        return Admit::Allow;
    }

    ++total_drops_;
    return Admit::Drop;
}

std::size_t SourceRateLimiter::sweep() {
    const auto now = clock_();
    std::size_t removed = 0;

    for (Shard& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.limiters.begin(); it != shard.limiters.end();) {
            if (now - it->second->last_accessed() > config_.expiry) {
                it = shard.limiters.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    eviction_count_ += removed;
    return removed;
}

bool SourceRateLimiter::maybe_sweep() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        const auto now = clock_();
        if (now - last_sweep_ < config_.sweep_interval) {
            return false;
        }
        last_sweep_ = now;
    }
    sweep();
    return true;
}

std::size_t SourceRateLimiter::tracked_count() const {
    std::size_t total = 0;
    for (const Shard& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.limiters.size();
    }
    return total;
}

bool SourceRateLimiter::is_tracked(const IpAddress& source) const {
    const IpAddress key = source.normalized();
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.limiters.find(key) != shard.limiters.end();
}

}  // namespace hamgate
