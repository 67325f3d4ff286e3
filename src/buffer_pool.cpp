#include "hamgate/buffer_pool.hpp"

#include <cstring>
#include <utility>

namespace hamgate {

// ============================================================================
// PooledBuffer Implementation
// ============================================================================

PooledBuffer::PooledBuffer(BufferPool* pool, std::unique_ptr<std::byte[]> storage,
                           std::size_t capacity, std::size_t size) noexcept
    : pool_(pool)
    , storage_(std::move(storage))
    , capacity_(capacity)
    , size_(size) {}

PooledBuffer::~PooledBuffer() {
    release();
}

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , storage_(std::move(other.storage_))
    , capacity_(std::exchange(other.capacity_, 0))
    , size_(std::exchange(other.size_, 0)) {}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        storage_ = std::move(other.storage_);
        capacity_ = std::exchange(other.capacity_, 0);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void PooledBuffer::release() noexcept {
    if (!storage_) {
        return;
    }
    if (pool_ != nullptr) {
        pool_->give_back(std::move(storage_), capacity_, size_);
    }
    storage_.reset();
    pool_ = nullptr;
    capacity_ = 0;
    size_ = 0;
}

// ============================================================================
// BufferPool Implementation
// ============================================================================

BufferPool::BufferPool(BufferPoolConfig config)
    : config_(config) {
    // give_back() must not allocate
    for (Bucket& bucket : buckets_) {
        bucket.idle.reserve(config_.max_retained_per_bucket);
    }
}

std::size_t BufferPool::bucket_index(std::size_t size) noexcept {
    std::size_t shift = kMinBucketShift;
    while (shift <= kMaxBucketShift && (std::size_t{1} << shift) < size) {
        ++shift;
    }
    return shift - kMinBucketShift;  // == kBucketCount when too large to pool
}

PooledBuffer BufferPool::rent(std::size_t size) {
    ++total_rents_;

    const std::size_t index = bucket_index(size);
    if (index >= kBucketCount) {
        // Oversized: plain allocation, never retained
        auto storage = std::make_unique<std::byte[]>(size);
        ++outstanding_;
        return PooledBuffer(this, std::move(storage), size, size);
    }

    const std::size_t capacity = std::size_t{1} << (index + kMinBucketShift);
    std::unique_ptr<std::byte[]> storage;
    {
        Bucket& bucket = buckets_[index];
        std::lock_guard<std::mutex> lock(bucket.mutex);
        if (!bucket.idle.empty()) {
            storage = std::move(bucket.idle.back());
            bucket.idle.pop_back();
        }
    }

    if (storage) {
        ++total_reuses_;
    } else {
        // make_unique<T[]> value-initializes: fresh storage is zeroed
        storage = std::make_unique<std::byte[]>(capacity);
    }

    ++outstanding_;
    return PooledBuffer(this, std::move(storage), capacity, size);
}

void BufferPool::give_back(std::unique_ptr<std::byte[]> storage,
                           std::size_t capacity, std::size_t used) noexcept {
    --outstanding_;

    const std::size_t index = bucket_index(capacity);
    if (index >= kBucketCount || (std::size_t{1} << (index + kMinBucketShift)) != capacity) {
        return;  // unpooled allocation, freed here
    }

    // Scrub what the previous owner could have written
    std::memset(storage.get(), 0, used);

    Bucket& bucket = buckets_[index];
    std::lock_guard<std::mutex> lock(bucket.mutex);
    if (bucket.idle.size() >= config_.max_retained_per_bucket) {
        return;
    }
    bucket.idle.push_back(std::move(storage));
}

std::size_t BufferPool::retained_count() const {
    std::size_t total = 0;
    for (const Bucket& bucket : buckets_) {
        std::lock_guard<std::mutex> lock(bucket.mutex);
        total += bucket.idle.size();
    }
    return total;
}

}  // namespace hamgate
