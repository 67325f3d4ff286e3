#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace hamgate {

class BufferPool;

// ============================================================================
// PooledBuffer
//
// Exclusive rental of pool storage. Move-only: exactly one owner reads it
// and exactly one destructor (or release()) hands the storage back. A
// moved-from buffer owns nothing.
// ============================================================================

class PooledBuffer {
public:
    PooledBuffer() noexcept = default;
    ~PooledBuffer();

    PooledBuffer(PooledBuffer&& other) noexcept;
    PooledBuffer& operator=(PooledBuffer&& other) noexcept;
    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;

    // The rented length (not the bucket capacity)
    [[nodiscard]] std::span<std::byte> span() noexcept { return {storage_.get(), size_}; }
    [[nodiscard]] std::span<const std::byte> span() const noexcept { return {storage_.get(), size_}; }

    [[nodiscard]] std::byte* data() noexcept { return storage_.get(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] bool valid() const noexcept { return storage_ != nullptr; }

    // Return the storage now instead of at destruction
    void release() noexcept;

private:
    friend class BufferPool;

    PooledBuffer(BufferPool* pool, std::unique_ptr<std::byte[]> storage,
                 std::size_t capacity, std::size_t size) noexcept;

    BufferPool* pool_ = nullptr;
    std::unique_ptr<std::byte[]> storage_;
    std::size_t capacity_ = 0;
    std::size_t size_ = 0;
};

// Retention limits for the pool
struct BufferPoolConfig {
    std::size_t max_retained_per_bucket = 64;   // idle buffers kept per size class
};

// ============================================================================
// BufferPool
//
// Power-of-two size classes from 256 bytes to 16 MiB. Returned storage is
// zeroed over the rented length before it can be rented again, so a new
// owner never observes a previous message. Requests above the largest class
// are served unpooled.
//
// Lifetime: the pool must outlive every buffer rented from it.
// Thread safety: thread-safe (one lock per size class).
// ============================================================================

class BufferPool {
public:
    explicit BufferPool(BufferPoolConfig config = {});
    ~BufferPool() = default;

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // Rent at least `size` bytes; span() covers exactly `size` bytes.
    [[nodiscard]] PooledBuffer rent(std::size_t size);

    // Buffers currently rented out
    [[nodiscard]] std::uint64_t outstanding() const noexcept { return outstanding_.load(); }

    // Idle buffers held for reuse
    [[nodiscard]] std::size_t retained_count() const;

    // Metrics
    [[nodiscard]] std::uint64_t total_rents() const noexcept { return total_rents_.load(); }
    [[nodiscard]] std::uint64_t total_reuses() const noexcept { return total_reuses_.load(); }

    static constexpr std::size_t kMinBucketShift = 8;    // 256 B
    static constexpr std::size_t kMaxBucketShift = 24;   // 16 MiB
    static constexpr std::size_t kBucketCount = kMaxBucketShift - kMinBucketShift + 1;

private:
    friend class PooledBuffer;

    struct Bucket {
        mutable std::mutex mutex;
        std::vector<std::unique_ptr<std::byte[]>> idle;
    };

    // Called by PooledBuffer exactly once per rental
    void give_back(std::unique_ptr<std::byte[]> storage,
                   std::size_t capacity, std::size_t used) noexcept;

    static std::size_t bucket_index(std::size_t size) noexcept;

    BufferPoolConfig config_;
    std::array<Bucket, kBucketCount> buckets_;

    std::atomic<std::uint64_t> outstanding_{0};
    std::atomic<std::uint64_t> total_rents_{0};
    std::atomic<std::uint64_t> total_reuses_{0};
};

}  // namespace hamgate
