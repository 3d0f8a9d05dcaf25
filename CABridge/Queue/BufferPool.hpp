#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../Buffers/SampleBuffer.hpp"
#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Host/IAudioQueueHost.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"
#include "IndexChannel.hpp"

namespace CAB::Queue {

template <Format::Sample S>
class BufferPool;

/**
 * @brief Exclusive, scoped claim on one pool buffer.
 *
 * Destroying the handle without Submit() returns the buffer to the pool
 * immediately. Submit() hands it to the host; it comes back only through the
 * host's completion notification.
 */
template <Format::Sample S>
class PooledBuffer {
public:
    PooledBuffer(PooledBuffer&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), index_(other.index_) {}

    PooledBuffer& operator=(PooledBuffer&& other) noexcept {
        if (this != &other) {
            ReturnToPool();
            pool_ = std::exchange(other.pool_, nullptr);
            index_ = other.index_;
        }
        return *this;
    }

    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;

    ~PooledBuffer() { ReturnToPool(); }

    /// Enqueue with the host. The handle is spent afterwards, even on failure;
    /// a rejected buffer goes straight back to the pool.
    [[nodiscard]] Result<void> Submit() {
        if (pool_ == nullptr) {
            return CAB_ERROR_FATAL("Submit on an empty buffer handle");
        }
        return std::exchange(pool_, nullptr)->Submit(index_);
    }

    [[nodiscard]] Buffers::SampleBuffer<S>& Buffer() noexcept { return pool_->BufferAt(index_); }
    [[nodiscard]] Buffers::SampleBuffer<S>& operator*() noexcept { return Buffer(); }
    [[nodiscard]] Buffers::SampleBuffer<S>* operator->() noexcept { return &Buffer(); }

    [[nodiscard]] size_t Index() const noexcept { return index_; }
    [[nodiscard]] bool Valid() const noexcept { return pool_ != nullptr; }

private:
    friend class BufferPool<S>;

    PooledBuffer(BufferPool<S>* pool, size_t index) noexcept : pool_(pool), index_(index) {}

    void ReturnToPool() noexcept {
        if (pool_ != nullptr) {
            std::exchange(pool_, nullptr)->Release(index_);
        }
    }

    BufferPool<S>* pool_;
    size_t index_;
};

/**
 * @brief Fixed set of host queue buffers recycled between the application and
 *        the host's completion callback.
 *
 * Every index is either in the ready channel or checked out (held by a
 * PooledBuffer or enqueued with the host). Buffers are allocated up front and
 * freed together when the pool is destroyed, which must happen after the
 * owning queue is stopped.
 */
template <Format::Sample S>
class BufferPool {
public:
    [[nodiscard]] static Result<std::unique_ptr<BufferPool>> Create(Host::IAudioQueueHost& host,
                                                                    Host::QueueRef queue,
                                                                    size_t bufferCount,
                                                                    size_t capacity) {
        auto pool = std::unique_ptr<BufferPool>(new BufferPool(host, queue, bufferCount));
        pool->buffers_.reserve(bufferCount);
        for (size_t i = 0; i < bufferCount; ++i) {
            auto buffer = Buffers::SampleBuffer<S>::Allocate(host, queue, i, capacity);
            if (!buffer) {
                CAB_LOG_ERROR(Queue, "Pool buffer %zu/%zu allocation failed", i, bufferCount);
                return std::unexpected(buffer.error());
            }
            pool->buffers_.push_back(std::move(*buffer));
        }
        for (size_t i = 0; i < bufferCount; ++i) {
            pool->ready_.Push(i);
        }
        CAB_LOG_V2(Queue, "BufferPool ready: buffers=%zu capacity=%zu samples", bufferCount, capacity);
        return pool;
    }

    ~BufferPool() {
        if (LogConfig::Shared().IsStatisticsEnabled()) {
            CAB_LOG_INFO(Queue, "BufferPool stats: submitted=%llu completed=%llu dropped=%llu",
                         static_cast<unsigned long long>(submitted_.load()),
                         static_cast<unsigned long long>(completed_.load()),
                         static_cast<unsigned long long>(dropped_.load()));
        }
    }

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /// Block until a buffer is free. Never call from the completion path.
    [[nodiscard]] PooledBuffer<S> Acquire() {
        return CheckOut(ready_.Pop());
    }

    /// Bounded wait; nullopt if nothing was returned before the deadline.
    [[nodiscard]] std::optional<PooledBuffer<S>> AcquireFor(std::chrono::nanoseconds timeout) {
        auto index = ready_.PopFor(timeout);
        if (!index) return std::nullopt;
        return CheckOut(*index);
    }

    [[nodiscard]] std::optional<PooledBuffer<S>> TryAcquire() {
        auto index = ready_.TryPop();
        if (!index) return std::nullopt;
        return CheckOut(*index);
    }

    /**
     * @brief Host completion notification for a submitted buffer.
     *
     * Runs on the host's real-time thread. Decodes the index from the buffer's
     * user-data slot and makes it available again. Unknown indices and
     * completions for buffers that are not checked out are dropped.
     */
    void OnBufferComplete(Host::QueueBuffer* buffer) noexcept {
        if (buffer == nullptr) return;
        const auto index = static_cast<size_t>(reinterpret_cast<uintptr_t>(buffer->userData));
        if (index >= buffers_.size() || buffers_[index].HostBuffer() != buffer) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            CAB_LOG_RL(Queue, "pool/foreign_buffer", 1000, OS_LOG_TYPE_FAULT,
                       "Completion for unknown buffer index=%zu", index);
            return;
        }
        if (!checkedOut_[index].exchange(false, std::memory_order_acq_rel)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            CAB_LOG_RL(Queue, "pool/double_complete", 1000, OS_LOG_TYPE_FAULT,
                       "Completion for buffer %zu which is already free", index);
            return;
        }
        completed_.fetch_add(1, std::memory_order_relaxed);
        ready_.Push(index);
    }

    [[nodiscard]] size_t Size() const noexcept { return buffers_.size(); }

    // Queue already disposed: its buffers are gone, so destruction must not free them.
    void AbandonBuffers() noexcept {
        for (auto& buffer : buffers_) {
            buffer.Abandon();
        }
    }

    [[nodiscard]] size_t Available() const { return ready_.Size(); }
    [[nodiscard]] size_t Outstanding() const { return Size() - Available(); }

    [[nodiscard]] uint64_t SubmittedCount() const noexcept { return submitted_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t CompletedCount() const noexcept { return completed_.load(std::memory_order_relaxed); }

private:
    friend class PooledBuffer<S>;

    BufferPool(Host::IAudioQueueHost& host, Host::QueueRef queue, size_t bufferCount)
        : host_(host),
          queue_(queue),
          checkedOut_(std::make_unique<std::atomic<bool>[]>(bufferCount)),
          ready_(bufferCount) {}

    PooledBuffer<S> CheckOut(size_t index) noexcept {
        checkedOut_[index].store(true, std::memory_order_release);
        CAB_LOG_V4(Queue, "Checked out buffer %zu", index);
        return PooledBuffer<S>(this, index);
    }

    void Release(size_t index) noexcept {
        checkedOut_[index].store(false, std::memory_order_release);
        ready_.Push(index);
    }

    Result<void> Submit(size_t index) noexcept {
        const Host::Status status = host_.EnqueueBuffer(queue_, buffers_[index].HostBuffer());
        if (status != Host::kNoErr) {
            Release(index);
            return CAB_ERROR_STATUS(status, "AudioQueueEnqueueBuffer failed");
        }
        submitted_.fetch_add(1, std::memory_order_relaxed);
        return {};
    }

    Buffers::SampleBuffer<S>& BufferAt(size_t index) noexcept { return buffers_[index]; }

    Host::IAudioQueueHost& host_;
    Host::QueueRef queue_;
    std::vector<Buffers::SampleBuffer<S>> buffers_;
    std::unique_ptr<std::atomic<bool>[]> checkedOut_;
    IndexChannel ready_;
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace CAB::Queue
