#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>

#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Host/HostTypes.hpp"
#include "../Host/IAudioQueueHost.hpp"
#include "../Logging/Logging.hpp"

namespace CAB::Buffers {

/**
 * @brief Typed, fixed-capacity view of one host queue buffer.
 *
 * Owned instances were allocated through the queue host and free the buffer
 * exactly once on destruction. Borrowed instances wrap a buffer the host hands
 * to a callback and never free it. The pool index lives in the host buffer's
 * user-data slot.
 */
template <Format::Sample S>
class SampleBuffer {
public:
    [[nodiscard]] static Result<SampleBuffer> Allocate(Host::IAudioQueueHost& host,
                                                       Host::QueueRef queue,
                                                       size_t index,
                                                       size_t capacity) {
        if (capacity > std::numeric_limits<uint32_t>::max() / sizeof(S)) {
            return CAB_ERROR_CODE(AudioError::kParam, "Sample buffer capacity exceeds host limit");
        }

        Host::QueueBuffer* buffer = nullptr;
        const Host::Status status =
            host.AllocateBuffer(queue, static_cast<uint32_t>(capacity * sizeof(S)), buffer);
        if (status != Host::kNoErr) {
            return CAB_ERROR_STATUS(status, "AudioQueueAllocateBuffer failed");
        }
        if (buffer == nullptr) {
            return CAB_ERROR_CODE(AudioError::kMemFull, "Host returned no queue buffer");
        }

        buffer->userData = reinterpret_cast<void*>(static_cast<uintptr_t>(index));
        buffer->audioDataByteSize = 0;
        return SampleBuffer(&host, queue, buffer);
    }

    [[nodiscard]] static SampleBuffer Borrow(Host::QueueRef queue, Host::QueueBuffer* buffer) noexcept {
        return SampleBuffer(nullptr, queue, buffer);
    }

    SampleBuffer(SampleBuffer&& other) noexcept
        : host_(std::exchange(other.host_, nullptr)),
          queue_(std::exchange(other.queue_, nullptr)),
          buffer_(std::exchange(other.buffer_, nullptr)) {}

    SampleBuffer& operator=(SampleBuffer&& other) noexcept {
        if (this != &other) {
            Release();
            host_ = std::exchange(other.host_, nullptr);
            queue_ = std::exchange(other.queue_, nullptr);
            buffer_ = std::exchange(other.buffer_, nullptr);
        }
        return *this;
    }

    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    ~SampleBuffer() { Release(); }

    /// Set the current length, clamped to Capacity(). Never reallocates.
    void Resize(size_t length) noexcept {
        const size_t clamped = std::min(length, Capacity());
        buffer_->audioDataByteSize = static_cast<uint32_t>(clamped * sizeof(S));
    }

    [[nodiscard]] size_t Capacity() const noexcept { return buffer_->audioDataBytesCapacity / sizeof(S); }
    [[nodiscard]] size_t Size() const noexcept { return buffer_->audioDataByteSize / sizeof(S); }
    [[nodiscard]] bool Empty() const noexcept { return Size() == 0; }

    /// Exactly Size() samples. Do not hold across a Resize on another thread.
    [[nodiscard]] std::span<S> Samples() noexcept {
        return {static_cast<S*>(buffer_->audioData), Size()};
    }

    [[nodiscard]] std::span<const S> Samples() const noexcept {
        return {static_cast<const S*>(buffer_->audioData), Size()};
    }

    [[nodiscard]] S& operator[](size_t i) noexcept { return Samples()[i]; }
    [[nodiscard]] const S& operator[](size_t i) const noexcept { return Samples()[i]; }

    [[nodiscard]] size_t Index() const noexcept {
        return static_cast<size_t>(reinterpret_cast<uintptr_t>(buffer_->userData));
    }

    /// Drop ownership without freeing. Only for buffers the host already reclaimed
    /// by disposing their queue.
    void Abandon() noexcept { host_ = nullptr; }

    [[nodiscard]] bool OwnsStorage() const noexcept { return host_ != nullptr; }
    [[nodiscard]] Host::QueueBuffer* HostBuffer() const noexcept { return buffer_; }
    [[nodiscard]] Host::QueueRef Queue() const noexcept { return queue_; }

private:
    SampleBuffer(Host::IAudioQueueHost* host, Host::QueueRef queue, Host::QueueBuffer* buffer) noexcept
        : host_(host), queue_(queue), buffer_(buffer) {}

    void Release() noexcept {
        if (host_ != nullptr && buffer_ != nullptr) {
            const Host::Status status = host_->FreeBuffer(queue_, buffer_);
            if (status != Host::kNoErr) {
                CAB_LOG_ERROR(Buffers, "AudioQueueFreeBuffer failed status=%d (%{public}s)",
                              status, DescribeStatus(status));
            }
        }
        host_ = nullptr;
        buffer_ = nullptr;
    }

    Host::IAudioQueueHost* host_;
    Host::QueueRef queue_;
    Host::QueueBuffer* buffer_;
};

} // namespace CAB::Buffers
