#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Bridge/CallbackBridge.hpp"
#include "../Buffers/SampleBuffer.hpp"
#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Format/StreamFormat.hpp"
#include "../Host/IAudioQueueHost.hpp"
#include "../Logging/Logging.hpp"

namespace CAB::Queue {

/**
 * @brief Capture queue: the host fills owned buffers and the application reads
 *        them through a borrowed SampleBuffer inside the callback.
 *
 * Every owned buffer is enqueued on Start(); after the callback returns the
 * buffer is re-enqueued while the queue is running.
 */
template <Format::Sample S>
class AudioQueueInput {
public:
    /// @p callback is invoked as callback(const Host::AudioTimeStamp&, const SampleBuffer<S>&)
    template <typename F>
        requires std::is_invocable_v<std::decay_t<F>&, const Host::AudioTimeStamp&,
                                     const Buffers::SampleBuffer<S>&>
    [[nodiscard]] static Result<std::unique_ptr<AudioQueueInput>> Create(
        Host::IAudioQueueHost& host,
        const Format::StreamFormat& format,
        F&& callback,
        size_t bufferCount,
        size_t bufferCapacity) {
        if (format.GetSampleFormat() != Format::kSampleFormatOf<S>) {
            return CAB_ERROR_CODE(AudioFormatError::kUnsupportedDataFormat,
                                  "Sample type does not match stream format");
        }

        auto input = std::unique_ptr<AudioQueueInput>(new AudioQueueInput(host, format));
        AudioQueueInput* self = input.get();

        void* token = CAB_TRY(input->bridge_.Register(
            [self, fn = std::forward<F>(callback)](Host::QueueRef queue, Host::QueueBuffer* buffer,
                                                   const Host::AudioTimeStamp* startTime, uint32_t,
                                                   const Host::StreamPacketDescription*) mutable {
                const auto borrowed = Buffers::SampleBuffer<S>::Borrow(queue, buffer);
                const Host::AudioTimeStamp stamp = startTime ? *startTime : Host::AudioTimeStamp{};
                fn(stamp, borrowed);
                self->Recycle(buffer);
            }));

        const Host::Status status =
            host.NewInput(format.ToDescription(), &InputBridge::Trampoline, token, input->queue_);
        if (status != Host::kNoErr) {
            input->queue_ = nullptr;
            return CAB_ERROR_STATUS(status, "AudioQueueNewInput failed");
        }

        input->buffers_.reserve(bufferCount);
        for (size_t i = 0; i < bufferCount; ++i) {
            auto buffer = CAB_TRY(Buffers::SampleBuffer<S>::Allocate(host, input->queue_, i, bufferCapacity));
            input->buffers_.push_back(std::move(buffer));
        }

        CAB_LOG_V1(Queue, "AudioQueueInput created: rate=%.0f ch=%u buffers=%zu capacity=%zu",
                   format.SampleRate(), format.Channels(), bufferCount, bufferCapacity);
        return input;
    }

    ~AudioQueueInput() {
        if (queue_ != nullptr && running_.exchange(false)) {
            const Host::Status status = host_.Stop(queue_, true);
            if (status != Host::kNoErr) {
                CAB_LOG_ERROR(Queue, "AudioQueueStop during teardown failed status=%d", status);
            }
        }
        buffers_.clear();
        if (queue_ != nullptr) {
            const Host::Status status = host_.Dispose(queue_, true);
            if (status != Host::kNoErr) {
                CAB_LOG_ERROR(Queue, "AudioQueueDispose failed status=%d", status);
            }
            queue_ = nullptr;
        }
        bridge_.Release();
    }

    AudioQueueInput(const AudioQueueInput&) = delete;
    AudioQueueInput& operator=(const AudioQueueInput&) = delete;

    [[nodiscard]] Result<void> Start() {
        if (running_.load()) return {};
        for (auto& buffer : buffers_) {
            buffer.Resize(0);
            const Host::Status status = host_.EnqueueBuffer(queue_, buffer.HostBuffer());
            if (status != Host::kNoErr) {
                ResetQueue();
                return CAB_ERROR_STATUS(status, "AudioQueueEnqueueBuffer failed");
            }
        }
        running_.store(true);
        const Host::Status status = host_.Start(queue_);
        if (status != Host::kNoErr) {
            running_.store(false);
            ResetQueue();
            return CAB_ERROR_STATUS(status, "AudioQueueStart failed");
        }
        CAB_LOG_V2(Queue, "AudioQueueInput started with %zu buffers", buffers_.size());
        return {};
    }

    [[nodiscard]] Result<void> Stop() {
        if (!running_.exchange(false)) return {};
        const Host::Status status = host_.Stop(queue_, true);
        if (status != Host::kNoErr) {
            running_.store(true);
            return CAB_ERROR_STATUS(status, "AudioQueueStop failed");
        }
        CAB_LOG_V2(Queue, "AudioQueueInput stopped");
        return {};
    }

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }
    [[nodiscard]] size_t BufferCount() const noexcept { return buffers_.size(); }
    [[nodiscard]] const Format::StreamFormat& GetFormat() const noexcept { return format_; }
    [[nodiscard]] Host::QueueRef Handle() const noexcept { return queue_; }

private:
    using InputBridge = Bridge::CallbackBridge<void(Host::QueueRef, Host::QueueBuffer*,
                                                    const Host::AudioTimeStamp*, uint32_t,
                                                    const Host::StreamPacketDescription*)>;

    AudioQueueInput(Host::IAudioQueueHost& host, const Format::StreamFormat& format)
        : host_(host), format_(format) {}

    // Drops buffers enqueued by a failed Start() so a retry starts from an empty queue.
    void ResetQueue() noexcept {
        const Host::Status status = host_.Stop(queue_, true);
        if (status != Host::kNoErr) {
            CAB_LOG_ERROR(Queue, "AudioQueueStop after failed start returned status=%d", status);
        }
    }

    void Recycle(Host::QueueBuffer* buffer) noexcept {
        if (!running_.load()) return;
        const Host::Status status = host_.EnqueueBuffer(queue_, buffer);
        if (status != Host::kNoErr) {
            CAB_LOG_RL(Queue, "input/reenqueue", 1000, OS_LOG_TYPE_ERROR,
                       "Re-enqueue of capture buffer failed status=%d", status);
        }
    }

    Host::IAudioQueueHost& host_;
    Format::StreamFormat format_;
    Host::QueueRef queue_{nullptr};
    InputBridge bridge_;
    std::vector<Buffers::SampleBuffer<S>> buffers_;
    std::atomic<bool> running_{false};
};

} // namespace CAB::Queue
