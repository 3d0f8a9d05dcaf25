#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

#include "../Bridge/CallbackBridge.hpp"
#include "../Config/BridgeConfig.hpp"
#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Format/StreamFormat.hpp"
#include "../Host/IAudioQueueHost.hpp"
#include "../Logging/Logging.hpp"
#include "BufferPool.hpp"

namespace CAB::Queue {

/**
 * @brief Playback queue: application fills pool buffers, the host drains them.
 *
 * The host's output callback runs through a CallbackBridge whose closure
 * returns each finished buffer to the pool. Teardown order is fixed: stop the
 * queue, free the buffers, dispose the queue, release the bridge.
 */
template <Format::Sample S>
class AudioQueueOutput {
public:
    [[nodiscard]] static Result<std::unique_ptr<AudioQueueOutput>> Create(
        Host::IAudioQueueHost& host,
        const Format::StreamFormat& format,
        size_t bufferCount,
        size_t bufferCapacity) {
        if (format.GetSampleFormat() != Format::kSampleFormatOf<S>) {
            CAB_LOG_ERROR(Queue, "Output sample type %{public}s does not match stream format %{public}s",
                          Format::ToString(Format::kSampleFormatOf<S>).data(),
                          Format::ToString(format.GetSampleFormat()).data());
            return CAB_ERROR_CODE(AudioFormatError::kUnsupportedDataFormat,
                                  "Sample type does not match stream format");
        }

        auto output = std::unique_ptr<AudioQueueOutput>(new AudioQueueOutput(host, format));
        AudioQueueOutput* self = output.get();

        void* token = CAB_TRY(output->bridge_.Register(
            [self](Host::QueueRef, Host::QueueBuffer* buffer) { self->OnBufferComplete(buffer); }));

        const auto description = format.ToDescription();
        const Host::Status status =
            host.NewOutput(description, &CompletionBridge::Trampoline, token, output->queue_);
        if (status != Host::kNoErr) {
            output->queue_ = nullptr;
            return CAB_ERROR_STATUS(status, "AudioQueueNewOutput failed");
        }

        output->pool_ = CAB_TRY(BufferPool<S>::Create(host, output->queue_, bufferCount, bufferCapacity));

        CAB_LOG_V1(Queue, "AudioQueueOutput created: rate=%.0f ch=%u buffers=%zu capacity=%zu",
                   format.SampleRate(), format.Channels(), bufferCount, bufferCapacity);
        return output;
    }

    /// Size the queue from a BridgeConfig; RequestBufferWithDefaultTimeout uses its timeout.
    [[nodiscard]] static Result<std::unique_ptr<AudioQueueOutput>> CreateFromConfig(
        Host::IAudioQueueHost& host, const Config::BridgeConfig& config) {
        auto output = CAB_TRY(Create(host, Config::MakeStreamFormat(config), config.bufferCount,
                                     Config::BufferCapacitySamples(config)));
        output->acquireTimeout_ = config.acquireTimeout;
        return output;
    }

    ~AudioQueueOutput() {
        if (queue_ != nullptr && running_.load()) {
            const Host::Status status = host_.Stop(queue_, true);
            running_.store(false);
            if (status != Host::kNoErr) {
                // Completions may still arrive: dispose the queue (which also frees
                // its buffers) before the pool goes away.
                CAB_LOG_ERROR(Queue, "AudioQueueStop during teardown failed status=%d", status);
                DisposeQueue();
                if (pool_) pool_->AbandonBuffers();
            }
        }
        pool_.reset();
        DisposeQueue();
        bridge_.Release();
    }

    AudioQueueOutput(const AudioQueueOutput&) = delete;
    AudioQueueOutput& operator=(const AudioQueueOutput&) = delete;

    [[nodiscard]] Result<void> Start() {
        if (running_.load()) return {};
        CAB_TRY(ToResult(host_.Start(queue_), "AudioQueueStart failed"));
        running_.store(true);
        CAB_LOG_V2(Queue, "AudioQueueOutput started");
        return {};
    }

    /// Immediate stop. Buffers the host still holds come back through completion.
    [[nodiscard]] Result<void> Stop() {
        if (!running_.load()) return {};
        CAB_TRY(ToResult(host_.Stop(queue_, true), "AudioQueueStop failed"));
        running_.store(false);
        CAB_LOG_V2(Queue, "AudioQueueOutput stopped (outstanding=%zu)", pool_->Outstanding());
        return {};
    }

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }

    [[nodiscard]] PooledBuffer<S> RequestBuffer() { return pool_->Acquire(); }

    [[nodiscard]] std::optional<PooledBuffer<S>> RequestBufferFor(std::chrono::nanoseconds timeout) {
        return pool_->AcquireFor(timeout);
    }

    [[nodiscard]] std::optional<PooledBuffer<S>> TryRequestBuffer() { return pool_->TryAcquire(); }

    /// Blocks forever when the configured timeout is zero.
    [[nodiscard]] std::optional<PooledBuffer<S>> RequestBufferWithDefaultTimeout() {
        if (acquireTimeout_.count() == 0) return pool_->Acquire();
        return pool_->AcquireFor(acquireTimeout_);
    }

    [[nodiscard]] size_t OutstandingBuffers() const { return pool_->Outstanding(); }
    [[nodiscard]] BufferPool<S>& Pool() noexcept { return *pool_; }
    [[nodiscard]] const Format::StreamFormat& GetFormat() const noexcept { return format_; }
    [[nodiscard]] Host::QueueRef Handle() const noexcept { return queue_; }

private:
    using CompletionBridge = Bridge::CallbackBridge<void(Host::QueueRef, Host::QueueBuffer*)>;

    AudioQueueOutput(Host::IAudioQueueHost& host, const Format::StreamFormat& format)
        : host_(host), format_(format) {}

    void DisposeQueue() noexcept {
        if (queue_ == nullptr) return;
        const Host::Status status = host_.Dispose(queue_, true);
        if (status != Host::kNoErr) {
            CAB_LOG_ERROR(Queue, "AudioQueueDispose failed status=%d", status);
        }
        queue_ = nullptr;
    }

    void OnBufferComplete(Host::QueueBuffer* buffer) noexcept {
        if (pool_) {
            pool_->OnBufferComplete(buffer);
        }
    }

    Host::IAudioQueueHost& host_;
    Format::StreamFormat format_;
    Host::QueueRef queue_{nullptr};
    CompletionBridge bridge_;
    std::unique_ptr<BufferPool<S>> pool_;
    std::atomic<bool> running_{false};
    std::chrono::milliseconds acquireTimeout_{0};
};

} // namespace CAB::Queue
