#pragma once

#include "../Host/IAudioQueueHost.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace CAB::Testing {

/**
 * @brief In-process AudioQueue stand-in for host-side tests.
 *
 * Each queue owns a worker thread that plays the role of the host's real-time
 * thread while started:
 * - Output queues pop enqueued buffers in FIFO order and invoke the output
 *   callback for each one.
 * - Input queues pop enqueued buffers, fill them to capacity with a ramp of
 *   bytes and invoke the input callback.
 * Stop(immediate) joins the worker. Output buffers still enqueued are then
 * returned through the output callback on the stopping thread (AudioQueueReset
 * semantics); input buffers are discarded.
 *
 * Any operation can be made to fail once via FailNext().
 */
class FakeAudioQueueHost final : public Host::IAudioQueueHost {
public:
    enum class Op : uint8_t {
        kNewOutput,
        kNewInput,
        kAllocate,
        kFree,
        kEnqueue,
        kStart,
        kStop,
        kDispose,
    };

    FakeAudioQueueHost() = default;

    ~FakeAudioQueueHost() override {
        std::vector<FakeQueue*> remaining;
        {
            std::lock_guard lock(mutex_);
            for (auto& [ref, queue] : queues_) remaining.push_back(queue.get());
        }
        for (auto* queue : remaining) JoinWorker(*queue);
    }

    FakeAudioQueueHost(const FakeAudioQueueHost&) = delete;
    FakeAudioQueueHost& operator=(const FakeAudioQueueHost&) = delete;

    // ------------------------------------------------------------------
    // IAudioQueueHost
    // ------------------------------------------------------------------

    Host::Status NewOutput(const Host::StreamBasicDescription& format,
                           Host::QueueOutputCallback callback,
                           void* userData,
                           Host::QueueRef& outQueue) noexcept override {
        if (auto status = ConsumeFailure(Op::kNewOutput)) return status;
        auto queue = std::make_unique<FakeQueue>();
        queue->isInput = false;
        queue->format = format;
        queue->outputCallback = callback;
        queue->userData = userData;
        outQueue = Register(std::move(queue));
        return Host::kNoErr;
    }

    Host::Status NewInput(const Host::StreamBasicDescription& format,
                          Host::QueueInputCallback callback,
                          void* userData,
                          Host::QueueRef& outQueue) noexcept override {
        if (auto status = ConsumeFailure(Op::kNewInput)) return status;
        auto queue = std::make_unique<FakeQueue>();
        queue->isInput = true;
        queue->format = format;
        queue->inputCallback = callback;
        queue->userData = userData;
        outQueue = Register(std::move(queue));
        return Host::kNoErr;
    }

    Host::Status AllocateBuffer(Host::QueueRef ref, uint32_t byteCapacity,
                                Host::QueueBuffer*& outBuffer) noexcept override {
        if (auto status = ConsumeFailure(Op::kAllocate)) return status;
        std::lock_guard lock(mutex_);
        FakeQueue* queue = FindLocked(ref);
        if (queue == nullptr) return kFakeBadQueue;

        auto buffer = std::make_unique<FakeBuffer>();
        buffer->storage = std::make_unique<std::byte[]>(byteCapacity == 0 ? 1 : byteCapacity);
        buffer->header.audioDataBytesCapacity = byteCapacity;
        buffer->header.audioData = buffer->storage.get();
        outBuffer = &buffer->header;
        queue->buffers.push_back(std::move(buffer));
        ++allocateCount_;
        return Host::kNoErr;
    }

    Host::Status FreeBuffer(Host::QueueRef ref, Host::QueueBuffer* buffer) noexcept override {
        if (auto status = ConsumeFailure(Op::kFree)) return status;
        std::lock_guard lock(mutex_);
        FakeQueue* queue = FindLocked(ref);
        if (queue == nullptr) return kFakeBadQueue;
        auto it = std::find_if(queue->buffers.begin(), queue->buffers.end(),
                               [buffer](const auto& b) { return &b->header == buffer; });
        if (it == queue->buffers.end()) return kFakeBadBuffer;
        {
            std::lock_guard qlock(queue->mutex);
            std::erase(queue->pending, buffer);
        }
        queue->buffers.erase(it);
        ++freeCount_;
        return Host::kNoErr;
    }

    Host::Status EnqueueBuffer(Host::QueueRef ref, Host::QueueBuffer* buffer) noexcept override {
        if (auto status = ConsumeFailure(Op::kEnqueue)) return status;
        FakeQueue* queue = nullptr;
        {
            std::lock_guard lock(mutex_);
            queue = FindLocked(ref);
            if (queue == nullptr) return kFakeBadQueue;
            ++enqueueCount_;
        }
        {
            std::lock_guard qlock(queue->mutex);
            queue->pending.push_back(buffer);
        }
        queue->wake.notify_one();
        return Host::kNoErr;
    }

    Host::Status Start(Host::QueueRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kStart)) return status;
        FakeQueue* queue = Find(ref);
        if (queue == nullptr) return kFakeBadQueue;
        ++startCount_;
        {
            std::lock_guard qlock(queue->mutex);
            if (queue->running) return Host::kNoErr;
            queue->running = true;
        }
        queue->worker = std::thread([this, queue, ref] { RunWorker(*queue, ref); });
        return Host::kNoErr;
    }

    Host::Status Stop(Host::QueueRef ref, bool immediate) noexcept override {
        if (auto status = ConsumeFailure(Op::kStop)) return status;
        FakeQueue* queue = Find(ref);
        if (queue == nullptr) return kFakeBadQueue;
        ++stopCount_;
        lastStopImmediate_ = immediate;
        JoinWorker(*queue);
        Flush(*queue, ref);
        return Host::kNoErr;
    }

    Host::Status Dispose(Host::QueueRef ref, bool) noexcept override {
        if (auto status = ConsumeFailure(Op::kDispose)) return status;
        FakeQueue* queue = Find(ref);
        if (queue == nullptr) return kFakeBadQueue;
        JoinWorker(*queue);
        std::lock_guard lock(mutex_);
        disposedBuffersLeaked_ += queue->buffers.size();
        queues_.erase(ref);
        ++disposeCount_;
        return Host::kNoErr;
    }

    // ------------------------------------------------------------------
    // Test controls and observation
    // ------------------------------------------------------------------

    static constexpr Host::Status kFakeBadQueue = -50;
    static constexpr Host::Status kFakeBadBuffer = -50;

    /// The next call of @p op returns @p status without side effects.
    void FailNext(Op op, Host::Status status) {
        std::lock_guard lock(mutex_);
        failures_[op] = status;
    }

    size_t AllocateCount() const { return allocateCount_.load(); }
    size_t FreeCount() const { return freeCount_.load(); }
    size_t EnqueueCount() const { return enqueueCount_.load(); }
    size_t StartCount() const { return startCount_.load(); }
    size_t StopCount() const { return stopCount_.load(); }
    size_t DisposeCount() const { return disposeCount_.load(); }
    size_t CallbackCount() const { return callbackCount_.load(); }
    bool LastStopImmediate() const { return lastStopImmediate_.load(); }

    /// Buffers still allocated when their queue was disposed.
    size_t BuffersReclaimedByDispose() const {
        std::lock_guard lock(mutex_);
        return disposedBuffersLeaked_;
    }

    size_t LiveQueueCount() const {
        std::lock_guard lock(mutex_);
        return queues_.size();
    }

    size_t PendingCount(Host::QueueRef ref) const {
        FakeQueue* queue = Find(ref);
        if (queue == nullptr) return 0;
        std::lock_guard qlock(queue->mutex);
        return queue->pending.size();
    }

    /// Bytes seen by the output callback for completed buffers, in order.
    std::vector<uint32_t> CompletedByteSizes() const {
        std::lock_guard lock(mutex_);
        return completedByteSizes_;
    }

    void SetInputTimeStamp(double sampleTime) { nextSampleTime_.store(sampleTime); }

private:
    struct FakeBuffer {
        Host::QueueBuffer header{};
        std::unique_ptr<std::byte[]> storage;
    };

    struct FakeQueue {
        bool isInput{false};
        Host::StreamBasicDescription format{};
        Host::QueueOutputCallback outputCallback{nullptr};
        Host::QueueInputCallback inputCallback{nullptr};
        void* userData{nullptr};
        std::vector<std::unique_ptr<FakeBuffer>> buffers;

        std::mutex mutex;
        std::condition_variable wake;
        std::deque<Host::QueueBuffer*> pending;
        bool running{false};
        std::thread worker;
    };

    Host::QueueRef Register(std::unique_ptr<FakeQueue> queue) {
        std::lock_guard lock(mutex_);
        auto ref = reinterpret_cast<Host::QueueRef>(queue.get());
        queues_.emplace(ref, std::move(queue));
        return ref;
    }

    FakeQueue* FindLocked(Host::QueueRef ref) const {
        auto it = queues_.find(ref);
        return it == queues_.end() ? nullptr : it->second.get();
    }

    FakeQueue* Find(Host::QueueRef ref) const {
        std::lock_guard lock(mutex_);
        return FindLocked(ref);
    }

    Host::Status ConsumeFailure(Op op) {
        std::lock_guard lock(mutex_);
        auto it = failures_.find(op);
        if (it == failures_.end()) return Host::kNoErr;
        const Host::Status status = it->second;
        failures_.erase(it);
        return status;
    }

    void RunWorker(FakeQueue& queue, Host::QueueRef ref) {
        for (;;) {
            Host::QueueBuffer* buffer = nullptr;
            {
                std::unique_lock qlock(queue.mutex);
                queue.wake.wait(qlock, [&] { return !queue.running || !queue.pending.empty(); });
                if (!queue.running) return;
                buffer = queue.pending.front();
                queue.pending.pop_front();
            }
            Deliver(queue, ref, buffer);
        }
    }

    void Deliver(FakeQueue& queue, Host::QueueRef ref, Host::QueueBuffer* buffer) {
        if (queue.isInput) {
            auto* bytes = static_cast<uint8_t*>(buffer->audioData);
            for (uint32_t i = 0; i < buffer->audioDataBytesCapacity; ++i) {
                bytes[i] = static_cast<uint8_t>(i);
            }
            buffer->audioDataByteSize = buffer->audioDataBytesCapacity;
            Host::AudioTimeStamp stamp{};
            stamp.sampleTime = nextSampleTime_.load();
            stamp.flags = Host::kSampleTimeValid;
            ++callbackCount_;
            queue.inputCallback(queue.userData, ref, buffer, &stamp, 0, nullptr);
        } else {
            {
                std::lock_guard lock(mutex_);
                completedByteSizes_.push_back(buffer->audioDataByteSize);
            }
            ++callbackCount_;
            queue.outputCallback(queue.userData, ref, buffer);
        }
    }

    void JoinWorker(FakeQueue& queue) {
        {
            std::lock_guard qlock(queue.mutex);
            queue.running = false;
        }
        queue.wake.notify_all();
        if (queue.worker.joinable() && queue.worker.get_id() != std::this_thread::get_id()) {
            queue.worker.join();
        }
    }

    void Flush(FakeQueue& queue, Host::QueueRef ref) {
        std::deque<Host::QueueBuffer*> leftovers;
        {
            std::lock_guard qlock(queue.mutex);
            leftovers.swap(queue.pending);
        }
        if (queue.isInput) return;
        for (auto* buffer : leftovers) {
            Deliver(queue, ref, buffer);
        }
    }

    mutable std::mutex mutex_;
    std::map<Host::QueueRef, std::unique_ptr<FakeQueue>> queues_;
    std::map<Op, Host::Status> failures_;
    std::vector<uint32_t> completedByteSizes_;
    size_t disposedBuffersLeaked_{0};

    std::atomic<size_t> allocateCount_{0};
    std::atomic<size_t> freeCount_{0};
    std::atomic<size_t> enqueueCount_{0};
    std::atomic<size_t> startCount_{0};
    std::atomic<size_t> stopCount_{0};
    std::atomic<size_t> disposeCount_{0};
    std::atomic<size_t> callbackCount_{0};
    std::atomic<bool> lastStopImmediate_{false};
    std::atomic<double> nextSampleTime_{0.0};
};

} // namespace CAB::Testing
