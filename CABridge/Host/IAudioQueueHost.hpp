#pragma once

#include "HostTypes.hpp"

namespace CAB::Host {

/**
 * @brief Queue-style streaming services (AudioQueue).
 *
 * Every call returns the host status unchanged; conversion to typed errors
 * happens at the call site. Callbacks registered through NewOutput/NewInput are
 * invoked on a host-owned thread between Start() and the completion of Stop().
 */
class IAudioQueueHost {
public:
    virtual ~IAudioQueueHost() = default;

    virtual Status NewOutput(const StreamBasicDescription& format,
                             QueueOutputCallback callback,
                             void* userData,
                             QueueRef& outQueue) noexcept = 0;

    virtual Status NewInput(const StreamBasicDescription& format,
                            QueueInputCallback callback,
                            void* userData,
                            QueueRef& outQueue) noexcept = 0;

    virtual Status AllocateBuffer(QueueRef queue,
                                  uint32_t byteCapacity,
                                  QueueBuffer*& outBuffer) noexcept = 0;

    virtual Status FreeBuffer(QueueRef queue, QueueBuffer* buffer) noexcept = 0;

    virtual Status EnqueueBuffer(QueueRef queue, QueueBuffer* buffer) noexcept = 0;

    virtual Status Start(QueueRef queue) noexcept = 0;

    // immediate == true stops without draining enqueued buffers.
    virtual Status Stop(QueueRef queue, bool immediate) noexcept = 0;

    virtual Status Dispose(QueueRef queue, bool immediate) noexcept = 0;
};

} // namespace CAB::Host
