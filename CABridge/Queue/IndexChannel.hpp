#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace CAB::Queue {

/**
 * @brief Blocking MPMC channel of buffer indices with fixed capacity.
 *
 * Storage is preallocated, so Push never allocates and is safe to call from
 * the host's real-time completion thread (it only takes the mutex for a
 * constant-time ring update). Pop variants block application threads.
 */
class IndexChannel {
public:
    explicit IndexChannel(size_t capacity);

    IndexChannel(const IndexChannel&) = delete;
    IndexChannel& operator=(const IndexChannel&) = delete;

    /// Returns false (and drops the index) when the channel is already full.
    bool Push(size_t index) noexcept;

    [[nodiscard]] size_t Pop();
    [[nodiscard]] std::optional<size_t> PopFor(std::chrono::nanoseconds timeout);
    [[nodiscard]] std::optional<size_t> TryPop();

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Capacity() const noexcept { return slots_.size(); }

private:
    size_t PopLocked() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::vector<size_t> slots_;
    size_t head_{0};
    size_t count_{0};
};

} // namespace CAB::Queue
