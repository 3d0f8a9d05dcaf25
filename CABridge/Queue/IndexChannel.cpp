#include "IndexChannel.hpp"

namespace CAB::Queue {

IndexChannel::IndexChannel(size_t capacity) : slots_(capacity) {}

bool IndexChannel::Push(size_t index) noexcept {
    {
        std::lock_guard lock(mutex_);
        if (count_ == slots_.size()) {
            return false;
        }
        slots_[(head_ + count_) % slots_.size()] = index;
        ++count_;
    }
    ready_.notify_one();
    return true;
}

size_t IndexChannel::Pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return count_ != 0; });
    return PopLocked();
}

std::optional<size_t> IndexChannel::PopFor(std::chrono::nanoseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [this] { return count_ != 0; })) {
        return std::nullopt;
    }
    return PopLocked();
}

std::optional<size_t> IndexChannel::TryPop() {
    std::lock_guard lock(mutex_);
    if (count_ == 0) {
        return std::nullopt;
    }
    return PopLocked();
}

size_t IndexChannel::Size() const {
    std::lock_guard lock(mutex_);
    return count_;
}

size_t IndexChannel::PopLocked() noexcept {
    const size_t index = slots_[head_];
    head_ = (head_ + 1) % slots_.size();
    --count_;
    return index;
}

} // namespace CAB::Queue
