#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Host/HostTypes.hpp"
#include "../Logging/Logging.hpp"
#include "BufferLayout.hpp"

namespace CAB::Buffers {

/**
 * @brief Typed view over one host buffer descriptor.
 *
 * T may be const-qualified for read-only access. Views never own storage and
 * are only valid while the list they came from is alive.
 */
template <typename T>
class AudioBufferView {
public:
    using Descriptor = std::conditional_t<std::is_const_v<T>, const Host::AudioBuffer, Host::AudioBuffer>;

    explicit AudioBufferView(Descriptor* descriptor) noexcept : descriptor_(descriptor) {}

    [[nodiscard]] size_t Channels() const noexcept { return descriptor_->numberChannels; }
    [[nodiscard]] size_t Frames() const noexcept { return FramesIn(*descriptor_, sizeof(T)); }
    [[nodiscard]] size_t ByteSize() const noexcept { return descriptor_->dataByteSize; }
    [[nodiscard]] size_t Size() const noexcept { return descriptor_->dataByteSize / sizeof(T); }

    [[nodiscard]] std::span<T> Samples() const noexcept {
        if (descriptor_->data == nullptr) return {};
        return {static_cast<T*>(descriptor_->data), Size()};
    }

    [[nodiscard]] Descriptor& Raw() const noexcept { return *descriptor_; }

private:
    Descriptor* descriptor_;
};

/**
 * @brief Variable-length host buffer list, owned or borrowed.
 *
 * Owned lists allocate a header large enough for every descriptor plus one
 * contiguous sample region sliced into equal, non-overlapping chunks. Borrowed
 * lists wrap a host header for the duration of a callback and never free it.
 */
template <Format::Sample S>
class BufferList {
public:
    /**
     * @brief Allocate an owned list.
     * @param bufferCount Number of descriptors (0 yields a valid empty list)
     * @param channelsPerBuffer Interleaved channels in each buffer
     * @param framesPerBuffer Frames in each buffer
     *
     * Fails with AudioError::kParam if one buffer's byte size does not fit the
     * host's 32-bit byte count.
     */
    [[nodiscard]] static Result<BufferList> Create(size_t bufferCount,
                                                   size_t channelsPerBuffer,
                                                   size_t framesPerBuffer) {
        constexpr size_t kMaxBytes = std::numeric_limits<uint32_t>::max();
        if (channelsPerBuffer > kMaxBytes || bufferCount > kMaxBytes ||
            (channelsPerBuffer != 0 && framesPerBuffer > kMaxBytes / sizeof(S) / channelsPerBuffer)) {
            return CAB_ERROR_CODE(AudioError::kParam, "Buffer list dimensions exceed host limits");
        }

        const size_t samplesPerBuffer = channelsPerBuffer * framesPerBuffer;
        if (samplesPerBuffer != 0 && bufferCount > std::numeric_limits<size_t>::max() / samplesPerBuffer) {
            return CAB_ERROR_CODE(AudioError::kParam, "Buffer list allocation size overflows");
        }
        const size_t totalSamples = bufferCount * samplesPerBuffer;

        BufferList list;
        list.headerStorage_ = std::make_unique<std::byte[]>(HeaderBytesFor(bufferCount));
        if (totalSamples != 0) {
            list.sampleStorage_ = std::make_unique<S[]>(totalSamples);
        }
        list.sampleCount_ = totalSamples;

        auto* header = new (list.headerStorage_.get()) Host::AudioBufferList{};
        header->numberBuffers = static_cast<uint32_t>(bufferCount);

        const auto bytesPerBuffer = static_cast<uint32_t>(samplesPerBuffer * sizeof(S));
        std::byte* slots = list.headerStorage_.get() + offsetof(Host::AudioBufferList, buffers);
        for (size_t i = 0; i < bufferCount; ++i) {
            S* chunk = totalSamples != 0 ? list.sampleStorage_.get() + i * samplesPerBuffer : nullptr;
            new (slots + i * sizeof(Host::AudioBuffer)) Host::AudioBuffer{
                static_cast<uint32_t>(channelsPerBuffer), bytesPerBuffer, chunk};
        }

        list.list_ = header;
        CAB_LOG_V4(Buffers, "BufferList allocated buffers=%zu channels=%zu frames=%zu",
                   bufferCount, channelsPerBuffer, framesPerBuffer);
        return list;
    }

    /// Wrap a host-owned header. The header must outlive the returned list.
    [[nodiscard]] static BufferList Borrow(Host::AudioBufferList* hostList) noexcept {
        BufferList list;
        list.list_ = hostList;
        return list;
    }

    BufferList(BufferList&& other) noexcept
        : list_(std::exchange(other.list_, nullptr)),
          headerStorage_(std::move(other.headerStorage_)),
          sampleStorage_(std::move(other.sampleStorage_)),
          sampleCount_(std::exchange(other.sampleCount_, 0)) {}

    BufferList& operator=(BufferList&& other) noexcept {
        if (this != &other) {
            list_ = std::exchange(other.list_, nullptr);
            headerStorage_ = std::move(other.headerStorage_);
            sampleStorage_ = std::move(other.sampleStorage_);
            sampleCount_ = std::exchange(other.sampleCount_, 0);
        }
        return *this;
    }

    BufferList(const BufferList&) = delete;
    BufferList& operator=(const BufferList&) = delete;
    ~BufferList() = default;

    [[nodiscard]] bool IsOwned() const noexcept { return headerStorage_ != nullptr; }

    [[nodiscard]] size_t Size() const noexcept { return Descriptors(list_).size(); }
    [[nodiscard]] bool Empty() const noexcept { return Size() == 0; }

    /// Channels of the first buffer, 0 for an empty list
    [[nodiscard]] size_t Channels() const noexcept {
        return Empty() ? 0 : (*this)[0].Channels();
    }

    /// Frames of the first buffer, 0 for an empty list
    [[nodiscard]] size_t Frames() const noexcept {
        return Empty() ? 0 : (*this)[0].Frames();
    }

    /// Total samples in the owned allocation (0 for borrowed lists)
    [[nodiscard]] size_t OwnedSampleCount() const noexcept { return sampleCount_; }

    [[nodiscard]] AudioBufferView<S> operator[](size_t index) noexcept {
        return AudioBufferView<S>(&Descriptors(list_)[index]);
    }

    [[nodiscard]] AudioBufferView<const S> operator[](size_t index) const noexcept {
        return AudioBufferView<const S>(&Descriptors(static_cast<const Host::AudioBufferList*>(list_))[index]);
    }

    /// Lazily transformed descriptor views; no allocation.
    [[nodiscard]] auto Buffers() noexcept {
        return Descriptors(list_) | std::views::transform([](Host::AudioBuffer& descriptor) {
                   return AudioBufferView<S>(&descriptor);
               });
    }

    [[nodiscard]] auto Buffers() const noexcept {
        return Descriptors(static_cast<const Host::AudioBufferList*>(list_)) |
               std::views::transform([](const Host::AudioBuffer& descriptor) {
                   return AudioBufferView<const S>(&descriptor);
               });
    }

    [[nodiscard]] Host::AudioBufferList* HostList() noexcept { return list_; }
    [[nodiscard]] const Host::AudioBufferList* HostList() const noexcept { return list_; }

private:
    BufferList() = default;

    Host::AudioBufferList* list_{nullptr};
    std::unique_ptr<std::byte[]> headerStorage_;
    std::unique_ptr<S[]> sampleStorage_;
    size_t sampleCount_{0};
};

} // namespace CAB::Buffers
