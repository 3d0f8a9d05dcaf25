#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "../Host/HostTypes.hpp"

namespace CAB::Buffers {

/// Bytes needed for a buffer-list header carrying `bufferCount` descriptors.
/// The header always reserves at least one descriptor slot, as the host
/// declaration does.
[[nodiscard]] constexpr size_t HeaderBytesFor(size_t bufferCount) noexcept {
    const size_t slots = bufferCount == 0 ? 1 : bufferCount;
    return offsetof(Host::AudioBufferList, buffers) + slots * sizeof(Host::AudioBuffer);
}

/// Descriptor array of a (possibly foreign) header. Empty for nullptr.
[[nodiscard]] inline std::span<Host::AudioBuffer> Descriptors(Host::AudioBufferList* list) noexcept {
    if (list == nullptr || list->numberBuffers == 0) return {};
    return {list->buffers, list->numberBuffers};
}

[[nodiscard]] inline std::span<const Host::AudioBuffer> Descriptors(const Host::AudioBufferList* list) noexcept {
    if (list == nullptr || list->numberBuffers == 0) return {};
    return {list->buffers, list->numberBuffers};
}

/// Frames carried by a descriptor. Zero channels report zero frames.
[[nodiscard]] constexpr size_t FramesIn(const Host::AudioBuffer& buffer, size_t sampleBytes) noexcept {
    if (buffer.numberChannels == 0 || sampleBytes == 0) return 0;
    return (buffer.dataByteSize / sampleBytes) / buffer.numberChannels;
}

} // namespace CAB::Buffers
