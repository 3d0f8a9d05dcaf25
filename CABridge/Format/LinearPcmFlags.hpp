#pragma once

#include <cstdint>

namespace CAB::Format {

// kLinearPCMFormatFlag* bit values.
enum class LinearPcmFlags : uint32_t {
    kNone = 0,
    kIsFloat = 1u << 0,
    kIsBigEndian = 1u << 1,
    kIsSignedInteger = 1u << 2,
    kIsPacked = 1u << 3,
    kIsAlignedHigh = 1u << 4,
    kIsNonInterleaved = 1u << 5,
    kIsNonMixable = 1u << 6,
};

[[nodiscard]] constexpr LinearPcmFlags operator|(LinearPcmFlags a, LinearPcmFlags b) noexcept {
    return static_cast<LinearPcmFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr LinearPcmFlags operator&(LinearPcmFlags a, LinearPcmFlags b) noexcept {
    return static_cast<LinearPcmFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr LinearPcmFlags operator~(LinearPcmFlags a) noexcept {
    return static_cast<LinearPcmFlags>(~static_cast<uint32_t>(a));
}

constexpr LinearPcmFlags& operator|=(LinearPcmFlags& a, LinearPcmFlags b) noexcept {
    a = a | b;
    return a;
}

[[nodiscard]] constexpr bool Contains(LinearPcmFlags flags, LinearPcmFlags bit) noexcept {
    return (flags & bit) == bit;
}

[[nodiscard]] constexpr uint32_t ToRaw(LinearPcmFlags flags) noexcept {
    return static_cast<uint32_t>(flags);
}

} // namespace CAB::Format
