#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "LinearPcmFlags.hpp"

namespace CAB::Format {

enum class SampleFormat : uint8_t {
    kF32,
    kF64,
    kI32,
    kI16,
    kI8,
};

[[nodiscard]] constexpr uint32_t SizeInBytes(SampleFormat format) noexcept {
    switch (format) {
        case SampleFormat::kF32: return 4;
        case SampleFormat::kF64: return 8;
        case SampleFormat::kI32: return 4;
        case SampleFormat::kI16: return 2;
        case SampleFormat::kI8:  return 1;
    }
    return 0;
}

[[nodiscard]] constexpr uint32_t SizeInBits(SampleFormat format) noexcept {
    return SizeInBytes(format) * 8;
}

[[nodiscard]] constexpr bool IsFloat(SampleFormat format) noexcept {
    return format == SampleFormat::kF32 || format == SampleFormat::kF64;
}

// The flag bit that identifies the sample encoding.
[[nodiscard]] constexpr LinearPcmFlags EncodingFlag(SampleFormat format) noexcept {
    return IsFloat(format) ? LinearPcmFlags::kIsFloat : LinearPcmFlags::kIsSignedInteger;
}

/// Derive the sample format from a linear-PCM flag word and bits per channel.
/// Float: 32/64 bits. Signed integer: 8/16/32 bits. Anything else is unsupported.
[[nodiscard]] constexpr std::optional<SampleFormat> SampleFormatFromFlagsAndBits(
    LinearPcmFlags flags, uint32_t bitsPerChannel) noexcept {
    if (Contains(flags, LinearPcmFlags::kIsFloat)) {
        switch (bitsPerChannel) {
            case 32: return SampleFormat::kF32;
            case 64: return SampleFormat::kF64;
            default: return std::nullopt;
        }
    }
    if (Contains(flags, LinearPcmFlags::kIsSignedInteger)) {
        switch (bitsPerChannel) {
            case 8:  return SampleFormat::kI8;
            case 16: return SampleFormat::kI16;
            case 32: return SampleFormat::kI32;
            default: return std::nullopt;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view ToString(SampleFormat format) noexcept;
[[nodiscard]] std::optional<SampleFormat> ParseSampleFormat(std::string_view text) noexcept;

// ============================================================================
// Sample element types
// ============================================================================

template <typename S>
struct SampleTraits;

template <> struct SampleTraits<float>   { static constexpr SampleFormat kFormat = SampleFormat::kF32; };
template <> struct SampleTraits<double>  { static constexpr SampleFormat kFormat = SampleFormat::kF64; };
template <> struct SampleTraits<int32_t> { static constexpr SampleFormat kFormat = SampleFormat::kI32; };
template <> struct SampleTraits<int16_t> { static constexpr SampleFormat kFormat = SampleFormat::kI16; };
template <> struct SampleTraits<int8_t>  { static constexpr SampleFormat kFormat = SampleFormat::kI8; };

/// Fixed-size, default-constructible element with a known host encoding.
template <typename S>
concept Sample = std::is_trivially_copyable_v<S> && std::default_initializable<S> &&
                 requires {
                     { SampleTraits<S>::kFormat } -> std::convertible_to<SampleFormat>;
                 } &&
                 sizeof(S) == SizeInBytes(SampleTraits<S>::kFormat);

template <Sample S>
inline constexpr SampleFormat kSampleFormatOf = SampleTraits<S>::kFormat;

} // namespace CAB::Format
