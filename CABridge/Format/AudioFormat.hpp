#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "LinearPcmFlags.hpp"

namespace CAB::Format {

// kAudioFormat* identifiers this library recognizes.
enum class FormatId : uint32_t {
    kLinearPCM = static_cast<uint32_t>('lpcm'),
    kAC3 = static_cast<uint32_t>('ac-3'),
    kAppleIMA4 = static_cast<uint32_t>('ima4'),
    kMPEG4AAC = static_cast<uint32_t>('aac '),
    kAppleLossless = static_cast<uint32_t>('alac'),
    kMPEGLayer3 = static_cast<uint32_t>('.mp3'),
    kFLAC = static_cast<uint32_t>('flac'),
    kOpus = static_cast<uint32_t>('opus'),
    kULaw = static_cast<uint32_t>('ulaw'),
    kALaw = static_cast<uint32_t>('alaw'),
};

[[nodiscard]] std::optional<FormatId> FormatIdFromRaw(uint32_t raw) noexcept;
[[nodiscard]] std::string_view ToString(FormatId id) noexcept;

/// A format identifier plus its flag word. Only linear PCM interprets the
/// flags; other formats keep the raw word if one was supplied.
struct AudioFormat {
    FormatId id{FormatId::kLinearPCM};
    std::optional<uint32_t> flags;

    [[nodiscard]] static AudioFormat LinearPCM(LinearPcmFlags pcmFlags) noexcept {
        return AudioFormat{FormatId::kLinearPCM, ToRaw(pcmFlags)};
    }

    [[nodiscard]] bool IsLinearPCM() const noexcept { return id == FormatId::kLinearPCM; }

    [[nodiscard]] std::optional<LinearPcmFlags> PcmFlags() const noexcept {
        if (!IsLinearPCM()) return std::nullopt;
        return static_cast<LinearPcmFlags>(flags.value_or(0));
    }

    /// (format id, flag word) as written into a stream description
    [[nodiscard]] std::pair<uint32_t, std::optional<uint32_t>> AsFormatAndFlag() const noexcept {
        return {static_cast<uint32_t>(id), flags};
    }

    /// Inverse of AsFormatAndFlag; nullopt for unrecognized identifiers
    [[nodiscard]] static std::optional<AudioFormat> FromFormatAndFlag(
        uint32_t formatId, std::optional<uint32_t> flagWord) noexcept;

    friend bool operator==(const AudioFormat&, const AudioFormat&) = default;
};

} // namespace CAB::Format
