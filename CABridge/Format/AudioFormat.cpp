#include "AudioFormat.hpp"

#include <array>

namespace CAB::Format {

namespace {

struct FormatName {
    FormatId id;
    std::string_view name;
};

constexpr std::array<FormatName, 10> kFormatNames{{
    {FormatId::kLinearPCM, "LinearPCM"},
    {FormatId::kAC3, "AC3"},
    {FormatId::kAppleIMA4, "AppleIMA4"},
    {FormatId::kMPEG4AAC, "MPEG4AAC"},
    {FormatId::kAppleLossless, "AppleLossless"},
    {FormatId::kMPEGLayer3, "MPEGLayer3"},
    {FormatId::kFLAC, "FLAC"},
    {FormatId::kOpus, "Opus"},
    {FormatId::kULaw, "ULaw"},
    {FormatId::kALaw, "ALaw"},
}};

} // namespace

std::optional<FormatId> FormatIdFromRaw(uint32_t raw) noexcept {
    for (const auto& entry : kFormatNames) {
        if (static_cast<uint32_t>(entry.id) == raw) return entry.id;
    }
    return std::nullopt;
}

std::string_view ToString(FormatId id) noexcept {
    for (const auto& entry : kFormatNames) {
        if (entry.id == id) return entry.name;
    }
    return "Unknown";
}

std::optional<AudioFormat> AudioFormat::FromFormatAndFlag(uint32_t formatId,
                                                         std::optional<uint32_t> flagWord) noexcept {
    const auto id = FormatIdFromRaw(formatId);
    if (!id) return std::nullopt;
    if (*id == FormatId::kLinearPCM) {
        return AudioFormat::LinearPCM(static_cast<LinearPcmFlags>(flagWord.value_or(0)));
    }
    return AudioFormat{*id, flagWord};
}

} // namespace CAB::Format
