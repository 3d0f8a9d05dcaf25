#include "SampleFormat.hpp"

#include <array>

namespace CAB::Format {

namespace {

struct SampleFormatName {
    SampleFormat format;
    std::string_view name;
};

constexpr std::array<SampleFormatName, 5> kSampleFormatNames{{
    {SampleFormat::kF32, "f32"},
    {SampleFormat::kF64, "f64"},
    {SampleFormat::kI32, "i32"},
    {SampleFormat::kI16, "i16"},
    {SampleFormat::kI8, "i8"},
}};

} // namespace

std::string_view ToString(SampleFormat format) noexcept {
    for (const auto& entry : kSampleFormatNames) {
        if (entry.format == format) return entry.name;
    }
    return "unknown";
}

std::optional<SampleFormat> ParseSampleFormat(std::string_view text) noexcept {
    for (const auto& entry : kSampleFormatNames) {
        if (entry.name == text) return entry.format;
    }
    return std::nullopt;
}

} // namespace CAB::Format
