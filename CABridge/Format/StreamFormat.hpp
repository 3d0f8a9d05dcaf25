#pragma once

#include <cstdint>

#include "../Core/Error.hpp"
#include "../Host/HostTypes.hpp"
#include "AudioFormat.hpp"
#include "LinearPcmFlags.hpp"
#include "SampleFormat.hpp"

namespace CAB::Format {

/**
 * @brief Linear-PCM stream description.
 *
 * Construction always sets kIsPacked and the encoding bit matching the sample
 * format (kIsFloat or kIsSignedInteger). Frames per packet is 1. Bytes per
 * frame is the sample size for non-interleaved layouts and sample size times
 * channel count for interleaved layouts.
 */
class StreamFormat {
public:
    StreamFormat(double sampleRate,
                 SampleFormat sampleFormat,
                 LinearPcmFlags flags,
                 uint32_t channels) noexcept;

    /// Validate a host description. Anything other than linear PCM with a
    /// supported (flags, bits) pair fails with AudioUnitError::kFormatNotSupported.
    [[nodiscard]] static Result<StreamFormat> FromDescription(
        const Host::StreamBasicDescription& description) noexcept;

    [[nodiscard]] double SampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] SampleFormat GetSampleFormat() const noexcept { return sampleFormat_; }
    [[nodiscard]] LinearPcmFlags Flags() const noexcept { return flags_; }
    [[nodiscard]] uint32_t Channels() const noexcept { return channels_; }

    [[nodiscard]] bool IsInterleaved() const noexcept {
        return !Contains(flags_, LinearPcmFlags::kIsNonInterleaved);
    }

    [[nodiscard]] uint32_t BytesPerFrame() const noexcept;
    [[nodiscard]] AudioFormat GetAudioFormat() const noexcept { return AudioFormat::LinearPCM(flags_); }

    [[nodiscard]] Host::StreamBasicDescription ToDescription() const noexcept;

    friend bool operator==(const StreamFormat&, const StreamFormat&) = default;

private:
    double sampleRate_;
    SampleFormat sampleFormat_;
    LinearPcmFlags flags_;
    uint32_t channels_;
};

} // namespace CAB::Format
