#include "StreamFormat.hpp"

#include "../Logging/Logging.hpp"

namespace CAB::Format {

StreamFormat::StreamFormat(double sampleRate,
                           SampleFormat sampleFormat,
                           LinearPcmFlags flags,
                           uint32_t channels) noexcept
    : sampleRate_(sampleRate),
      sampleFormat_(sampleFormat),
      flags_(flags | LinearPcmFlags::kIsPacked | EncodingFlag(sampleFormat)),
      channels_(channels) {}

uint32_t StreamFormat::BytesPerFrame() const noexcept {
    const uint32_t sampleBytes = SizeInBytes(sampleFormat_);
    return IsInterleaved() ? sampleBytes * channels_ : sampleBytes;
}

Host::StreamBasicDescription StreamFormat::ToDescription() const noexcept {
    const auto [formatId, flagWord] = GetAudioFormat().AsFormatAndFlag();
    const uint32_t bytesPerFrame = BytesPerFrame();

    Host::StreamBasicDescription description{};
    description.sampleRate = sampleRate_;
    description.formatID = formatId;
    description.formatFlags = flagWord.value_or(0);
    description.bytesPerPacket = bytesPerFrame;
    description.framesPerPacket = 1;
    description.bytesPerFrame = bytesPerFrame;
    description.channelsPerFrame = channels_;
    description.bitsPerChannel = SizeInBits(sampleFormat_);
    return description;
}

Result<StreamFormat> StreamFormat::FromDescription(
    const Host::StreamBasicDescription& description) noexcept {
    const auto format = AudioFormat::FromFormatAndFlag(description.formatID, description.formatFlags);
    if (!format || !format->IsLinearPCM()) {
        CAB_LOG_V2(Format, "Rejecting non-linear-PCM stream description id=0x%08x",
                   description.formatID);
        return CAB_ERROR_CODE(AudioUnitError::kFormatNotSupported,
                              "Stream description is not linear PCM");
    }

    const LinearPcmFlags flags = *format->PcmFlags();
    const auto sampleFormat = SampleFormatFromFlagsAndBits(flags, description.bitsPerChannel);
    if (!sampleFormat) {
        CAB_LOG_V2(Format, "Rejecting unsupported sample encoding flags=0x%08x bits=%u",
                   ToRaw(flags), description.bitsPerChannel);
        return CAB_ERROR_CODE(AudioUnitError::kFormatNotSupported,
                              "Unsupported linear PCM sample encoding");
    }

    return StreamFormat(description.sampleRate, *sampleFormat, flags,
                        description.channelsPerFrame);
}

} // namespace CAB::Format
