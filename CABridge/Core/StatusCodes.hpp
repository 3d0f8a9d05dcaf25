#pragma once

#include <cstdint>
#include <optional>

#include "../Host/HostTypes.hpp"

namespace CAB {

// General host status codes.
enum class AudioError : int32_t {
    kUnimplemented = -4,
    kFileNotFound = -43,
    kFilePermission = -54,
    kTooManyFilesOpen = -42,
    kBadFilePath = 561017960,          // '!pth'
    kParam = -50,
    kMemFull = -108,
};

// Audio codec status codes.
enum class AudioCodecError : int32_t {
    kUnspecified = 2003329396,         // 'what'
    kUnknownProperty = 2003332927,     // 'who?'
    kBadPropertySize = 561211770,      // '!siz'
    kIllegalOperation = 1852797029,    // 'nope'
    kUnsupportedFormat = 560226676,    // '!dat'
    kState = 561214580,                // '!stt'
    kNotEnoughBufferSpace = 560100710, // '!buf'
};

// Audio format services status codes. 'what' and '!siz' are shared with the
// codec table and resolve there first.
enum class AudioFormatError : int32_t {
    kUnsupportedProperty = 1886547824,   // 'prop'
    kBadSpecifierSize = 561213539,       // '!spc'
    kUnsupportedDataFormat = 1718449215, // 'fmt?'
    kUnknownFormat = 560360820,          // '!fmt'
};

// AudioUnit status codes.
enum class AudioUnitError : int32_t {
    kInvalidProperty = -10879,
    kInvalidParameter = -10878,
    kInvalidElement = -10877,
    kNoConnection = -10876,
    kFailedInitialization = -10875,
    kTooManyFramesToProcess = -10874,
    kInvalidFile = -10871,
    kFormatNotSupported = -10868,
    kUninitialized = -10867,
    kInvalidScope = -10866,
    kPropertyNotWritable = -10865,
    kCannotDoInCurrentContext = -10863,
    kInvalidPropertyValue = -10851,
    kPropertyNotInUse = -10850,
    kInitialized = -10849,
    kInvalidOfflineRender = -10848,
    kUnauthorized = -10847,
};

// Errors raised by component discovery rather than by a host status.
enum class ComponentError : int32_t {
    kNoDescriptionFound = 1,
    kNoComponentFound = 2,
};

enum class ErrorKind : uint8_t {
    kAudio,
    kCodec,
    kFormat,
    kUnit,
    kUnknownStatus,
    kComponent,
    kOther,
};

[[nodiscard]] std::optional<AudioError> AudioErrorFromStatus(Host::Status status) noexcept;
[[nodiscard]] std::optional<AudioCodecError> AudioCodecErrorFromStatus(Host::Status status) noexcept;
[[nodiscard]] std::optional<AudioFormatError> AudioFormatErrorFromStatus(Host::Status status) noexcept;
[[nodiscard]] std::optional<AudioUnitError> AudioUnitErrorFromStatus(Host::Status status) noexcept;

// Lookup order: audio, codec, format, unit. Unmatched nonzero codes are
// kUnknownStatus. Zero is not an error and classifies as kOther.
[[nodiscard]] ErrorKind Classify(Host::Status status) noexcept;

[[nodiscard]] const char* Describe(AudioError error) noexcept;
[[nodiscard]] const char* Describe(AudioCodecError error) noexcept;
[[nodiscard]] const char* Describe(AudioFormatError error) noexcept;
[[nodiscard]] const char* Describe(AudioUnitError error) noexcept;
[[nodiscard]] const char* Describe(ComponentError error) noexcept;

// Table text for any classified status, "Unknown status" otherwise.
[[nodiscard]] const char* DescribeStatus(Host::Status status) noexcept;

[[nodiscard]] const char* ToString(ErrorKind kind) noexcept;

} // namespace CAB
