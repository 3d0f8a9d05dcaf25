#include "StatusCodes.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace CAB {

namespace {

template <typename E>
struct StatusEntry {
    E code;
    const char* text;
};

constexpr std::array kAudioTable{
    StatusEntry<AudioError>{AudioError::kUnimplemented, "Unimplemented core routine"},
    StatusEntry<AudioError>{AudioError::kFileNotFound, "File not found"},
    StatusEntry<AudioError>{AudioError::kFilePermission, "File cannot be opened due to either file, directory, or sandbox permissions"},
    StatusEntry<AudioError>{AudioError::kTooManyFilesOpen, "File cannot be opened because too many files are already open"},
    StatusEntry<AudioError>{AudioError::kBadFilePath, "File cannot be opened because the specified path is malformed"},
    StatusEntry<AudioError>{AudioError::kParam, "Error in user parameter list"},
    StatusEntry<AudioError>{AudioError::kMemFull, "Not enough room in heap zone"},
};

constexpr std::array kCodecTable{
    StatusEntry<AudioCodecError>{AudioCodecError::kUnspecified, "Unspecified audio codec error"},
    StatusEntry<AudioCodecError>{AudioCodecError::kUnknownProperty, "Unknown audio codec property"},
    StatusEntry<AudioCodecError>{AudioCodecError::kBadPropertySize, "Audio codec property size is invalid"},
    StatusEntry<AudioCodecError>{AudioCodecError::kIllegalOperation, "Illegal audio codec operation"},
    StatusEntry<AudioCodecError>{AudioCodecError::kUnsupportedFormat, "Audio codec format is unsupported"},
    StatusEntry<AudioCodecError>{AudioCodecError::kState, "Audio codec is in an invalid state"},
    StatusEntry<AudioCodecError>{AudioCodecError::kNotEnoughBufferSpace, "Not enough buffer space for the audio codec"},
};

constexpr std::array kFormatTable{
    StatusEntry<AudioFormatError>{AudioFormatError::kUnsupportedProperty, "The specified property is not supported"},
    StatusEntry<AudioFormatError>{AudioFormatError::kBadSpecifierSize, "The specifier size is invalid"},
    StatusEntry<AudioFormatError>{AudioFormatError::kUnsupportedDataFormat, "The specified data format is not supported"},
    StatusEntry<AudioFormatError>{AudioFormatError::kUnknownFormat, "The specified data format is not a known format"},
};

constexpr std::array kUnitTable{
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidProperty, "The property is not supported"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidParameter, "The parameter is not supported"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidElement, "The specified element is not valid"},
    StatusEntry<AudioUnitError>{AudioUnitError::kNoConnection, "There is no connection (generally an audio unit is asked to render but it has not input from which to gather data)"},
    StatusEntry<AudioUnitError>{AudioUnitError::kFailedInitialization, "The audio unit is unable to be initialized"},
    StatusEntry<AudioUnitError>{AudioUnitError::kTooManyFramesToProcess, "When an audio unit is initialized it has a value which specifies the max number of frames it will be asked to render at any given time. If an audio unit is asked to render more than this, this error is returned"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidFile, "If an audio unit uses external files as a data source, this error is returned if a file is invalid (Apple's DLS synth returns this error)"},
    StatusEntry<AudioUnitError>{AudioUnitError::kFormatNotSupported, "Returned if an input or output format is not supported"},
    StatusEntry<AudioUnitError>{AudioUnitError::kUninitialized, "Returned if an operation requires an audio unit to be initialized and it is not"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidScope, "The specified scope is invalid"},
    StatusEntry<AudioUnitError>{AudioUnitError::kPropertyNotWritable, "The property cannot be written"},
    StatusEntry<AudioUnitError>{AudioUnitError::kCannotDoInCurrentContext, "Returned when an audio unit is in a state where it can't perform the requested action now - but it could later. It's usually used to guard a render operation when a reconfiguration of its internal state is being performed"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidPropertyValue, "The property is valid, but the value of the property being provided is not"},
    StatusEntry<AudioUnitError>{AudioUnitError::kPropertyNotInUse, "Returned when a property is valid, but it hasn't been set to a valid value at this time"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInitialized, "Indicates the operation cannot be performed because the audio unit is initialized"},
    StatusEntry<AudioUnitError>{AudioUnitError::kInvalidOfflineRender, "Used to indicate that the offline render operation is invalid. For instance, when the audio unit needs to be pre-flighted, but it hasn't been"},
    StatusEntry<AudioUnitError>{AudioUnitError::kUnauthorized, "Returned by either Open or Initialize, this error is used to indicate that the audio unit is not authorised, that it cannot be used. A host can then present a UI to notify the user to take some action to authorise the audio unit"},
};

template <typename E, size_t N>
std::optional<E> Lookup(const std::array<StatusEntry<E>, N>& table, Host::Status status) noexcept {
    const auto it = std::find_if(table.begin(), table.end(), [status](const auto& entry) {
        return static_cast<Host::Status>(entry.code) == status;
    });
    if (it == table.end()) return std::nullopt;
    return it->code;
}

template <typename E, size_t N>
const char* Text(const std::array<StatusEntry<E>, N>& table, E code) noexcept {
    for (const auto& entry : table) {
        if (entry.code == code) return entry.text;
    }
    return "Unknown status";
}

} // namespace

std::optional<AudioError> AudioErrorFromStatus(Host::Status status) noexcept {
    return Lookup(kAudioTable, status);
}

std::optional<AudioCodecError> AudioCodecErrorFromStatus(Host::Status status) noexcept {
    return Lookup(kCodecTable, status);
}

std::optional<AudioFormatError> AudioFormatErrorFromStatus(Host::Status status) noexcept {
    return Lookup(kFormatTable, status);
}

std::optional<AudioUnitError> AudioUnitErrorFromStatus(Host::Status status) noexcept {
    return Lookup(kUnitTable, status);
}

ErrorKind Classify(Host::Status status) noexcept {
    if (status == Host::kNoErr) return ErrorKind::kOther;
    if (AudioErrorFromStatus(status)) return ErrorKind::kAudio;
    if (AudioCodecErrorFromStatus(status)) return ErrorKind::kCodec;
    if (AudioFormatErrorFromStatus(status)) return ErrorKind::kFormat;
    if (AudioUnitErrorFromStatus(status)) return ErrorKind::kUnit;
    return ErrorKind::kUnknownStatus;
}

const char* Describe(AudioError error) noexcept { return Text(kAudioTable, error); }
const char* Describe(AudioCodecError error) noexcept { return Text(kCodecTable, error); }
const char* Describe(AudioFormatError error) noexcept { return Text(kFormatTable, error); }
const char* Describe(AudioUnitError error) noexcept { return Text(kUnitTable, error); }

const char* Describe(ComponentError error) noexcept {
    switch (error) {
        case ComponentError::kNoDescriptionFound: return "No component description matched the requested type";
        case ComponentError::kNoComponentFound:   return "No component matched the requested description";
    }
    return "Unknown component error";
}

const char* DescribeStatus(Host::Status status) noexcept {
    if (auto e = AudioErrorFromStatus(status)) return Describe(*e);
    if (auto e = AudioCodecErrorFromStatus(status)) return Describe(*e);
    if (auto e = AudioFormatErrorFromStatus(status)) return Describe(*e);
    if (auto e = AudioUnitErrorFromStatus(status)) return Describe(*e);
    return "Unknown status";
}

const char* ToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kAudio:         return "Audio";
        case ErrorKind::kCodec:         return "Codec";
        case ErrorKind::kFormat:        return "Format";
        case ErrorKind::kUnit:          return "Unit";
        case ErrorKind::kUnknownStatus: return "UnknownStatus";
        case ErrorKind::kComponent:     return "Component";
        case ErrorKind::kOther:         return "Other";
    }
    return "Unknown";
}

} // namespace CAB
