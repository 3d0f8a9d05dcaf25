#include "CoreAudioHost.hpp"

#include <CoreFoundation/CoreFoundation.h>

#include <vector>

#include "../../Core/StatusCodes.hpp"
#include "SdkLayout.hpp"

namespace CAB::Host::CoreAudio {

namespace {

bool CopyUtf8(CFStringRef string, std::string& out) {
    if (const char* fast = CFStringGetCStringPtr(string, kCFStringEncodingUTF8)) {
        out = fast;
        return true;
    }
    const CFIndex length = CFStringGetLength(string);
    const CFIndex capacity = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;
    std::vector<char> bytes(static_cast<size_t>(capacity));
    if (!CFStringGetCString(string, bytes.data(), capacity, kCFStringEncodingUTF8)) {
        return false;
    }
    out = bytes.data();
    return true;
}

} // namespace

ComponentRef CoreAudioComponentRegistry::FindNext(ComponentRef previous,
                                                  const ComponentDescription& search) noexcept {
    return FromSdk(AudioComponentFindNext(ToSdk(previous),
                                          reinterpret_cast<const ::AudioComponentDescription*>(&search)));
}

Status CoreAudioComponentRegistry::CopyName(ComponentRef component, std::string& outName) {
    CFStringRef name = nullptr;
    const OSStatus status = AudioComponentCopyName(ToSdk(component), &name);
    if (status != noErr) {
        return status;
    }
    const bool converted = CopyUtf8(name, outName);
    CFRelease(name);
    return converted ? kNoErr : static_cast<Status>(AudioError::kParam);
}

Status CoreAudioComponentRegistry::GetVersion(ComponentRef component, uint32_t& outVersion) noexcept {
    UInt32 version = 0;
    const OSStatus status = AudioComponentGetVersion(ToSdk(component), &version);
    outVersion = version;
    return status;
}

Status CoreAudioComponentRegistry::GetDescription(ComponentRef component,
                                                  ComponentDescription& outDescription) noexcept {
    return AudioComponentGetDescription(ToSdk(component),
                                        reinterpret_cast<::AudioComponentDescription*>(&outDescription));
}

} // namespace CAB::Host::CoreAudio
