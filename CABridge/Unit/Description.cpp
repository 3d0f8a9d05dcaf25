#include "Description.hpp"

#include "../Logging/Logging.hpp"

namespace CAB::Unit {

std::string_view ToString(MainType type) noexcept {
    switch (type) {
        case MainType::kOutput:          return "Output";
        case MainType::kMusicDevice:     return "MusicDevice";
        case MainType::kMusicEffect:     return "MusicEffect";
        case MainType::kFormatConverter: return "FormatConverter";
        case MainType::kEffect:          return "Effect";
        case MainType::kMixer:           return "Mixer";
        case MainType::kPanner:          return "Panner";
        case MainType::kGenerator:       return "Generator";
        case MainType::kOfflineEffect:   return "OfflineEffect";
        case MainType::kMidiProcessor:   return "MidiProcessor";
    }
    return "Unknown";
}

Result<Description> Description::First(Host::IComponentRegistry& registry, ComponentType type) {
    const auto search = type.ToSearchDescription();
    Host::ComponentRef component = registry.FindNext(nullptr, search);
    if (component == nullptr) {
        CAB_LOG_V1(Unit, "No component for type=%{public}s subtype=0x%08x",
                   ToString(type.type).data(), search.componentSubType);
        return CAB_ERROR_COMPONENT(ComponentError::kNoDescriptionFound,
                                   "No component matches the requested type");
    }
    return FromComponent(registry, component);
}

Result<std::vector<Description>> Description::List(Host::IComponentRegistry& registry, ComponentType type) {
    const auto search = type.ToSearchDescription();
    std::vector<Description> descriptions;

    Host::ComponentRef component = nullptr;
    while ((component = registry.FindNext(component, search)) != nullptr) {
        auto entry = CAB_TRY(FromComponent(registry, component));
        descriptions.push_back(std::move(entry));
    }

    CAB_LOG_V2(Unit, "Found %zu components of type %{public}s",
               descriptions.size(), ToString(type.type).data());
    return descriptions;
}

Result<Description> Description::FromComponent(Host::IComponentRegistry& registry,
                                               Host::ComponentRef component) {
    std::string name;
    Host::Status status = registry.CopyName(component, name);
    if (status != Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "AudioComponentCopyName failed");
    }

    uint32_t packedVersion = 0;
    status = registry.GetVersion(component, packedVersion);
    if (status != Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "AudioComponentGetVersion failed");
    }

    Host::ComponentDescription description{};
    status = registry.GetDescription(component, description);
    if (status != Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "AudioComponentGetDescription failed");
    }

    return Description(std::move(name), Version::FromPacked(packedVersion), description);
}

Result<Host::ComponentRef> FindComponent(Host::IComponentRegistry& registry,
                                         const Description& description) {
    Host::ComponentRef component = registry.FindNext(nullptr, description.Raw());
    if (component == nullptr) {
        return CAB_ERROR_COMPONENT(ComponentError::kNoComponentFound,
                                   "No component matches the description");
    }
    return component;
}

} // namespace CAB::Unit
