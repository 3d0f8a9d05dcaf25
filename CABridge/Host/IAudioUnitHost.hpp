#pragma once

#include "HostTypes.hpp"

namespace CAB::Host {

/**
 * @brief Processing-unit services (AudioComponentInstance / AudioUnit).
 *
 * Mirrors the subset of the AudioUnit C API the lifecycle wrapper drives.
 */
class IAudioUnitHost {
public:
    virtual ~IAudioUnitHost() = default;

    virtual Status NewInstance(ComponentRef component, UnitRef& outUnit) noexcept = 0;
    virtual Status DisposeInstance(UnitRef unit) noexcept = 0;

    virtual Status Initialize(UnitRef unit) noexcept = 0;
    virtual Status Uninitialize(UnitRef unit) noexcept = 0;

    virtual Status OutputStart(UnitRef unit) noexcept = 0;
    virtual Status OutputStop(UnitRef unit) noexcept = 0;

    virtual Status SetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                               const void* data, uint32_t dataSize) noexcept = 0;

    // ioDataSize carries the buffer size in and the written size out.
    virtual Status GetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                               void* outData, uint32_t& ioDataSize) noexcept = 0;

    virtual Status Render(UnitRef unit, uint32_t* ioActionFlags, const AudioTimeStamp* timeStamp,
                          uint32_t outputBus, uint32_t numberFrames,
                          AudioBufferList* ioData) noexcept = 0;
};

} // namespace CAB::Host
