#pragma once

#include <string>

#include "HostTypes.hpp"

namespace CAB::Host {

// Host component registry (AudioComponentFindNext and friends).
class IComponentRegistry {
public:
    virtual ~IComponentRegistry() = default;

    // Zero fields in `search` act as wildcards. Returns nullptr when exhausted.
    virtual ComponentRef FindNext(ComponentRef previous,
                                  const ComponentDescription& search) noexcept = 0;

    virtual Status CopyName(ComponentRef component, std::string& outName) = 0;
    virtual Status GetVersion(ComponentRef component, uint32_t& outVersion) noexcept = 0;
    virtual Status GetDescription(ComponentRef component,
                                  ComponentDescription& outDescription) noexcept = 0;
};

} // namespace CAB::Host
