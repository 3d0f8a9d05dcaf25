#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../Core/Error.hpp"
#include "../Host/HostTypes.hpp"
#include "../Host/IComponentRegistry.hpp"
#include "ComponentType.hpp"

namespace CAB::Unit {

struct Version {
    uint8_t major{0};
    uint8_t minor{0};
    uint8_t bugfix{0};
    uint8_t stage{0};

    /// Decode the host's packed word (major in the high byte).
    [[nodiscard]] static constexpr Version FromPacked(uint32_t packed) noexcept {
        return Version{static_cast<uint8_t>((packed >> 24) & 0xff),
                       static_cast<uint8_t>((packed >> 16) & 0xff),
                       static_cast<uint8_t>((packed >> 8) & 0xff),
                       static_cast<uint8_t>(packed & 0xff)};
    }

    [[nodiscard]] constexpr uint32_t Packed() const noexcept {
        return (static_cast<uint32_t>(major) << 24) | (static_cast<uint32_t>(minor) << 16) |
               (static_cast<uint32_t>(bugfix) << 8) | stage;
    }

    friend constexpr bool operator==(const Version&, const Version&) = default;
};

/**
 * @brief A registered host component: name, version and host description.
 *
 * Equality compares name and version only.
 */
class Description {
public:
    Description(std::string name, Version version, const Host::ComponentDescription& description)
        : name_(std::move(name)), version_(version), description_(description) {}

    /// First component matching @p type, or ComponentError::kNoDescriptionFound
    [[nodiscard]] static Result<Description> First(Host::IComponentRegistry& registry, ComponentType type);

    /// Every component matching @p type (possibly empty)
    [[nodiscard]] static Result<std::vector<Description>> List(Host::IComponentRegistry& registry,
                                                               ComponentType type);

    /// Read name, version and description of a host component
    [[nodiscard]] static Result<Description> FromComponent(Host::IComponentRegistry& registry,
                                                           Host::ComponentRef component);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] Version GetVersion() const noexcept { return version_; }
    [[nodiscard]] const Host::ComponentDescription& Raw() const noexcept { return description_; }

    friend bool operator==(const Description& a, const Description& b) noexcept {
        return a.name_ == b.name_ && a.version_ == b.version_;
    }

private:
    std::string name_;
    Version version_;
    Host::ComponentDescription description_;
};

/// Resolve a description back to a host component, or ComponentError::kNoComponentFound
[[nodiscard]] Result<Host::ComponentRef> FindComponent(Host::IComponentRegistry& registry,
                                                       const Description& description);

} // namespace CAB::Unit
