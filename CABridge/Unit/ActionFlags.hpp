#pragma once

#include <cstdint>
#include <string_view>

namespace CAB::Unit {

// kAudioUnitRenderAction_* bits passed through render callbacks.
enum class ActionFlags : uint32_t {
    kNone = 0,
    kPreRender = 1u << 2,
    kPostRender = 1u << 3,
    kOutputIsSilence = 1u << 4,
    kOfflinePreflight = 1u << 5,
    kOfflineRender = 1u << 6,
    kOfflineComplete = 1u << 7,
    kPostRenderError = 1u << 8,
    kDoNotCheckRenderArgs = 1u << 9,
};

[[nodiscard]] constexpr ActionFlags operator|(ActionFlags a, ActionFlags b) noexcept {
    return static_cast<ActionFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr ActionFlags operator&(ActionFlags a, ActionFlags b) noexcept {
    return static_cast<ActionFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr ActionFlags operator~(ActionFlags a) noexcept {
    return static_cast<ActionFlags>(~static_cast<uint32_t>(a));
}

constexpr ActionFlags& operator|=(ActionFlags& a, ActionFlags b) noexcept {
    a = a | b;
    return a;
}

constexpr ActionFlags& operator&=(ActionFlags& a, ActionFlags b) noexcept {
    a = a & b;
    return a;
}

[[nodiscard]] constexpr bool Contains(ActionFlags flags, ActionFlags bit) noexcept {
    return (flags & bit) == bit;
}

[[nodiscard]] constexpr uint32_t ToRaw(ActionFlags flags) noexcept {
    return static_cast<uint32_t>(flags);
}

// Name of a single flag; "<Unknown ActionFlags>" for combinations and kNone.
[[nodiscard]] std::string_view ToString(ActionFlags flags) noexcept;

} // namespace CAB::Unit
