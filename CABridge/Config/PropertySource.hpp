#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace CAB::Config {

// Key/value lookup used by LogConfig and BridgeConfig. Returns nullptr when the
// key is absent. The returned pointer only has to stay valid for the call.
using PropertyLookup = std::function<const char*(const char* key)>;

// Lookup backed by the process environment (getenv).
[[nodiscard]] PropertyLookup EnvironmentLookup();

[[nodiscard]] std::optional<uint64_t> ParseUnsigned(std::string_view text) noexcept;
[[nodiscard]] std::optional<double> ParseDouble(std::string_view text) noexcept;
[[nodiscard]] std::optional<bool> ParseBool(std::string_view text) noexcept;

} // namespace CAB::Config
