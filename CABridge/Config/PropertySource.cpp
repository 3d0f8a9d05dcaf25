#include "PropertySource.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace CAB::Config {

PropertyLookup EnvironmentLookup() {
    return [](const char* key) -> const char* { return std::getenv(key); };
}

std::optional<uint64_t> ParseUnsigned(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    uint64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<double> ParseDouble(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    double value = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<bool> ParseBool(std::string_view text) noexcept {
    if (text == "1" || text == "true" || text == "TRUE" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "no" || text == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace CAB::Config
