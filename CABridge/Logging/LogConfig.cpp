//
// LogConfig.cpp
// CABridge
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

namespace CAB {

namespace {

constexpr const char* kVerbosityKeys[kLogCategoryCount] = {
    "CAB_QUEUE_VERBOSITY",
    "CAB_UNIT_VERBOSITY",
    "CAB_BUFFERS_VERBOSITY",
    "CAB_BRIDGE_VERBOSITY",
    "CAB_FORMAT_VERBOSITY",
    "CAB_HOST_VERBOSITY",
};

constexpr const char* kStatisticsKey = "CAB_LOG_STATISTICS";

uint8_t ReadLevel(const Config::PropertyLookup& lookup, const char* key, uint8_t defaultValue) {
    const char* raw = lookup ? lookup(key) : nullptr;
    if (raw == nullptr) return defaultValue;
    const auto parsed = Config::ParseUnsigned(raw);
    if (!parsed) return defaultValue;
    return *parsed > LogConfig::kMaxVerbosity ? LogConfig::kMaxVerbosity
                                              : static_cast<uint8_t>(*parsed);
}

bool ReadFlag(const Config::PropertyLookup& lookup, const char* key, bool defaultValue) {
    const char* raw = lookup ? lookup(key) : nullptr;
    if (raw == nullptr) return defaultValue;
    return Config::ParseBool(raw).value_or(defaultValue);
}

} // namespace

std::string_view ToString(LogCategory category) noexcept {
    switch (category) {
        case LogCategory::kQueue:   return "Queue";
        case LogCategory::kUnit:    return "Unit";
        case LogCategory::kBuffers: return "Buffers";
        case LogCategory::kBridge:  return "Bridge";
        case LogCategory::kFormat:  return "Format";
        case LogCategory::kHost:    return "Host";
    }
    return "Unknown";
}

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig() {
    Reset();
    initialized_.store(false);
}

void LogConfig::Reset() {
    for (auto& level : verbosity_) {
        level.store(kDefaultVerbosity, std::memory_order_relaxed);
    }
    logStatistics_.store(false, std::memory_order_relaxed);
}

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize(const Config::PropertyLookup& lookup) {
    for (size_t i = 0; i < kLogCategoryCount; ++i) {
        verbosity_[i].store(ReadLevel(lookup, kVerbosityKeys[i], kDefaultVerbosity),
                            std::memory_order_relaxed);
    }
    logStatistics_.store(ReadFlag(lookup, kStatisticsKey, false), std::memory_order_relaxed);
    initialized_.store(true);

    CAB_LOG_INFO(Host,
                 "LogConfig initialized: Queue=%u Unit=%u Buffers=%u Bridge=%u Format=%u Host=%u Stats=%d",
                 verbosity_[0].load(), verbosity_[1].load(), verbosity_[2].load(),
                 verbosity_[3].load(), verbosity_[4].load(), verbosity_[5].load(),
                 logStatistics_.load());
}

void LogConfig::InitializeFromEnvironment() {
    Initialize(Config::EnvironmentLookup());
}

bool LogConfig::IsInitialized() const {
    return initialized_.load();
}

// ============================================================================
// Getters / Setters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetVerbosity(LogCategory category) const {
    const auto index = static_cast<size_t>(category);
    if (index >= kLogCategoryCount) return 0;
    return verbosity_[index].load(std::memory_order_relaxed);
}

bool LogConfig::IsStatisticsEnabled() const {
    return logStatistics_.load(std::memory_order_relaxed);
}

void LogConfig::SetVerbosity(LogCategory category, uint8_t level) {
    const auto index = static_cast<size_t>(category);
    if (index >= kLogCategoryCount) return;
    level = ClampLevel(level);
    verbosity_[index].store(level, std::memory_order_relaxed);
    CAB_LOG_INFO(Host, "%{public}s verbosity changed to %u", ToString(category).data(), level);
}

void LogConfig::SetStatistics(bool enable) {
    logStatistics_.store(enable, std::memory_order_relaxed);
    CAB_LOG_INFO(Host, "Statistics logging %{public}s", enable ? "enabled" : "disabled");
}

} // namespace CAB
