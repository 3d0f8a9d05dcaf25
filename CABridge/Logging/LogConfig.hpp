//
// LogConfig.hpp
// CABridge
//
// Runtime logging configuration singleton
// Reads verbosity levels from the process environment and supports runtime updates
//

#ifndef CAB_LOGGING_LOGCONFIG_HPP
#define CAB_LOGGING_LOGCONFIG_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../Config/PropertySource.hpp"

namespace CAB {

enum class LogCategory : uint8_t {
    kQueue = 0,
    kUnit,
    kBuffers,
    kBridge,
    kFormat,
    kHost,
};

inline constexpr size_t kLogCategoryCount = 6;

[[nodiscard]] std::string_view ToString(LogCategory category) noexcept;

/**
 * @brief Centralized logging configuration manager
 *
 * Reads verbosity settings through a PropertyLookup:
 * - CAB_QUEUE_VERBOSITY, CAB_UNIT_VERBOSITY, CAB_BUFFERS_VERBOSITY,
 *   CAB_BRIDGE_VERBOSITY, CAB_FORMAT_VERBOSITY, CAB_HOST_VERBOSITY (integer 0-4)
 * - CAB_LOG_STATISTICS (boolean): Enable aggregate pool statistics logging
 *
 * Thread-safe singleton. Getters are safe on the real-time thread.
 */
class LogConfig {
public:
    static constexpr uint8_t kMaxVerbosity = 4;
    static constexpr uint8_t kDefaultVerbosity = 1;

    /**
     * @brief Get singleton instance
     */
    static LogConfig& Shared();

    /**
     * @brief (Re)load every setting from @p lookup
     *
     * Missing or malformed keys fall back to defaults.
     */
    void Initialize(const Config::PropertyLookup& lookup);

    /**
     * @brief Convenience wrapper for Initialize(EnvironmentLookup())
     */
    void InitializeFromEnvironment();

    [[nodiscard]] bool IsInitialized() const;

    [[nodiscard]] uint8_t GetVerbosity(LogCategory category) const;
    [[nodiscard]] uint8_t GetQueueVerbosity() const { return GetVerbosity(LogCategory::kQueue); }
    [[nodiscard]] uint8_t GetUnitVerbosity() const { return GetVerbosity(LogCategory::kUnit); }

    /**
     * @brief Check if aggregate statistics logging is enabled
     */
    [[nodiscard]] bool IsStatisticsEnabled() const;

    /**
     * @brief Set verbosity at runtime
     * @param level New verbosity level (0-4, clamped if out of range)
     */
    void SetVerbosity(LogCategory category, uint8_t level);
    void SetStatistics(bool enable);

    /**
     * @brief Restore defaults without consulting any lookup
     */
    void Reset();

private:
    LogConfig();

    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    static uint8_t ClampLevel(uint8_t level) {
        return level > kMaxVerbosity ? kMaxVerbosity : level;
    }

    std::array<std::atomic<uint8_t>, kLogCategoryCount> verbosity_;
    std::atomic<bool> logStatistics_;
    std::atomic<bool> initialized_;
};

} // namespace CAB

#endif // CAB_LOGGING_LOGCONFIG_HPP
