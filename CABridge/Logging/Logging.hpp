#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

// os_log is the only sink. Builds without <os/log.h> (the POSIX host-test
// build) compile every CAB_LOG* macro down to nothing.
#if defined(__APPLE__)
#include <os/log.h>
#define CAB_HAVE_OS_LOG 1
#else
#define CAB_HAVE_OS_LOG 0
#endif

#include "LogConfig.hpp"

#if CAB_HAVE_OS_LOG
namespace CAB::Logging {
os_log_t Queue();
os_log_t Unit();
os_log_t Buffers();
os_log_t Bridge();
os_log_t Format();
os_log_t Host();
} // namespace CAB::Logging
#endif

// ----- time helpers for the rate limiter -----
namespace CAB::LogDetail {
inline uint64_t NowNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace CAB::LogDetail

#if CAB_HAVE_OS_LOG

#define CAB_LOG(cat, fmt, ...) \
    os_log(CAB::Logging::cat(), "[%{public}s] " fmt, #cat, ##__VA_ARGS__)

#define CAB_LOG_TYPE(cat, os_type, fmt, ...) \
    os_log_with_type(CAB::Logging::cat(), os_type, "[%{public}s] " fmt, #cat, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "pool/double_complete"); interval_ms: throttle window
#define CAB_LOG_RL(cat, key, interval_ms, os_type, fmt, ...)                                   \
    do {                                                                                        \
        static CAB::LogDetail::RlState _s;                                                      \
        const uint64_t _now = CAB::LogDetail::NowNs();                                          \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    os_log_with_type(CAB::Logging::cat(), os_type,                              \
                        "[%{public}s][%{public}s] (suppressed=%llu prior)", #cat, key, _lost);  \
                }                                                                               \
            }                                                                                   \
            os_log_with_type(CAB::Logging::cat(), os_type,                                      \
                "[%{public}s][%{public}s] " fmt, #cat, key, ##__VA_ARGS__);                     \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

#define CAB_LOG_INFO(cat, fmt, ...)    CAB_LOG_TYPE(cat, OS_LOG_TYPE_INFO,    fmt, ##__VA_ARGS__)
#define CAB_LOG_ERROR(cat, fmt, ...)   CAB_LOG_TYPE(cat, OS_LOG_TYPE_ERROR,   fmt, ##__VA_ARGS__)
#define CAB_LOG_DEBUG(cat, fmt, ...)   CAB_LOG_TYPE(cat, OS_LOG_TYPE_DEBUG,   fmt, ##__VA_ARGS__)
#define CAB_LOG_FAULT(cat, fmt, ...)   CAB_LOG_TYPE(cat, OS_LOG_TYPE_FAULT,   fmt, ##__VA_ARGS__)

#else

#define CAB_LOG(cat, fmt, ...) ((void)0)
#define CAB_LOG_TYPE(cat, os_type, fmt, ...) ((void)0)
#define CAB_LOG_RL(cat, key, interval_ms, os_type, fmt, ...) ((void)0)
#define CAB_LOG_INFO(cat, fmt, ...) ((void)0)
#define CAB_LOG_ERROR(cat, fmt, ...) ((void)0)
#define CAB_LOG_DEBUG(cat, fmt, ...) ((void)0)
#define CAB_LOG_FAULT(cat, fmt, ...) ((void)0)

#ifndef OS_LOG_TYPE_DEFAULT
#define OS_LOG_TYPE_DEFAULT 0
#define OS_LOG_TYPE_INFO 1
#define OS_LOG_TYPE_DEBUG 2
#define OS_LOG_TYPE_ERROR 16
#define OS_LOG_TYPE_FAULT 17
#endif

#endif

// ----- Verbosity-gated logging -----
// Level 0: critical only, 1: compact, 2: transitions, 3: detailed, 4: per-buffer debug.
// The category name doubles as the LogConfig lookup key.
#define CAB_LOG_V(cat, level, fmt, ...)                                                  \
    do {                                                                                 \
        if (CAB::LogConfig::Shared().GetVerbosity(CAB::LogCategory::k##cat) >= (level)) { \
            CAB_LOG(cat, fmt, ##__VA_ARGS__);                                            \
        }                                                                                \
    } while (0)

#define CAB_LOG_V0(cat, fmt, ...) CAB_LOG_V(cat, 0, fmt, ##__VA_ARGS__)
#define CAB_LOG_V1(cat, fmt, ...) CAB_LOG_V(cat, 1, fmt, ##__VA_ARGS__)
#define CAB_LOG_V2(cat, fmt, ...) CAB_LOG_V(cat, 2, fmt, ##__VA_ARGS__)
#define CAB_LOG_V3(cat, fmt, ...) CAB_LOG_V(cat, 3, fmt, ##__VA_ARGS__)
#define CAB_LOG_V4(cat, fmt, ...) CAB_LOG_V(cat, 4, fmt, ##__VA_ARGS__)
