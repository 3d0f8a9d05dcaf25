// Category handles for the CAB_LOG macros. Each category gets its own
// os_log subsystem entry so Console.app can filter on "com.cabridge".
#include "Logging.hpp"

#if CAB_HAVE_OS_LOG

namespace {
constexpr const char* kSubsystem = "com.cabridge";

inline os_log_t MakeCategory(const char* category) {
    return os_log_create(kSubsystem, category);
}
} // namespace

namespace CAB::Logging {

os_log_t Queue()   { static os_log_t log = MakeCategory("queue");   return log; }
os_log_t Unit()    { static os_log_t log = MakeCategory("unit");    return log; }
os_log_t Buffers() { static os_log_t log = MakeCategory("buffers"); return log; }
os_log_t Bridge()  { static os_log_t log = MakeCategory("bridge");  return log; }
os_log_t Format()  { static os_log_t log = MakeCategory("format");  return log; }
os_log_t Host()    { static os_log_t log = MakeCategory("host");    return log; }

} // namespace CAB::Logging

#endif
