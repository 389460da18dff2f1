#pragma once

namespace oralsense {

// printf-style logging routed to logcat / os_log / stderr.
// Debug lines are dropped unless verbose logging is enabled.
void logDebug(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;
void logWarning(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

void setVerboseLogging(bool on);
bool isVerboseLogging();

} // namespace oralsense
