#include "oralsense_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#if defined(__ANDROID__)
#include <android/log.h>
#endif
#if defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE || TARGET_OS_SIMULATOR
#include <os/log.h>
#endif
#endif

namespace oralsense {

namespace {

std::atomic<bool> s_verbose{false};

enum class Level { Debug, Warning };

void vlog(Level level, const char* fmt, va_list args) {
#if defined(__ANDROID__)
    __android_log_vprint(level == Level::Debug ? ANDROID_LOG_DEBUG : ANDROID_LOG_WARN,
                         "OralSense", fmt, args);
#elif defined(__APPLE__) && (TARGET_OS_IPHONE || TARGET_OS_SIMULATOR)
    char buffer[512];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    os_log_with_type(OS_LOG_DEFAULT,
                     level == Level::Debug ? OS_LOG_TYPE_DEBUG : OS_LOG_TYPE_ERROR,
                     "[OralSense] %{public}s", buffer);
#else
    std::fprintf(stderr, level == Level::Debug ? "[OralSense] " : "[OralSense][warn] ");
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
#endif
}

} // namespace

void logDebug(const char* fmt, ...) {
    if (!isVerboseLogging()) return;
    va_list args;
    va_start(args, fmt);
    vlog(Level::Debug, fmt, args);
    va_end(args);
}

void logWarning(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Level::Warning, fmt, args);
    va_end(args);
}

void setVerboseLogging(bool on) { s_verbose.store(on, std::memory_order_relaxed); }
bool isVerboseLogging() { return s_verbose.load(std::memory_order_relaxed); }

} // namespace oralsense
