// ==============================================================================
// Logging Implementation
// ==============================================================================

#include "logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <exception>

namespace Hush {
namespace DSP {

namespace {

std::atomic<LogLevel> gLogLevel{LogLevel::Warning};
std::atomic<LogSink> gLogSink{nullptr};

// Messages longer than this are truncated.
constexpr int kMaxMessageLength = 1024;

void writeToStderr(LogLevel level, const char* message) {
    const std::time_t now = std::time(nullptr);
    std::tm timeInfo{};
#if defined(_WIN32)
    localtime_s(&timeInfo, &now);
#else
    localtime_r(&now, &timeInfo);
#endif
    char timeBuf[16];
    std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &timeInfo);

    // Single call so lines from different threads do not interleave
    std::fprintf(stderr, "[%s] [%s] %s\n", timeBuf, logLevelName(level), message);
    std::fflush(stderr);
}

} // namespace

void setLogLevel(LogLevel level) noexcept {
    gLogLevel.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() noexcept {
    return gLogLevel.load(std::memory_order_relaxed);
}

void setLogSink(LogSink sink) noexcept {
    gLogSink.store(sink, std::memory_order_release);
}

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

void logMessage(LogLevel level, const char* fmt, ...) noexcept {
    if (level == LogLevel::Off || level < getLogLevel()) {
        return;
    }

    char message[kMaxMessageLength];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    LogSink sink = gLogSink.load(std::memory_order_acquire);
    if (sink == nullptr) {
        writeToStderr(level, message);
        return;
    }

    try {
        sink(level, message);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[%s] log sink failed (%s): %s\n",
                     logLevelName(LogLevel::Error), e.what(), message);
        std::fflush(stderr);
    }
}

} // namespace DSP
} // namespace Hush
