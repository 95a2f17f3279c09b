// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Levelled printf-style diagnostics for lifecycle events (engine creation,
// model loading, rejected calls).
//
// Constitution Compliance:
// - Principle II: Real-Time Safety - never called from the per-frame path
// - Principle IX: Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <cstdint>

namespace Hush {
namespace DSP {

/// @brief Severity of a log message. Messages below the current threshold
/// are discarded before formatting.
enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4   ///< Threshold only: suppresses everything
};

/// @brief Receives every message that passes the level threshold.
/// @param level Severity of the message
/// @param message Fully formatted message, without trailing newline
/// @note Sinks are called from noexcept code and should not throw. A
///       std::exception escaping a sink is reported on stderr instead.
using LogSink = void (*)(LogLevel level, const char* message);

/// @brief Set the minimum level that gets emitted (default: Warning).
void setLogLevel(LogLevel level) noexcept;

/// @brief Get the current minimum level.
[[nodiscard]] LogLevel getLogLevel() noexcept;

/// @brief Route messages to a custom sink.
/// @param sink Sink to call, or nullptr to restore the default stderr writer
void setLogSink(LogSink sink) noexcept;

/// @brief Short uppercase name of a level ("DEBUG", "INFO", ...).
[[nodiscard]] const char* logLevelName(LogLevel level) noexcept;

/// @brief Format and emit a message if @p level passes the threshold.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void logMessage(LogLevel level, const char* fmt, ...) noexcept;

} // namespace DSP
} // namespace Hush

#define HUSH_LOG_DEBUG(...) ::Hush::DSP::logMessage(::Hush::DSP::LogLevel::Debug, __VA_ARGS__)
#define HUSH_LOG_INFO(...) ::Hush::DSP::logMessage(::Hush::DSP::LogLevel::Info, __VA_ARGS__)
#define HUSH_LOG_WARNING(...) ::Hush::DSP::logMessage(::Hush::DSP::LogLevel::Warning, __VA_ARGS__)
#define HUSH_LOG_ERROR(...) ::Hush::DSP::logMessage(::Hush::DSP::LogLevel::Error, __VA_ARGS__)
