// =============================================================================
// byteseq - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// The library logs sparingly (rejected input, denied access) at debug level.
// Until init() has been called every BSEQ_LOG_* macro is a no-op, so the
// library stays silent when embedded in an application that does not opt in.
//
// Usage:
//   byteseq::log::init("bseq.log", byteseq::log::Level::kDebug);
//   BSEQ_LOG_INFO("Decoded {} bytes", n);
// =============================================================================

#ifndef BYTESEQ_COMMON_LOGGER_H
#define BYTESEQ_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace byteseq::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "bseq";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Subsequent calls are ignored until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert byteseq::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace byteseq::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define BSEQ_LOG_IMPL_(macro, fmt, ...)                                        \
    do {                                                                       \
        if (quill::Logger* bseqLogger_ = byteseq::log::logger()) {             \
            macro(bseqLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);                \
        }                                                                      \
    } while (false)

/// @brief Log a trace message.
#define BSEQ_LOG_TRACE(fmt, ...) BSEQ_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define BSEQ_LOG_DEBUG(fmt, ...) BSEQ_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define BSEQ_LOG_INFO(fmt, ...) BSEQ_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define BSEQ_LOG_WARNING(fmt, ...) BSEQ_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define BSEQ_LOG_ERROR(fmt, ...) BSEQ_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define BSEQ_LOG_CRITICAL(fmt, ...) BSEQ_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // BYTESEQ_COMMON_LOGGER_H
