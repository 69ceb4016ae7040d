// =============================================================================
// packed-dna - Logger Module
// =============================================================================
// Asynchronous logging for the pdna tool, backed by the Quill library.
//
// The packed-dna library itself never logs; only the command layer does.
// Commands log through the PDNA_LOG_* macros once main() has called init().
//
// Usage:
//   pdna::log::init(pdna::log::Config{.level = pdna::log::Level::kDebug});
//   PDNA_LOG_INFO("packed {} symbols into {} bytes", length, bytes);
//   pdna::log::shutdown();
// =============================================================================

#ifndef PDNA_COMMON_LOGGER_H
#define PDNA_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pdna::log {

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
    Level level = Level::kWarning;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "pdna";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger.
/// @note Subsequent calls are ignored until shutdown() is called.
void init(const Config& config);

/// @brief Get the global logger instance, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until all pending log messages are written.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert pdna::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive).
/// @return Corresponding log level, kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Map the CLI's -q / -v flags to a log level.
/// @param verbosity Number of -v flags given.
/// @param quiet Whether -q was given; wins over verbosity.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace pdna::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define PDNA_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDNA_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDNA_LOG_INFO(fmt, ...) \
    LOG_INFO(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDNA_LOG_WARNING(fmt, ...) \
    LOG_WARNING(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDNA_LOG_ERROR(fmt, ...) \
    LOG_ERROR(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDNA_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(pdna::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PDNA_COMMON_LOGGER_H
