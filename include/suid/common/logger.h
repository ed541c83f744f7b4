// =============================================================================
// swiss-uid - Logger Module
// =============================================================================
// Asynchronous logging for the suid tool, backed by Quill.
//
// Only the tool logs. The UID core reports through Result and exceptions, so
// linking the library never starts a backend thread.
//
// Usage:
//   suid::log::init({.logFile = "suid.log", .level = suid::log::Level::kInfo});
//   SUID_LOG_INFO("checked {} entries", count);
// =============================================================================

#ifndef SUID_COMMON_LOGGER_H
#define SUID_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace suid::log {

/// @brief Log levels exposed on the command line.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger setup chosen by the tool's global options.
struct Config {
    /// @brief Log file path, empty for console only.
    std::string logFile;

    /// @brief Keep earlier runs in logFile instead of truncating it.
    bool appendToFile = true;

    /// @brief Minimum level that reaches any sink.
    Level level = Level::kWarning;

    /// @brief Write to the console as well.
    bool enableConsole = true;

    /// @brief Console stream, "stderr" or "stdout".
    /// @note The tool prints its results on stdout.
    std::string consoleStream = "stderr";

    std::string loggerName = "suid";
};

/// @brief Start the Quill backend and create the tool logger.
/// @note A second call is a no-op until shutdown().
void init(const Config& config);

/// @brief The tool logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

// =============================================================================
// Level Selection
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name, ignoring case ("warn" and "fatal" are aliases).
/// @return std::nullopt for unknown names.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Level implied by -v/-q counts.
/// @note quiet wins over verbosity; one -v gives debug, two or more give trace.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace suid::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SUID_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define SUID_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define SUID_LOG_INFO(fmt, ...) \
    LOG_INFO(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define SUID_LOG_WARNING(fmt, ...) \
    LOG_WARNING(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define SUID_LOG_ERROR(fmt, ...) \
    LOG_ERROR(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define SUID_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(suid::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SUID_COMMON_LOGGER_H
