#pragma once

/// @file agent_logger.hpp
/// @brief AgentLogger wrapping kcenon common_system logging for the agent.
///
/// Provides category-based filtering, structured logging with context and
/// per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gsa/foundation/agent_result.hpp"

namespace gsa::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Agent log categories. Each category has its own minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Entry point, signal handling
    Metadata = 1, ///< Metadata server requests
    Watcher  = 2, ///< Watcher state transitions
    Script   = 3, ///< Script dispatch and child processes
    Config   = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Metadata", "Watcher", "Script", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in config files ("debug", "WARNING", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.key = "instance/shutdown-details/stop-state";
///   ctx.httpStatus = 503;
///   logger.logWithContext(LogLevel::Error, LogCategory::Metadata,
///                         "watch request failed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> key;
    std::optional<std::string> event;
    std::optional<long> httpStatus;
    std::unordered_map<std::string, std::string> extra;
};

/// Agent logger forwarding to the logger registered in kcenon's
/// GlobalLoggerRegistry. Uses PIMPL to keep kcenon headers out of the
/// public API.
///
/// Every category starts at Info; debug output is opt-in through
/// setCategoryLevel() or the `logging.level` config key.
class AgentLogger {
public:
    AgentLogger();
    ~AgentLogger();

    AgentLogger(const AgentLogger&) = delete;
    AgentLogger& operator=(const AgentLogger&) = delete;
    AgentLogger(AgentLogger&&) noexcept;
    AgentLogger& operator=(AgentLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum level on every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    AgentResult<void> flush();

    /// Process-wide logger used by the GSA_LOG macros.
    static AgentLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gsa::foundation

/// @name GSA_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GSA_MIN_LOG_LEVEL may be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GSA_MIN_LOG_LEVEL
    #define GSA_MIN_LOG_LEVEL 0
#endif

#define GSA_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= GSA_MIN_LOG_LEVEL &&                       \
            ::gsa::foundation::AgentLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::gsa::foundation::AgentLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define GSA_LOG_DEBUG(cat, msg) \
    GSA_LOG(::gsa::foundation::LogLevel::Debug, (cat), (msg))

#define GSA_LOG_INFO(cat, msg) \
    GSA_LOG(::gsa::foundation::LogLevel::Info, (cat), (msg))

#define GSA_LOG_WARN(cat, msg) \
    GSA_LOG(::gsa::foundation::LogLevel::Warning, (cat), (msg))

#define GSA_LOG_ERROR(cat, msg) \
    GSA_LOG(::gsa::foundation::LogLevel::Error, (cat), (msg))

/// @}
