#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the agent entry point.
///
/// Provides signal handling, configuration file resolution and CLI
/// argument parsing.

#include <atomic>
#include <filesystem>
#include <stop_token>

namespace gsa::service {

/// Default location of the agent configuration file.
inline constexpr const char* kDefaultConfigPath = "/etc/gsa/config.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler should exist per process. The handler performs a
/// relaxed store on a lock-free atomic, which is async-signal-safe.
/// Destruction restores the default handlers so that a second signal
/// terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// True after SIGINT or SIGTERM was received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until a shutdown signal arrives or @p stop is requested.
    /// @return true if a signal arrived.
    bool waitForShutdown(std::stop_token stop) const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Configuration file to load.
///
/// Resolved in order:
///   1. GSA_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p cliPath (if non-empty)
///   3. kDefaultConfigPath
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Parse `--config <path>` or `--config=<path>` from command-line arguments.
/// @return The path, or an empty path if absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace gsa::service
