#pragma once

/// @file agent_config.hpp
/// @brief Typed agent settings assembled from the YAML configuration.

#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/agent_result.hpp"
#include "gsa/foundation/config_manager.hpp"
#include "gsa/metadata/metadata_types.hpp"
#include "gsa/script/script_dispatcher.hpp"
#include "gsa/watcher/graceful_shutdown_watcher.hpp"

namespace gsa::service {

/// Everything the agent entry point needs to build its watcher.
///
/// Recognized keys (all optional):
/// @code
///   metadata:
///     base_url: http://169.254.169.254/computeMetadata/v1/
///     watch_timeout_seconds: 60
///     request_timeout_seconds: 70
///     connect_timeout_seconds: 10
///   watcher:
///     key: instance/shutdown-details/stop-state
///     action_value: PENDING_STOP
///     not_found_delay_seconds: 60
///     transport_error_delay_seconds: 5
///   script:
///     systemctl_path: systemctl
///     service_unit: google-graceful-shutdown-scripts.service
///     runner_name: GCEMetadataScriptRunner.exe
///     runner_argument: graceful-shutdown
///   logging:
///     level: info
/// @endcode
struct AgentConfig {
    metadata::MetadataClientConfig metadata;
    watcher::WatcherConfig watcher;
    script::ScriptConfig script;
    foundation::LogLevel logLevel = foundation::LogLevel::Info;
};

/// Build an AgentConfig, keeping the default for every absent key.
///
/// @return The settings, or ConfigTypeMismatch for a malformed value and
///         InvalidArgument for an out-of-range one. A request timeout not
///         longer than the watch timeout is raised to watch timeout + 10s.
[[nodiscard]] foundation::AgentResult<AgentConfig>
agentConfigFrom(const foundation::ConfigManager& config);

} // namespace gsa::service
