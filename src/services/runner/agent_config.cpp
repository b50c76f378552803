/// @file agent_config.cpp
/// @brief Mapping of flattened config keys onto AgentConfig.

#include "gsa/service/agent_config.hpp"

#include <chrono>
#include <string>
#include <type_traits>

namespace gsa::service {

using foundation::AgentError;
using foundation::AgentResult;
using foundation::ConfigManager;
using foundation::ErrorCode;

namespace {

/// Copy @p key into @p out when present. Absent keys keep the default;
/// present but unconvertible keys are reported.
template <typename T>
AgentResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    auto value = config.get<T>(key);
    if (value) {
        out = std::move(value).value();
        return AgentResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return AgentResult<void>::ok();
    }
    return AgentResult<void>::err(value.error());
}

AgentResult<void> readSeconds(const ConfigManager& config, std::string_view key,
                              bool allowZero, auto& out) {
    using Duration = std::remove_reference_t<decltype(out)>;
    auto value = config.get<long long>(key);
    if (!value) {
        if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
            return AgentResult<void>::ok();
        }
        return AgentResult<void>::err(value.error());
    }
    auto seconds = value.value();
    if (seconds < 0 || (seconds == 0 && !allowZero)) {
        return AgentResult<void>::err(AgentError(
            ErrorCode::InvalidArgument,
            std::string(key) + " must be " + (allowZero ? "non-negative" : "positive") +
                ", got " + std::to_string(seconds)));
    }
    out = std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds));
    return AgentResult<void>::ok();
}

} // anonymous namespace

AgentResult<AgentConfig> agentConfigFrom(const ConfigManager& config) {
    AgentConfig cfg;

    // Braced initializers run left to right; the first failure is reported.
    AgentResult<void> steps[] = {
        readOptional(config, "metadata.base_url", cfg.metadata.baseUrl),
        readSeconds(config, "metadata.watch_timeout_seconds", false, cfg.metadata.watchTimeout),
        readSeconds(config, "metadata.request_timeout_seconds", false, cfg.metadata.requestTimeout),
        readSeconds(config, "metadata.connect_timeout_seconds", false, cfg.metadata.connectTimeout),
        readOptional(config, "watcher.key", cfg.watcher.key),
        readOptional(config, "watcher.action_value", cfg.watcher.actionValue),
        readSeconds(config, "watcher.not_found_delay_seconds", true, cfg.watcher.notFoundDelay),
        readSeconds(config, "watcher.transport_error_delay_seconds", true,
                    cfg.watcher.transportErrorDelay),
        readOptional(config, "script.systemctl_path", cfg.script.systemctlPath),
        readOptional(config, "script.service_unit", cfg.script.serviceUnit),
        readOptional(config, "script.runner_name", cfg.script.runnerName),
        readOptional(config, "script.runner_argument", cfg.script.runnerArgument),
    };
    for (const auto& step : steps) {
        if (!step) {
            return AgentResult<AgentConfig>::err(step.error());
        }
    }

    if (cfg.watcher.key.empty()) {
        return AgentResult<AgentConfig>::err(
            AgentError(ErrorCode::InvalidArgument, "watcher.key must not be empty"));
    }
    if (cfg.watcher.actionValue.empty()) {
        return AgentResult<AgentConfig>::err(
            AgentError(ErrorCode::InvalidArgument, "watcher.action_value must not be empty"));
    }

    std::string level;
    auto levelRead = readOptional(config, "logging.level", level);
    if (!levelRead) {
        return AgentResult<AgentConfig>::err(levelRead.error());
    }
    if (!level.empty()) {
        auto parsed = foundation::parseLogLevel(level);
        if (!parsed) {
            return AgentResult<AgentConfig>::err(AgentError(
                ErrorCode::ConfigTypeMismatch, "unknown logging.level: " + level));
        }
        cfg.logLevel = *parsed;
    }

    // The local timeout must outlast the server-side hold, or every quiet
    // watch would surface as a transport error.
    if (cfg.metadata.requestTimeout <= cfg.metadata.watchTimeout) {
        cfg.metadata.requestTimeout = cfg.metadata.watchTimeout + std::chrono::seconds(10);
    }

    return AgentResult<AgentConfig>::ok(std::move(cfg));
}

} // namespace gsa::service
