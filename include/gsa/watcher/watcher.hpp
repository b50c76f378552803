#pragma once

/// @file watcher.hpp
/// @brief Contract between an event watcher and the agent's dispatch loop.

#include <any>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "gsa/foundation/agent_error.hpp"

namespace gsa::watcher {

/// Decision returned by one IWatcher::run() call.
struct RunResult {
    /// Invoke run() again for this event type.
    bool renew = false;

    /// Event data handed to subscribers; empty when the watcher has none.
    std::any payload;

    /// Set when the call ended abnormally. ErrorCode::Cancelled means the
    /// driver's stop token fired and the driver should wind down.
    std::optional<foundation::AgentError> error;
};

/// A pluggable watcher driven by the agent's event loop.
///
/// The driver calls run() repeatedly, from one thread at a time, for as
/// long as the previous call returned renew == true. Any back-off is spent
/// inside run(), so the driver may re-invoke immediately.
class IWatcher {
public:
    virtual ~IWatcher() = default;

    /// Stable identifier of the watcher.
    [[nodiscard]] virtual std::string_view id() const = 0;

    /// Event types this watcher produces.
    [[nodiscard]] virtual std::vector<std::string> events() const = 0;

    /// Perform one watch attempt for @p eventType.
    virtual RunResult run(std::stop_token stop, std::string_view eventType) = 0;
};

} // namespace gsa::watcher
