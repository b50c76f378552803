#pragma once

/// @file graceful_shutdown_watcher.hpp
/// @brief Watcher that runs the graceful-shutdown scripts when the
///        metadata server announces a pending stop.

#include <chrono>
#include <memory>
#include <string>

#include "gsa/metadata/metadata_client.hpp"
#include "gsa/script/script_dispatcher.hpp"
#include "gsa/watcher/watcher.hpp"

namespace gsa::watcher {

inline constexpr std::string_view kGracefulShutdownWatcherId = "graceful-shutdown-watcher";
inline constexpr std::string_view kRunScriptEvent = "graceful-shutdown-watcher,run-script";

/// Tunables of GracefulShutdownWatcher.
struct WatcherConfig {
    /// Metadata key holding the instance stop state.
    std::string key = "instance/shutdown-details/stop-state";

    /// Value (after trimming whitespace) that triggers the scripts.
    std::string actionValue = "PENDING_STOP";

    /// Back-off after the key was reported absent.
    std::chrono::milliseconds notFoundDelay{std::chrono::minutes(1)};

    /// Back-off after a transport error.
    std::chrono::milliseconds transportErrorDelay{std::chrono::seconds(5)};
};

/// Watches the instance stop state and fires the script dispatcher once.
///
/// Each run() performs exactly one watch request and maps its outcome:
///
/// | Outcome                 | Action                              | Result            |
/// |-------------------------|-------------------------------------|-------------------|
/// | Found(actionValue)      | runAction()                         | renew=false       |
/// | Found(other)            | none                                | renew=true        |
/// | NotPresent              | sleep notFoundDelay                 | renew=true        |
/// | TransportError          | log error, sleep transportErrorDelay| renew=true        |
/// | stop requested anywhere | none                                | renew=false, Cancelled |
///
/// One-shot: once the dispatcher has run, later run() calls return
/// renew=false without contacting the metadata server or dispatching
/// again, whatever the driver does with the earlier result.
class GracefulShutdownWatcher final : public IWatcher {
public:
    GracefulShutdownWatcher(std::unique_ptr<metadata::IMetadataClient> client,
                            std::unique_ptr<script::IScriptDispatcher> dispatcher,
                            WatcherConfig config = {});

    [[nodiscard]] std::string_view id() const override;
    [[nodiscard]] std::vector<std::string> events() const override;

    RunResult run(std::stop_token stop, std::string_view eventType) override;

    /// True once the shutdown scripts have been dispatched.
    [[nodiscard]] bool fired() const noexcept { return fired_; }

    [[nodiscard]] const WatcherConfig& config() const noexcept { return config_; }

private:
    RunResult backOff(std::chrono::milliseconds delay, std::stop_token stop) const;

    std::unique_ptr<metadata::IMetadataClient> client_;
    std::unique_ptr<script::IScriptDispatcher> dispatcher_;
    WatcherConfig config_;
    bool fired_ = false;
};

} // namespace gsa::watcher
