/// @file graceful_shutdown_watcher.cpp
/// @brief Stop-state watch state machine.

#include "gsa/watcher/graceful_shutdown_watcher.hpp"

#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/cancellation.hpp"

#include <cctype>

namespace gsa::watcher {

using foundation::AgentLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using metadata::WatchStatus;

namespace {

std::string_view trimSpace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

RunResult cancelledResult() {
    RunResult result;
    result.renew = false;
    result.error = foundation::cancelledError();
    return result;
}

} // anonymous namespace

GracefulShutdownWatcher::GracefulShutdownWatcher(
    std::unique_ptr<metadata::IMetadataClient> client,
    std::unique_ptr<script::IScriptDispatcher> dispatcher,
    WatcherConfig config)
    : client_(std::move(client)),
      dispatcher_(std::move(dispatcher)),
      config_(std::move(config)) {}

std::string_view GracefulShutdownWatcher::id() const {
    return kGracefulShutdownWatcherId;
}

std::vector<std::string> GracefulShutdownWatcher::events() const {
    return {std::string(kRunScriptEvent)};
}

RunResult GracefulShutdownWatcher::backOff(std::chrono::milliseconds delay,
                                           std::stop_token stop) const {
    if (!foundation::sleepFor(delay, stop)) {
        return cancelledResult();
    }
    return RunResult{.renew = true};
}

RunResult GracefulShutdownWatcher::run(std::stop_token stop, std::string_view eventType) {
    if (fired_) {
        GSA_LOG_DEBUG(LogCategory::Watcher,
                      "graceful shutdown already dispatched; not renewing");
        return RunResult{.renew = false};
    }

    auto outcome = client_->watchKey(config_.key, stop);

    switch (outcome.status()) {
        case WatchStatus::Cancelled:
            return cancelledResult();

        case WatchStatus::NotPresent:
            // The key only exists while the feature is enabled for the
            // instance; absence is the steady state, so poll slowly.
            GSA_LOG_DEBUG(LogCategory::Watcher,
                          config_.key + " not present; retrying in " +
                              std::to_string(config_.notFoundDelay.count()) + "ms");
            return backOff(config_.notFoundDelay, stop);

        case WatchStatus::TransportError: {
            LogContext ctx;
            ctx.key = config_.key;
            ctx.event = std::string(eventType);
            ctx.httpStatus = outcome.httpStatus();
            AgentLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::Watcher,
                "error watching graceful shutdown metadata: " + outcome.detail(), ctx);
            return backOff(config_.transportErrorDelay, stop);
        }

        case WatchStatus::Found:
            break;
    }

    if (trimSpace(outcome.value()) != config_.actionValue) {
        GSA_LOG_DEBUG(LogCategory::Watcher,
                      "stop state is '" + outcome.value() + "'; keep watching");
        return RunResult{.renew = true};
    }

    GSA_LOG_INFO(LogCategory::Watcher,
                 "instance stop state is " + config_.actionValue +
                     "; dispatching graceful shutdown scripts");
    fired_ = true;
    dispatcher_->runAction();
    // The instance is stopping; nothing left to watch.
    return RunResult{.renew = false};
}

} // namespace gsa::watcher
