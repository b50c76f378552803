/// @file main.cpp
/// @brief Guest shutdown agent entry point.
///
/// Runs the graceful-shutdown watcher against the instance metadata
/// server until it fires or the process receives SIGINT/SIGTERM.

#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/config_manager.hpp"
#include "gsa/foundation/console_logger.hpp"
#include "gsa/metadata/curl_metadata_client.hpp"
#include "gsa/script/script_dispatcher.hpp"
#include "gsa/service/agent_config.hpp"
#include "gsa/service/service_runner.hpp"
#include "gsa/version.hpp"
#include "gsa/watcher/graceful_shutdown_watcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <thread>

namespace {

using gsa::foundation::AgentLogger;
using gsa::foundation::LogCategory;
using gsa::foundation::LogContext;
using gsa::foundation::LogLevel;

void logStartupProbe(gsa::metadata::IMetadataClient& client, const std::string& key,
                     std::stop_token stop) {
    auto outcome = client.getKey(key, stop);
    LogContext ctx;
    ctx.key = key;
    ctx.extra["status"] = std::string(gsa::metadata::toString(outcome.status()));
    switch (outcome.status()) {
        case gsa::metadata::WatchStatus::Found:
            ctx.extra["value"] = outcome.value();
            break;
        case gsa::metadata::WatchStatus::TransportError:
            ctx.httpStatus = outcome.httpStatus();
            ctx.extra["detail"] = outcome.detail();
            break;
        default:
            break;
    }
    AgentLogger::instance().logWithContext(LogLevel::Info, LogCategory::Core,
                                           "initial stop state", ctx);
}

}  // namespace

int main(int argc, char* argv[]) {
    gsa::service::SignalHandler signals;
    gsa::foundation::installConsoleLogger(std::cerr);

    const auto configPath =
        gsa::service::resolveConfigPath(gsa::service::parseConfigArg(argc, argv));

    gsa::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::error_code ec;
        if (std::filesystem::exists(configPath, ec)) {
            GSA_LOG_ERROR(LogCategory::Config,
                          "failed to load config: " + std::string(loadResult.error().message()));
            return EXIT_FAILURE;
        }
        GSA_LOG_WARN(LogCategory::Config,
                     std::string(loadResult.error().message()) + "; using defaults");
    }

    auto agentConfig = gsa::service::agentConfigFrom(config);
    if (!agentConfig) {
        GSA_LOG_ERROR(LogCategory::Config,
                      "invalid configuration: " + std::string(agentConfig.error().message()));
        return EXIT_FAILURE;
    }
    const auto& cfg = agentConfig.value();
    AgentLogger::instance().setAllLevels(cfg.logLevel);

    auto curlInit = gsa::metadata::CurlMetadataClient::globalInit();
    if (!curlInit) {
        GSA_LOG_ERROR(LogCategory::Metadata, curlInit.error().message());
        return EXIT_FAILURE;
    }

    GSA_LOG_INFO(LogCategory::Core,
                 std::string("gsa_agent ") + gsa::Version::string + " starting; metadata=" +
                     cfg.metadata.baseUrl + " key=" + cfg.watcher.key);

    std::stop_source stopSource;
    std::jthread signalThread([&signals, &stopSource](std::stop_token threadStop) {
        if (signals.waitForShutdown(threadStop)) {
            GSA_LOG_INFO(LogCategory::Core, "shutdown signal received");
            stopSource.request_stop();
        }
    });

    auto client = std::make_unique<gsa::metadata::CurlMetadataClient>(cfg.metadata);
    logStartupProbe(*client, cfg.watcher.key, stopSource.get_token());

    gsa::watcher::GracefulShutdownWatcher watcher(
        std::move(client), gsa::script::makePlatformDispatcher(cfg.script), cfg.watcher);

    int exitCode = EXIT_SUCCESS;
    for (;;) {
        auto result = watcher.run(stopSource.get_token(), gsa::watcher::kRunScriptEvent);
        if (result.error) {
            if (!result.error->isCancelled()) {
                GSA_LOG_ERROR(LogCategory::Core,
                              std::string(watcher.id()) + " failed: " +
                                  std::string(result.error->message()));
                exitCode = EXIT_FAILURE;
            }
            break;
        }
        if (!result.renew) {
            break;
        }
    }

    GSA_LOG_INFO(LogCategory::Core,
                 std::string(watcher.id()) + (watcher.fired() ? " dispatched; exiting" : " stopped"));

    signalThread.request_stop();
    signalThread.join();
    auto flushed = AgentLogger::instance().flush();
    if (!flushed) {
        std::cerr << flushed.error().message() << "\n";
    }
    return exitCode;
}
