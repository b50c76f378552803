#include "gsa/script/script_dispatcher.hpp"

#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/process_runner.hpp"

#include <exception>
#include <string>

namespace gsa::script {

using foundation::LogCategory;

SiblingRunnerDispatcher::SiblingRunnerDispatcher(ScriptConfig config,
                                                 ExecutablePathResolver resolver)
    : config_(std::move(config)), resolver_(std::move(resolver)) {
    if (!resolver_) {
        resolver_ = &foundation::currentExecutablePath;
    }
}

std::filesystem::path
SiblingRunnerDispatcher::runnerPathFor(const std::filesystem::path& agentExecutable) const {
    return agentExecutable.parent_path() / config_.runnerName;
}

void SiblingRunnerDispatcher::runAction() {
    GSA_LOG_INFO(LogCategory::Script, "Starting graceful shutdown scripts.");
    try {
        startRunner();
    } catch (const std::exception& e) {
        GSA_LOG_ERROR(LogCategory::Script,
                      std::string("failed to run graceful shutdown script: ") + e.what());
    }
}

void SiblingRunnerDispatcher::startRunner() {
    auto exe = resolver_();
    if (!exe) {
        GSA_LOG_ERROR(LogCategory::Script,
                      "failed to get agent executable path: " +
                          std::string(exe.error().message()));
        return;
    }

    auto runner = runnerPathFor(exe.value());
    auto exitCode = foundation::runProcess(runner, {config_.runnerArgument});
    if (!exitCode) {
        GSA_LOG_ERROR(LogCategory::Script,
                      "failed to run graceful shutdown script: " +
                          std::string(exitCode.error().message()));
        return;
    }
    if (exitCode.value() != 0) {
        GSA_LOG_ERROR(LogCategory::Script,
                      "failed to run graceful shutdown script: " + config_.runnerName +
                          " exited with status " + std::to_string(exitCode.value()));
        return;
    }
    GSA_LOG_INFO(LogCategory::Script, "Graceful shutdown scripts finished.");
}

std::unique_ptr<IScriptDispatcher> makePlatformDispatcher(const ScriptConfig& config) {
#if defined(_WIN32)
    return std::make_unique<SiblingRunnerDispatcher>(config);
#else
    return std::make_unique<ServiceUnitDispatcher>(config);
#endif
}

} // namespace gsa::script
