#include "gsa/script/script_dispatcher.hpp"

#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/process_runner.hpp"

#include <exception>
#include <string>

namespace gsa::script {

using foundation::LogCategory;

ServiceUnitDispatcher::ServiceUnitDispatcher(ScriptConfig config)
    : config_(std::move(config)) {}

void ServiceUnitDispatcher::runAction() {
    GSA_LOG_INFO(LogCategory::Script, "Starting graceful shutdown scripts.");
    try {
        startUnit();
    } catch (const std::exception& e) {
        GSA_LOG_ERROR(LogCategory::Script,
                      std::string("failed to run graceful shutdown script: ") + e.what());
    }
}

void ServiceUnitDispatcher::startUnit() {
    auto exitCode = foundation::runProcess(
        {config_.systemctlPath, "start", config_.serviceUnit});
    if (!exitCode) {
        GSA_LOG_ERROR(LogCategory::Script,
                      "failed to run graceful shutdown script: " +
                          std::string(exitCode.error().message()));
        return;
    }
    if (exitCode.value() != 0) {
        GSA_LOG_ERROR(LogCategory::Script,
                      "failed to run graceful shutdown script: " + config_.systemctlPath +
                          " start " + config_.serviceUnit + " exited with status " +
                          std::to_string(exitCode.value()));
        return;
    }
    GSA_LOG_INFO(LogCategory::Script, "Started " + config_.serviceUnit);
}

} // namespace gsa::script
