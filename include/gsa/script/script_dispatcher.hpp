#pragma once

/// @file script_dispatcher.hpp
/// @brief Platform actions that start the graceful-shutdown scripts.

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "gsa/foundation/agent_result.hpp"

namespace gsa::script {

/// Settings shared by both dispatcher variants.
struct ScriptConfig {
    /// Program used to start the service unit (looked up on PATH).
    std::string systemctlPath = "systemctl";

    /// Unit that runs the script runner with the graceful-shutdown action.
    std::string serviceUnit = "google-graceful-shutdown-scripts.service";

    /// Script runner file name, resolved next to the agent executable.
    std::string runnerName = "GCEMetadataScriptRunner.exe";

    /// Action argument passed to the script runner.
    std::string runnerArgument = "graceful-shutdown";
};

/// Action run once when the instance is about to stop.
///
/// runAction() never reports failure to its caller: the OS shutdown
/// proceeds regardless, so errors are logged and swallowed. Exceptions
/// raised while starting the scripts are logged the same way.
class IScriptDispatcher {
public:
    virtual ~IScriptDispatcher() = default;

    virtual void runAction() = 0;
};

/// Starts the scripts through the service manager:
/// `systemctl start google-graceful-shutdown-scripts.service`.
///
/// Waits for systemctl itself, not for the unit's scripts.
class ServiceUnitDispatcher final : public IScriptDispatcher {
public:
    explicit ServiceUnitDispatcher(ScriptConfig config = {});

    void runAction() override;

private:
    void startUnit();

    ScriptConfig config_;
};

/// Resolves the agent executable path. Replaceable for tests.
using ExecutablePathResolver =
    std::function<foundation::AgentResult<std::filesystem::path>()>;

/// Runs `<dir-of-agent>/GCEMetadataScriptRunner.exe graceful-shutdown`
/// directly and waits for it to exit. Used where no service manager
/// convention exists.
class SiblingRunnerDispatcher final : public IScriptDispatcher {
public:
    explicit SiblingRunnerDispatcher(ScriptConfig config = {},
                                     ExecutablePathResolver resolver = {});

    void runAction() override;

    /// Path of the runner next to @p agentExecutable.
    [[nodiscard]] std::filesystem::path
    runnerPathFor(const std::filesystem::path& agentExecutable) const;

private:
    void startRunner();

    ScriptConfig config_;
    ExecutablePathResolver resolver_;
};

/// Dispatcher for the platform the agent was built for:
/// SiblingRunnerDispatcher on Windows, ServiceUnitDispatcher elsewhere.
std::unique_ptr<IScriptDispatcher> makePlatformDispatcher(const ScriptConfig& config);

} // namespace gsa::script
