#pragma once

/// @file process_runner.hpp
/// @brief Child process execution and executable path lookup.

#include <filesystem>
#include <string>
#include <vector>

#include "gsa/foundation/agent_result.hpp"

namespace gsa::foundation {

/// Run @p argv as a child process and wait for it to exit.
///
/// argv[0] is looked up on PATH when it contains no directory separator.
/// The child inherits the agent's environment and standard streams.
///
/// @return The child's exit status (which may be non-zero), or
///         ProcessSpawnFailed / ProcessWaitFailed / ProcessSignaled
///         (the latter with the signal number as int context).
AgentResult<int> runProcess(const std::vector<std::string>& argv);

/// Run @p program with @p args and wait for it to exit.
///
/// @p program is passed to the OS in its native encoding, so paths that
/// have no narrow-string form are spawned unchanged. @p args are UTF-8.
AgentResult<int> runProcess(const std::filesystem::path& program,
                            const std::vector<std::string>& args);

/// Absolute path of the running executable.
/// @return The path or ExecutablePathUnavailable.
AgentResult<std::filesystem::path> currentExecutablePath();

} // namespace gsa::foundation
