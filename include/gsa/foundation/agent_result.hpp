#pragma once

/// @file agent_result.hpp
/// @brief AgentResult<T> alias for agent error handling.

#include "gsa/core/result.hpp"
#include "gsa/foundation/agent_error.hpp"

namespace gsa::foundation {

/// Result type specialized with AgentError.
///
/// Example:
/// @code
///   AgentResult<int> exitCode = runProcess({"systemctl", "start", unit});
///   if (!exitCode) {
///       GSA_LOG_ERROR(LogCategory::Script, exitCode.error().message());
///   }
/// @endcode
template <typename T>
using AgentResult = gsa::Result<T, AgentError>;

}  // namespace gsa::foundation
