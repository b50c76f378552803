#pragma once

/// @file console_logger.hpp
/// @brief stderr log sink registered with kcenon's GlobalLoggerRegistry.

#include <ostream>

namespace gsa::foundation {

/// Register a sink writing "<UTC timestamp> <LEVEL> <message>" lines to
/// @p out as the default logger of kcenon's GlobalLoggerRegistry.
///
/// Level filtering is left to AgentLogger's per-category levels; the sink
/// accepts everything it is given. @p out must outlive the registration.
void installConsoleLogger(std::ostream& out);

} // namespace gsa::foundation
