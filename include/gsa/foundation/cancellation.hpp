#pragma once

/// @file cancellation.hpp
/// @brief Waits that race a timeout against a std::stop_token.

#include <chrono>
#include <stop_token>

namespace gsa::foundation {

/// Block for @p duration or until @p stop is requested, whichever is first.
///
/// @return true if the full duration elapsed, false if the stop request
///         won (including a stop requested before the call).
bool sleepFor(std::chrono::steady_clock::duration duration, std::stop_token stop);

} // namespace gsa::foundation
