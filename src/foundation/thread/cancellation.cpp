/// @file cancellation.cpp
/// @brief Interruptible sleep over std::condition_variable_any.

#include "gsa/foundation/cancellation.hpp"

#include <condition_variable>
#include <mutex>

namespace gsa::foundation {

bool sleepFor(std::chrono::steady_clock::duration duration, std::stop_token stop) {
    if (stop.stop_requested()) {
        return false;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    // The stop_token overload registers a stop_callback that wakes cv.
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

} // namespace gsa::foundation
