/// @file service_runner.cpp
/// @brief Signal handling and config resolution for the agent entry point.

#include "gsa/service/service_runner.hpp"

#include "gsa/foundation/cancellation.hpp"

#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string_view>

namespace gsa::service {

namespace {

constexpr std::array<int, 2> kShutdownSignals = {SIGINT, SIGTERM};

constexpr std::string_view kConfigFlag = "--config";

} // anonymous namespace

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    for (int sig : kShutdownSignals) {
        std::signal(sig, &SignalHandler::handler);
    }
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    for (int sig : kShutdownSignals) {
        std::signal(sig, SIG_DFL);
    }
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

bool SignalHandler::waitForShutdown(std::stop_token stop) const {
    using namespace std::chrono_literals;
    // The flag cannot notify, so it is sampled; a stop request ends the
    // slice at once.
    while (!shutdownRequested()) {
        if (!foundation::sleepFor(100ms, stop)) {
            return false;
        }
    }
    return true;
}

// -- Config resolution -------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    const char* envPath = std::getenv("GSA_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    if (!cliPath.empty()) {
        return cliPath;
    }
    return kDefaultConfigPath;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kConfigFlag) {
            if (i + 1 < argc) {
                return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            }
            return {};
        }
        if (arg.size() > kConfigFlag.size() + 1 && arg.substr(0, kConfigFlag.size()) == kConfigFlag &&
            arg[kConfigFlag.size()] == '=') {
            return std::filesystem::path(arg.substr(kConfigFlag.size() + 1));
        }
    }
    return {};
}

} // namespace gsa::service
