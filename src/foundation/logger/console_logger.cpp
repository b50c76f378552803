/// @file console_logger.cpp
/// @brief ILogger implementation writing to a std::ostream.

#include "gsa/foundation/console_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace gsa::foundation {

namespace {

namespace kci = kcenon::common::interfaces;

std::string_view levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARNING";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRITICAL";
        default:                       return "OFF";
    }
}

class ConsoleLogger : public kci::ILogger {
public:
    explicit ConsoleLogger(std::ostream& out) : out_(out) {}

    kcenon::common::VoidResult log(kci::log_level level,
                                   const std::string& message) override {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif

        std::lock_guard lock(mutex_);
        out_ << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << ' '
             << levelTag(level) << ' ' << message << '\n';
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        kci::log_level level, std::string_view message,
        const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        out_.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<kci::log_level> minLevel_{kci::log_level::trace};
};

} // anonymous namespace

void installConsoleLogger(std::ostream& out) {
    kci::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<ConsoleLogger>(out));
}

} // namespace gsa::foundation
