#pragma once

/// @file agent_error.hpp
/// @brief Error type used with Result<T, AgentError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "gsa/foundation/error_code.hpp"

namespace gsa::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional typed context (for example the HTTP status of a failed
/// metadata request).
class AgentError {
public:
    AgentError() = default;

    explicit AgentError(ErrorCode code)
        : code_(code) {}

    AgentError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AgentError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch or when absent.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for the error handed back when the caller's stop token fired.
    [[nodiscard]] bool isCancelled() const noexcept {
        return code_ == ErrorCode::Cancelled;
    }

    friend bool operator==(const AgentError& a, const AgentError& b) noexcept {
        return a.code_ == b.code_ && a.message_ == b.message_;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// The error returned to a driver whose stop token fired mid-call.
inline AgentError cancelledError() {
    return AgentError(ErrorCode::Cancelled, "operation cancelled");
}

} // namespace gsa::foundation
