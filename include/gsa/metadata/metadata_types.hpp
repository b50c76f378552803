#pragma once

/// @file metadata_types.hpp
/// @brief Watch outcomes and client configuration for the metadata server.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gsa::metadata {

/// Default metadata server root.
inline constexpr std::string_view kDefaultMetadataBaseUrl =
    "http://169.254.169.254/computeMetadata/v1/";

/// Change token the server treats as "nothing observed yet".
inline constexpr std::string_view kInitialEtag = "NONE";

/// Kind of result produced by one metadata request.
enum class WatchStatus : uint8_t {
    Found,           ///< 2xx with a value (and a new change token when watching)
    NotPresent,      ///< 404: the key is not exposed for this instance
    TransportError,  ///< network failure, unexpected status or malformed reply
    Cancelled        ///< the caller's stop token fired
};

constexpr std::string_view toString(WatchStatus s) {
    switch (s) {
        case WatchStatus::Found:          return "found";
        case WatchStatus::NotPresent:     return "not_present";
        case WatchStatus::TransportError: return "transport_error";
        case WatchStatus::Cancelled:      return "cancelled";
    }
    return "unknown";
}

/// Tagged result of one watch or get request.
///
/// Matched on status(); value() is meaningful only for Found, detail()
/// and httpStatus() only for TransportError.
class WatchOutcome {
public:
    static WatchOutcome found(std::string value) {
        return WatchOutcome(WatchStatus::Found, std::move(value), {}, std::nullopt);
    }

    static WatchOutcome notPresent() {
        return WatchOutcome(WatchStatus::NotPresent, {}, {}, std::nullopt);
    }

    static WatchOutcome transportError(std::string detail,
                                       std::optional<long> httpStatus = std::nullopt) {
        return WatchOutcome(WatchStatus::TransportError, {}, std::move(detail), httpStatus);
    }

    static WatchOutcome cancelled() {
        return WatchOutcome(WatchStatus::Cancelled, {}, {}, std::nullopt);
    }

    [[nodiscard]] WatchStatus status() const noexcept { return status_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] std::optional<long> httpStatus() const noexcept { return httpStatus_; }

    [[nodiscard]] bool isFound() const noexcept { return status_ == WatchStatus::Found; }

private:
    WatchOutcome(WatchStatus status, std::string value, std::string detail,
                 std::optional<long> httpStatus)
        : status_(status), value_(std::move(value)), detail_(std::move(detail)),
          httpStatus_(httpStatus) {}

    WatchStatus status_;
    std::string value_;
    std::string detail_;
    std::optional<long> httpStatus_;
};

/// Settings for CurlMetadataClient.
struct MetadataClientConfig {
    /// Server root; keys are appended to it.
    std::string baseUrl{kDefaultMetadataBaseUrl};

    /// Longest the server may hold a wait_for_change request (timeout_sec).
    std::chrono::seconds watchTimeout{60};

    /// Local limit on a whole request; must exceed watchTimeout.
    std::chrono::seconds requestTimeout{70};

    std::chrono::seconds connectTimeout{10};
};

} // namespace gsa::metadata
