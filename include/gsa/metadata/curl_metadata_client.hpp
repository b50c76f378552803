#pragma once

/// @file curl_metadata_client.hpp
/// @brief libcurl implementation of IMetadataClient.

#include <string>
#include <unordered_map>

#include "gsa/foundation/agent_result.hpp"
#include "gsa/metadata/metadata_client.hpp"

namespace gsa::metadata {

/// Metadata client issuing HTTP requests with libcurl.
///
/// Watch requests are sent as
/// `GET <base><key>?wait_for_change=true&last_etag=<token>&timeout_sec=<n>`.
/// The wait flag and token travel in the query string only: the metadata
/// server ignores them as headers. Every request carries
/// `Metadata-Flavor: Google`.
///
/// Transfers run on a curl multi handle so that a stop request wakes the
/// poll and aborts the transfer without waiting for the server hold.
///
/// Not thread-safe: drive each instance from one thread at a time.
class CurlMetadataClient final : public IMetadataClient {
public:
    explicit CurlMetadataClient(MetadataClientConfig config = {});

    /// Perform libcurl's process-wide initialization once.
    /// Called by the constructor; exposed for the entry point to fail fast.
    static foundation::AgentResult<void> globalInit();

    WatchOutcome watchKey(std::string_view key, std::stop_token stop) override;
    WatchOutcome getKey(std::string_view key, std::stop_token stop) override;

    /// Change token that the next watchKey(@p key) will send.
    [[nodiscard]] std::string lastEtag(std::string_view key) const;

    [[nodiscard]] const MetadataClientConfig& config() const noexcept { return config_; }

private:
    struct Response;

    [[nodiscard]] std::string keyUrl(std::string_view key) const;
    Response perform(const std::string& url, std::stop_token stop) const;

    MetadataClientConfig config_;
    std::unordered_map<std::string, std::string> etags_;
};

} // namespace gsa::metadata
