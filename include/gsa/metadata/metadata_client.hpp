#pragma once

/// @file metadata_client.hpp
/// @brief Abstract metadata server client.

#include <stop_token>
#include <string_view>

#include "gsa/metadata/metadata_types.hpp"

namespace gsa::metadata {

/// Client for the instance metadata server.
///
/// Implementations keep the last observed change token of every key they
/// watch, so each watchKey() asks the server for a value different from
/// the one returned by the previous successful call for that key. Tokens
/// are private to the instance: construct one client per watcher.
class IMetadataClient {
public:
    virtual ~IMetadataClient() = default;

    /// Long-poll @p key until its value changes, the server-side hold
    /// expires, a transport error occurs, or @p stop is requested.
    ///
    /// Never retries internally. A stop request yields
    /// WatchStatus::Cancelled, never TransportError.
    virtual WatchOutcome watchKey(std::string_view key, std::stop_token stop) = 0;

    /// Read the current value of @p key without waiting for a change.
    /// Does not read or update the stored change token.
    virtual WatchOutcome getKey(std::string_view key, std::stop_token stop) = 0;
};

} // namespace gsa::metadata
