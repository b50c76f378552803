/// @file curl_metadata_client.cpp
/// @brief Long-poll metadata requests over a libcurl multi handle.

#include "gsa/metadata/curl_metadata_client.hpp"

#include "gsa/foundation/agent_logger.hpp"

#include <curl/curl.h>

#include <array>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stop_token>

namespace gsa::metadata {

using foundation::AgentError;
using foundation::AgentResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr int kPollTimeoutMs = 1000;

std::string percentEncode(std::string_view s) {
    std::ostringstream o;
    for (unsigned char c : s) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            o << c;
        } else {
            o << '%' << std::hex << std::uppercase
              << static_cast<int>(c >> 4) << static_cast<int>(c & 0x0F)
              << std::nouppercase << std::dec;
        }
    }
    return o.str();
}

std::string trimHeaderValue(std::string_view v) {
    std::size_t b = 0;
    std::size_t e = v.size();
    while (b < e && (v[b] == ' ' || v[b] == '\t')) { ++b; }
    while (e > b && (v[e - 1] == ' ' || v[e - 1] == '\t' || v[e - 1] == '\r' ||
                     v[e - 1] == '\n')) {
        --e;
    }
    return std::string(v.substr(b, e - b));
}

bool iequalsPrefix(std::string_view line, std::string_view prefix) {
    if (line.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct MultiDeleter {
    void operator()(CURLM* h) const { curl_multi_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MultiHandle = std::unique_ptr<CURLM, MultiDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

/// Keeps an easy handle attached to a multi handle for one transfer.
class MultiAttachment {
public:
    MultiAttachment(CURLM* multi, CURL* easy)
        : multi_(multi), easy_(easy), rc_(curl_multi_add_handle(multi, easy)) {}
    ~MultiAttachment() {
        if (rc_ == CURLM_OK) {
            curl_multi_remove_handle(multi_, easy_);
        }
    }

    MultiAttachment(const MultiAttachment&) = delete;
    MultiAttachment& operator=(const MultiAttachment&) = delete;

    [[nodiscard]] CURLMcode status() const noexcept { return rc_; }

private:
    CURLM* multi_;
    CURL* easy_;
    CURLMcode rc_;
};

struct HeaderState {
    std::optional<std::string> etag;
};

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}

size_t readHeader(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<HeaderState*>(userdata);
    size_t total = size * nmemb;
    std::string_view line(ptr, total);

    // A new status line starts a new header block (1xx, redirects).
    if (iequalsPrefix(line, "HTTP/")) {
        state->etag.reset();
    } else if (iequalsPrefix(line, "etag:")) {
        auto value = trimHeaderValue(line.substr(5));
        if (!value.empty()) {
            state->etag = std::move(value);
        }
    }
    return total;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
struct CurlMetadataClient::Response {
    bool cancelled = false;
    std::optional<std::string> failure;  // set when no HTTP status is usable
    long httpStatus = 0;
    std::string body;
    std::optional<std::string> etag;
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
CurlMetadataClient::CurlMetadataClient(MetadataClientConfig config)
    : config_(std::move(config)) {
    auto init = globalInit();
    if (!init) {
        GSA_LOG_ERROR(LogCategory::Metadata, init.error().message());
    }
}

AgentResult<void> CurlMetadataClient::globalInit() {
    static std::once_flag once;
    static CURLcode rc = CURLE_OK;
    std::call_once(once, [] { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (rc != CURLE_OK) {
        return AgentResult<void>::err(AgentError(
            ErrorCode::MetadataClientInitFailed,
            std::string("curl_global_init failed: ") + curl_easy_strerror(rc)));
    }
    return AgentResult<void>::ok();
}

std::string CurlMetadataClient::keyUrl(std::string_view key) const {
    std::string url = config_.baseUrl;
    while (!key.empty() && key.front() == '/') {
        key.remove_prefix(1);
    }
    if (url.empty() || url.back() != '/') {
        url += '/';
    }
    url += key;
    return url;
}

std::string CurlMetadataClient::lastEtag(std::string_view key) const {
    auto it = etags_.find(std::string(key));
    return it == etags_.end() ? std::string(kInitialEtag) : it->second;
}

// ---------------------------------------------------------------------------
// perform()
// ---------------------------------------------------------------------------
CurlMetadataClient::Response CurlMetadataClient::perform(const std::string& url,
                                                         std::stop_token stop) const {
    Response resp;
    if (stop.stop_requested()) {
        resp.cancelled = true;
        return resp;
    }

    EasyHandle easy(curl_easy_init());
    MultiHandle multi(curl_multi_init());
    if (!easy || !multi) {
        resp.failure = "failed to allocate curl handles";
        return resp;
    }

    HeaderList headers(curl_slist_append(nullptr, "Metadata-Flavor: Google"));
    HeaderState headerState;
    std::array<char, CURL_ERROR_SIZE> errbuf{};

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, readHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &headerState);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf.data());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.requestTimeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connectTimeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    // The metadata server is link-local; never route it through a proxy.
    curl_easy_setopt(h, CURLOPT_NOPROXY, "*");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);

    MultiAttachment attachment(multi.get(), h);
    if (attachment.status() != CURLM_OK) {
        resp.failure = std::string("curl_multi_add_handle failed: ") +
                       curl_multi_strerror(attachment.status());
        return resp;
    }

    // Declared after the handles so it is torn down before them.
    CURLM* m = multi.get();
    std::stop_callback wake(stop, [m] { curl_multi_wakeup(m); });

    int running = 1;
    for (;;) {
        CURLMcode mc = curl_multi_perform(m, &running);
        if (mc != CURLM_OK) {
            resp.failure = std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc);
            return resp;
        }
        if (running == 0) {
            break;
        }
        if (stop.stop_requested()) {
            resp.cancelled = true;
            return resp;
        }
        mc = curl_multi_poll(m, nullptr, 0, kPollTimeoutMs, nullptr);
        if (mc != CURLM_OK) {
            resp.failure = std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc);
            return resp;
        }
        if (stop.stop_requested()) {
            resp.cancelled = true;
            return resp;
        }
    }

    CURLcode result = CURLE_OK;
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(m, &queued)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == h) {
            result = msg->data.result;
        }
    }

    if (result != CURLE_OK) {
        std::string detail = errbuf[0] != '\0' ? std::string(errbuf.data())
                                               : std::string(curl_easy_strerror(result));
        resp.failure = "GET " + url + " failed: " + detail;
        return resp;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.httpStatus);
    resp.etag = std::move(headerState.etag);
    return resp;
}

// ---------------------------------------------------------------------------
// watchKey() / getKey()
// ---------------------------------------------------------------------------
WatchOutcome CurlMetadataClient::watchKey(std::string_view key, std::stop_token stop) {
    std::string url = keyUrl(key);
    url += "?wait_for_change=true&last_etag=" + percentEncode(lastEtag(key));
    url += "&timeout_sec=" + std::to_string(config_.watchTimeout.count());

    GSA_LOG_DEBUG(LogCategory::Metadata, "watch " + url);

    auto resp = perform(url, stop);
    if (resp.cancelled) {
        return WatchOutcome::cancelled();
    }
    if (resp.failure) {
        return WatchOutcome::transportError(*resp.failure);
    }
    if (resp.httpStatus == 404) {
        return WatchOutcome::notPresent();
    }
    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        return WatchOutcome::transportError(
            "GET " + url + ": unexpected HTTP status " + std::to_string(resp.httpStatus) +
                (resp.body.empty() ? "" : ": " + resp.body),
            resp.httpStatus);
    }
    if (!resp.etag) {
        return WatchOutcome::transportError(
            "GET " + url + ": response carries no ETag header", resp.httpStatus);
    }

    etags_[std::string(key)] = std::move(*resp.etag);
    return WatchOutcome::found(std::move(resp.body));
}

WatchOutcome CurlMetadataClient::getKey(std::string_view key, std::stop_token stop) {
    std::string url = keyUrl(key);

    auto resp = perform(url, stop);
    if (resp.cancelled) {
        return WatchOutcome::cancelled();
    }
    if (resp.failure) {
        return WatchOutcome::transportError(*resp.failure);
    }
    if (resp.httpStatus == 404) {
        return WatchOutcome::notPresent();
    }
    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        return WatchOutcome::transportError(
            "GET " + url + ": unexpected HTTP status " + std::to_string(resp.httpStatus),
            resp.httpStatus);
    }
    return WatchOutcome::found(std::move(resp.body));
}

} // namespace gsa::metadata
