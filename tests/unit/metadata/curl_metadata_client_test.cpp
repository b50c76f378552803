#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "gsa/metadata/curl_metadata_client.hpp"

#include "fake_metadata_server.hpp"

using namespace gsa::metadata;
using namespace std::chrono_literals;
using gsa::testing::FakeMetadataServer;
using gsa::testing::FakeRequest;
using gsa::testing::FakeResponse;
using gsa::testing::StopStateServerModel;

namespace {

constexpr const char* kStopStateKey = "instance/shutdown-details/stop-state";

MetadataClientConfig testConfig(const FakeMetadataServer& server) {
    MetadataClientConfig config;
    config.baseUrl = server.baseUrl();
    config.watchTimeout = 2s;
    config.requestTimeout = 5s;
    config.connectTimeout = 2s;
    return config;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Fixture: stop-state model behind a loopback server
// ---------------------------------------------------------------------------

class CurlMetadataClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = std::make_unique<StopStateServerModel>(50ms);
        server_ = std::make_unique<FakeMetadataServer>(model_->handler());
        if (!server_->start()) {
            GTEST_SKIP() << "cannot bind a loopback socket";
        }
        client_ = std::make_unique<CurlMetadataClient>(testConfig(*server_));
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    std::unique_ptr<StopStateServerModel> model_;
    std::unique_ptr<FakeMetadataServer> server_;
    std::unique_ptr<CurlMetadataClient> client_;
};

TEST_F(CurlMetadataClientTest, WatchReturnsValueAndStoresEtag) {
    model_->setValue("RUNNING");

    auto outcome = client_->watchKey(kStopStateKey, {});

    ASSERT_EQ(outcome.status(), WatchStatus::Found) << outcome.detail();
    EXPECT_EQ(outcome.value(), "RUNNING");
    EXPECT_EQ(client_->lastEtag(kStopStateKey), model_->currentEtag());
}

TEST_F(CurlMetadataClientTest, WatchParametersTravelInQueryString) {
    model_->setValue("RUNNING");

    auto outcome = client_->watchKey(kStopStateKey, {});
    ASSERT_TRUE(outcome.isFound()) << outcome.detail();

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& req = requests[0];
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, std::string("/computeMetadata/v1/") + kStopStateKey);
    EXPECT_EQ(req.queryValue("wait_for_change"), "true");
    EXPECT_EQ(req.queryValue("last_etag"), "NONE");
    EXPECT_EQ(req.queryValue("timeout_sec"), "2");
    EXPECT_EQ(req.header("metadata-flavor"), "Google");
    EXPECT_EQ(req.headers.count("wait_for_change"), 0u);
    EXPECT_EQ(req.headers.count("last_etag"), 0u);
}

TEST_F(CurlMetadataClientTest, SecondWatchSendsPreviousEtag) {
    model_->setValue("RUNNING");
    ASSERT_TRUE(client_->watchKey(kStopStateKey, {}).isFound());
    auto firstEtag = client_->lastEtag(kStopStateKey);

    // Unchanged value: the model holds, then answers with the same token.
    auto outcome = client_->watchKey(kStopStateKey, {});
    ASSERT_TRUE(outcome.isFound()) << outcome.detail();

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].queryValue("last_etag"), firstEtag);
}

TEST_F(CurlMetadataClientTest, ChangedValueIsReportedWithNewEtag) {
    model_->setValue("RUNNING");
    ASSERT_TRUE(client_->watchKey(kStopStateKey, {}).isFound());
    auto firstEtag = client_->lastEtag(kStopStateKey);

    model_->setValue("PENDING_STOP");
    auto outcome = client_->watchKey(kStopStateKey, {});
    ASSERT_TRUE(outcome.isFound()) << outcome.detail();
    EXPECT_EQ(outcome.value(), "PENDING_STOP");
    EXPECT_NE(client_->lastEtag(kStopStateKey), firstEtag);
}

TEST_F(CurlMetadataClientTest, AbsentKeyIsNotPresent) {
    auto outcome = client_->watchKey(kStopStateKey, {});

    EXPECT_EQ(outcome.status(), WatchStatus::NotPresent);
    EXPECT_FALSE(outcome.httpStatus().has_value());
    EXPECT_EQ(client_->lastEtag(kStopStateKey), "NONE");
}

TEST_F(CurlMetadataClientTest, PreCancelledWatchSendsNothing) {
    model_->setValue("RUNNING");
    std::stop_source source;
    source.request_stop();

    auto outcome = client_->watchKey(kStopStateKey, source.get_token());

    EXPECT_EQ(outcome.status(), WatchStatus::Cancelled);
    EXPECT_EQ(server_->requestCount(), 0u);
}

TEST_F(CurlMetadataClientTest, GetKeyHasNoWatchParameters) {
    model_->setValue("RUNNING");

    auto outcome = client_->getKey(kStopStateKey, {});
    ASSERT_TRUE(outcome.isFound()) << outcome.detail();
    EXPECT_EQ(outcome.value(), "RUNNING");

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests[0].query.empty());
    EXPECT_EQ(requests[0].header("metadata-flavor"), "Google");
    EXPECT_EQ(client_->lastEtag(kStopStateKey), "NONE");
}

TEST_F(CurlMetadataClientTest, GetKeyAbsentIsNotPresent) {
    EXPECT_EQ(client_->getKey(kStopStateKey, {}).status(), WatchStatus::NotPresent);
}

TEST(CurlMetadataClientBasicTest, DefaultConfig) {
    CurlMetadataClient client;
    EXPECT_EQ(client.config().baseUrl, std::string(kDefaultMetadataBaseUrl));
    EXPECT_EQ(client.config().watchTimeout, 60s);
    EXPECT_GT(client.config().requestTimeout, client.config().watchTimeout);
    EXPECT_EQ(client.lastEtag(kStopStateKey), "NONE");
}

TEST(CurlMetadataClientBasicTest, GlobalInitIsIdempotent) {
    EXPECT_TRUE(CurlMetadataClient::globalInit().hasValue());
    EXPECT_TRUE(CurlMetadataClient::globalInit().hasValue());
}

// ---------------------------------------------------------------------------
// Scripted responses
// ---------------------------------------------------------------------------

class ScriptedServerTest : public ::testing::Test {
protected:
    void startWith(gsa::testing::FakeHandler handler) {
        server_ = std::make_unique<FakeMetadataServer>(std::move(handler));
        if (!server_->start()) {
            GTEST_SKIP() << "cannot bind a loopback socket";
        }
        client_ = std::make_unique<CurlMetadataClient>(testConfig(*server_));
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    std::unique_ptr<FakeMetadataServer> server_;
    std::unique_ptr<CurlMetadataClient> client_;
};

TEST_F(ScriptedServerTest, ServerErrorIsTransportError) {
    startWith([](const FakeRequest&) {
        return FakeResponse{.status = 503, .body = "backend unavailable"};
    });
    if (IsSkipped()) { return; }

    auto outcome = client_->watchKey(kStopStateKey, {});

    ASSERT_EQ(outcome.status(), WatchStatus::TransportError);
    EXPECT_EQ(outcome.httpStatus(), 503L);
    EXPECT_NE(outcome.detail().find("503"), std::string::npos);
    EXPECT_NE(outcome.detail().find("backend unavailable"), std::string::npos);
    EXPECT_EQ(client_->lastEtag(kStopStateKey), "NONE");
}

TEST_F(ScriptedServerTest, MissingEtagIsTransportError) {
    startWith([](const FakeRequest&) {
        return FakeResponse{.status = 200, .body = "RUNNING"};
    });
    if (IsSkipped()) { return; }

    auto outcome = client_->watchKey(kStopStateKey, {});

    ASSERT_EQ(outcome.status(), WatchStatus::TransportError);
    EXPECT_EQ(outcome.httpStatus(), 200L);
    EXPECT_NE(outcome.detail().find("ETag"), std::string::npos);
    EXPECT_EQ(client_->lastEtag(kStopStateKey), "NONE");
}

TEST_F(ScriptedServerTest, EtagIsPercentEncodedInQuery) {
    const std::string odd = "W/\"a b&c=d+e\"";
    startWith([odd](const FakeRequest&) {
        return FakeResponse{.status = 200, .body = "RUNNING", .etag = odd};
    });
    if (IsSkipped()) { return; }

    ASSERT_TRUE(client_->watchKey(kStopStateKey, {}).isFound());
    EXPECT_EQ(client_->lastEtag(kStopStateKey), odd);
    ASSERT_TRUE(client_->watchKey(kStopStateKey, {}).isFound());

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].queryValue("last_etag"), odd);
    EXPECT_EQ(requests[1].queryValue("timeout_sec"), "2");
}

TEST_F(ScriptedServerTest, EtagsAreTrackedPerKey) {
    startWith([](const FakeRequest& req) {
        return FakeResponse{.status = 200, .body = "v", .etag = "tag-for-" + req.path};
    });
    if (IsSkipped()) { return; }

    ASSERT_TRUE(client_->watchKey("instance/a", {}).isFound());
    EXPECT_EQ(client_->lastEtag("instance/a"), "tag-for-/computeMetadata/v1/instance/a");
    EXPECT_EQ(client_->lastEtag("instance/b"), "NONE");

    ASSERT_TRUE(client_->watchKey("instance/b", {}).isFound());
    EXPECT_EQ(client_->lastEtag("instance/b"), "tag-for-/computeMetadata/v1/instance/b");
    EXPECT_EQ(client_->lastEtag("instance/a"), "tag-for-/computeMetadata/v1/instance/a");
}

TEST_F(ScriptedServerTest, CancelDuringHoldReturnsPromptly) {
    startWith([](const FakeRequest&) {
        FakeResponse response;
        response.holdUntilStopped = true;
        return response;
    });
    if (IsSkipped()) { return; }

    std::stop_source source;
    std::jthread stopper([&source] {
        std::this_thread::sleep_for(100ms);
        source.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = client_->watchKey(kStopStateKey, source.get_token());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status(), WatchStatus::Cancelled);
    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(client_->lastEtag(kStopStateKey), "NONE");
}

TEST_F(ScriptedServerTest, KeyJoinsBaseUrlWithSingleSlash) {
    startWith([](const FakeRequest&) {
        return FakeResponse{.status = 200, .body = "v", .etag = "e"};
    });
    if (IsSkipped()) { return; }

    auto config = testConfig(*server_);
    config.baseUrl.pop_back();  // drop trailing '/'
    CurlMetadataClient client(config);
    ASSERT_TRUE(client.getKey("/instance/id", {}).isFound());

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].path, "/computeMetadata/v1/instance/id");
}

TEST(CurlMetadataClientErrorTest, ConnectionRefusedIsTransportError) {
    FakeMetadataServer server([](const FakeRequest&) { return FakeResponse{}; });
    if (!server.start()) {
        GTEST_SKIP() << "cannot bind a loopback socket";
    }
    auto config = testConfig(server);
    server.stop();  // port is now closed

    CurlMetadataClient client(config);
    auto outcome = client.watchKey(kStopStateKey, {});

    ASSERT_EQ(outcome.status(), WatchStatus::TransportError);
    EXPECT_FALSE(outcome.httpStatus().has_value());
    EXPECT_FALSE(outcome.detail().empty());
    EXPECT_EQ(client.lastEtag(kStopStateKey), "NONE");
}

// ---------------------------------------------------------------------------
// WatchOutcome
// ---------------------------------------------------------------------------

TEST(WatchOutcomeTest, Factories) {
    auto found = WatchOutcome::found("PENDING_STOP");
    EXPECT_TRUE(found.isFound());
    EXPECT_EQ(found.value(), "PENDING_STOP");

    auto absent = WatchOutcome::notPresent();
    EXPECT_EQ(absent.status(), WatchStatus::NotPresent);
    EXPECT_FALSE(absent.httpStatus().has_value());

    auto failed = WatchOutcome::transportError("boom", 500L);
    EXPECT_EQ(failed.status(), WatchStatus::TransportError);
    EXPECT_EQ(failed.detail(), "boom");
    EXPECT_EQ(failed.httpStatus(), 500L);

    EXPECT_EQ(WatchOutcome::cancelled().status(), WatchStatus::Cancelled);
}

TEST(WatchOutcomeTest, StatusNames) {
    EXPECT_EQ(toString(WatchStatus::Found), "found");
    EXPECT_EQ(toString(WatchStatus::NotPresent), "not_present");
    EXPECT_EQ(toString(WatchStatus::TransportError), "transport_error");
    EXPECT_EQ(toString(WatchStatus::Cancelled), "cancelled");
}
