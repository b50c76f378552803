#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <thread>

#include "gsa/foundation/error_code.hpp"
#include "gsa/service/agent_config.hpp"
#include "gsa/service/service_runner.hpp"

using namespace gsa::service;
using namespace std::chrono_literals;
using gsa::foundation::ConfigManager;
using gsa::foundation::ErrorCode;
using gsa::foundation::LogLevel;

// ---------------------------------------------------------------------------
// agentConfigFrom
// ---------------------------------------------------------------------------

TEST(AgentConfigTest, EmptyConfigUsesDefaults) {
    ConfigManager config;
    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.metadata.baseUrl, "http://169.254.169.254/computeMetadata/v1/");
    EXPECT_EQ(cfg.metadata.watchTimeout, 60s);
    EXPECT_EQ(cfg.metadata.requestTimeout, 70s);
    EXPECT_EQ(cfg.watcher.key, "instance/shutdown-details/stop-state");
    EXPECT_EQ(cfg.watcher.actionValue, "PENDING_STOP");
    EXPECT_EQ(cfg.watcher.notFoundDelay, 60s);
    EXPECT_EQ(cfg.watcher.transportErrorDelay, 5s);
    EXPECT_EQ(cfg.script.serviceUnit, "google-graceful-shutdown-scripts.service");
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
}

TEST(AgentConfigTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(
                          "metadata:\n"
                          "  base_url: http://127.0.0.1:9000/computeMetadata/v1/\n"
                          "  watch_timeout_seconds: 30\n"
                          "  request_timeout_seconds: 45\n"
                          "  connect_timeout_seconds: 3\n"
                          "watcher:\n"
                          "  key: instance/custom\n"
                          "  action_value: GO\n"
                          "  not_found_delay_seconds: 0\n"
                          "  transport_error_delay_seconds: 2\n"
                          "script:\n"
                          "  systemctl_path: /bin/systemctl\n"
                          "  service_unit: other.service\n"
                          "  runner_name: runner.exe\n"
                          "  runner_argument: stop\n"
                          "logging:\n"
                          "  level: debug\n")
                    .hasValue());

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.metadata.baseUrl, "http://127.0.0.1:9000/computeMetadata/v1/");
    EXPECT_EQ(cfg.metadata.watchTimeout, 30s);
    EXPECT_EQ(cfg.metadata.requestTimeout, 45s);
    EXPECT_EQ(cfg.metadata.connectTimeout, 3s);
    EXPECT_EQ(cfg.watcher.key, "instance/custom");
    EXPECT_EQ(cfg.watcher.actionValue, "GO");
    EXPECT_EQ(cfg.watcher.notFoundDelay, 0s);
    EXPECT_EQ(cfg.watcher.transportErrorDelay, 2s);
    EXPECT_EQ(cfg.script.systemctlPath, "/bin/systemctl");
    EXPECT_EQ(cfg.script.serviceUnit, "other.service");
    EXPECT_EQ(cfg.script.runnerName, "runner.exe");
    EXPECT_EQ(cfg.script.runnerArgument, "stop");
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
}

TEST(AgentConfigTest, RequestTimeoutIsRaisedAboveWatchTimeout) {
    ConfigManager config;
    config.set<int>("metadata.watch_timeout_seconds", 120);

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().metadata.requestTimeout, 130s);
}

TEST(AgentConfigTest, ZeroWatchTimeoutIsRejected) {
    ConfigManager config;
    config.set<int>("metadata.watch_timeout_seconds", 0);

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(AgentConfigTest, NegativeDelayIsRejected) {
    ConfigManager config;
    config.set<int>("watcher.transport_error_delay_seconds", -1);

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(AgentConfigTest, NonNumericTimeoutIsTypeMismatch) {
    ConfigManager config;
    config.set<std::string>("metadata.watch_timeout_seconds", "a minute");

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(AgentConfigTest, EmptyKeyIsRejected) {
    ConfigManager config;
    config.set<std::string>("watcher.key", "");

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(AgentConfigTest, UnknownLogLevelIsRejected) {
    ConfigManager config;
    config.set<std::string>("logging.level", "chatty");

    auto result = agentConfigFrom(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ---------------------------------------------------------------------------
// parseConfigArg
// ---------------------------------------------------------------------------

TEST(ParseConfigArgTest, FindsConfigPath) {
    char prog[] = "gsa_agent";
    char flag[] = "--config";
    char path[] = "/tmp/agent.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/agent.yaml"));
}

TEST(ParseConfigArgTest, AbsentOrDanglingFlag) {
    char prog[] = "gsa_agent";
    char flag[] = "--config";
    char* argvNone[] = {prog};
    char* argvDangling[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(1, argvNone).empty());
    EXPECT_TRUE(parseConfigArg(2, argvDangling).empty());
}

TEST(ParseConfigArgTest, AcceptsEqualsForm) {
    char prog[] = "gsa_agent";
    char flag[] = "--config=/tmp/agent.yaml";
    char empty[] = "--config=";
    char* argv[] = {prog, flag};
    char* argvEmpty[] = {prog, empty};
    EXPECT_EQ(parseConfigArg(2, argv), std::filesystem::path("/tmp/agent.yaml"));
    EXPECT_TRUE(parseConfigArg(2, argvEmpty).empty());
}

TEST(ParseConfigArgTest, IgnoresSimilarFlags) {
    char prog[] = "gsa_agent";
    char flag[] = "--configuration";
    char path[] = "/tmp/agent.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_TRUE(parseConfigArg(3, argv).empty());
}

// ---------------------------------------------------------------------------
// resolveConfigPath
// ---------------------------------------------------------------------------

#if !defined(_WIN32)

class ResolveConfigPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "gsa_resolve_config_test";
        tempDir_ /= ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::create_directories(tempDir_);
        unsetenv("GSA_CONFIG_PATH");
    }

    void TearDown() override {
        unsetenv("GSA_CONFIG_PATH");
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path writeYaml(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path tempDir_;
};

TEST_F(ResolveConfigPathTest, FallsBackToDefaultPath) {
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));
}

TEST_F(ResolveConfigPathTest, CommandLinePathWins) {
    auto path = writeYaml("cli.yaml", "watcher:\n  key: from-cli\n");

    auto resolved = resolveConfigPath(path);
    EXPECT_EQ(resolved, path);

    ConfigManager config;
    ASSERT_TRUE(config.load(resolved).hasValue());
    EXPECT_EQ(config.get<std::string>("watcher.key").value(), "from-cli");
}

TEST_F(ResolveConfigPathTest, EnvironmentOverridesCommandLine) {
    auto cliPath = writeYaml("cli.yaml", "watcher:\n  key: from-cli\n");
    auto envPath = writeYaml("env.yaml", "watcher:\n  key: from-env\n");
    setenv("GSA_CONFIG_PATH", envPath.c_str(), 1);

    auto resolved = resolveConfigPath(cliPath);
    EXPECT_EQ(resolved, envPath);

    ConfigManager config;
    ASSERT_TRUE(config.load(resolved).hasValue());
    EXPECT_EQ(config.get<std::string>("watcher.key").value(), "from-env");
}

TEST_F(ResolveConfigPathTest, EmptyEnvironmentIsIgnored) {
    setenv("GSA_CONFIG_PATH", "", 1);
    EXPECT_EQ(resolveConfigPath("/tmp/agent.yaml"), std::filesystem::path("/tmp/agent.yaml"));
}

TEST_F(ResolveConfigPathTest, MissingFileFailsToLoad) {
    ConfigManager config;
    auto result = config.load(resolveConfigPath(tempDir_ / "absent.yaml"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

#endif

// ---------------------------------------------------------------------------
// SignalHandler
// ---------------------------------------------------------------------------

TEST(SignalHandlerTest, WaitReturnsFalseWhenStopped) {
    SignalHandler handler;
    EXPECT_FALSE(handler.shutdownRequested());

    std::stop_source source;
    std::jthread stopper([&source] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });
    EXPECT_FALSE(handler.waitForShutdown(source.get_token()));
}
