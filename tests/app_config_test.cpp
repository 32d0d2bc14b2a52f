#include "llmgate/app_config.h"

#include "support/test_support.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

namespace {

using llmgate::testing::ScopedEnvVar;

class AppConfigTest : public ::testing::Test {
   protected:
    AppConfigTest() : host_("HOST"), port_("PORT"), level_("LOG_LEVEL"), workers_("UPSTREAM_WORKERS") {
        host_.clear();
        port_.clear();
        level_.clear();
        workers_.clear();
    }

    ScopedEnvVar host_;
    ScopedEnvVar port_;
    ScopedEnvVar level_;
    ScopedEnvVar workers_;
};

}  // namespace

TEST_F(AppConfigTest, ReadsServerAndStreamSettings) {
    auto server = YAML::Load(R"(
listeners:
  - address: 127.0.0.1
    port: 9090
app:
  threads: 4
  upstream_workers: 8
stream:
  heartbeat_ms: 5000
  max_event_bytes: 2048
)");
    auto logging = YAML::Load("logging:\n  level: debug\n");

    auto config = llmgate::loadAppConfig(server, logging);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.threads, 4U);
    EXPECT_EQ(config.upstreamWorkers, 8U);
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.stream.heartbeat, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.stream.maxEventBytes, 2048U);
    EXPECT_EQ(config.stream.maxBufferedBytes, 4U << 20U);
}

TEST_F(AppConfigTest, EnvironmentOverridesYaml) {
    host_.set("0.0.0.0");
    port_.set("7000");
    level_.set("warn");
    workers_.set("32");

    auto config = llmgate::loadAppConfig(YAML::Load("listeners:\n  - address: 127.0.0.1\n    port: 9090\n"), YAML::Node());

    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.logLevel, "warn");
    EXPECT_EQ(config.upstreamWorkers, 32U);
}

TEST_F(AppConfigTest, InvalidPortFallsBackToYaml) {
    port_.set("not-a-port");

    auto config = llmgate::loadAppConfig(YAML::Load("listeners:\n  - port: 9191\n"), YAML::Node());

    EXPECT_EQ(config.port, 9191);
    EXPECT_EQ(config.upstreamWorkers, 16U);
}
