#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate {

struct StreamSettings {
    std::chrono::milliseconds heartbeat{15000};
    std::size_t maxEventBytes{1U << 20U};
    std::size_t maxBufferedBytes{4U << 20U};
};

struct AppConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t threads{0};
    std::size_t upstreamWorkers{16};
    std::size_t maxBodyBytes{1U << 20U};
    std::string logLevel{"info"};
    StreamSettings stream;
};

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig);
void applyAppConfig(const AppConfig &config);

}  // namespace llmgate
