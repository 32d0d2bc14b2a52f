#include "llmgate/app_config.h"

#include "llmgate/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace llmgate {
namespace {

std::uint16_t parsePort(const std::string &value, std::uint16_t fallback) {
    try {
        auto portValue = std::stoul(value);
        if (portValue == 0 || portValue > 65535U) {
            return fallback;
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception &) {
        return fallback;
    }
}

std::size_t readSize(const YAML::Node &node, std::size_t fallback) {
    if (!node) {
        return fallback;
    }
    try {
        return node.as<std::size_t>(fallback);
    } catch (const std::exception &) {
        return fallback;
    }
}

}  // namespace

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig) {
    AppConfig config{};

    std::string defaultHost{config.host};
    std::uint16_t defaultPort{config.port};
    std::string defaultLogLevel{config.logLevel};

    if (serverConfig) {
        if (auto listeners = serverConfig["listeners"]; listeners && listeners.IsSequence() && listeners.size() > 0) {
            const auto listener = listeners[0];
            if (auto address = listener["address"]; address) {
                defaultHost = address.as<std::string>(defaultHost);
            }
            if (auto port = listener["port"]; port) {
                defaultPort = static_cast<std::uint16_t>(port.as<std::uint32_t>(defaultPort));
            }
        }
        if (auto appNode = serverConfig["app"]; appNode) {
            config.threads = readSize(appNode["threads"], config.threads);
            config.upstreamWorkers = readSize(appNode["upstream_workers"], config.upstreamWorkers);
            config.maxBodyBytes = readSize(appNode["max_body_bytes"], config.maxBodyBytes);
        }
        if (auto streamNode = serverConfig["stream"]; streamNode) {
            config.stream.heartbeat = std::chrono::milliseconds(
                readSize(streamNode["heartbeat_ms"], static_cast<std::size_t>(config.stream.heartbeat.count())));
            config.stream.maxEventBytes = readSize(streamNode["max_event_bytes"], config.stream.maxEventBytes);
            config.stream.maxBufferedBytes = readSize(streamNode["max_buffered_bytes"], config.stream.maxBufferedBytes);
        }
    }

    if (loggingConfig) {
        if (auto logging = loggingConfig["logging"]; logging) {
            defaultLogLevel = logging["level"].as<std::string>(defaultLogLevel);
        }
    }

    config.host = getEnvOrDefault("HOST", defaultHost);
    config.port = parsePort(getEnvOrDefault("PORT", std::to_string(defaultPort)), defaultPort);
    config.logLevel = getEnvOrDefault("LOG_LEVEL", defaultLogLevel);
    if (auto workers = getEnvInt("UPSTREAM_WORKERS", 0); workers > 0) {
        config.upstreamWorkers = static_cast<std::size_t>(workers);
    }
    if (config.upstreamWorkers == 0) {
        config.upstreamWorkers = 1;
    }

    return config;
}

void applyAppConfig(const AppConfig &config) {
    auto &application = drogon::app();
    application.addListener(config.host, config.port);
    if (config.threads > 0) {
        application.setThreadNum(config.threads);
    }
    application.setClientMaxBodySize(config.maxBodyBytes);
}

}  // namespace llmgate
