#include <drogon/drogon.h>
#include <json/json.h>
#include <trantor/utils/ConcurrentTaskQueue.h>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <pthread.h>
#include <signal.h>
#endif

#include "engine/CprTransport.hpp"
#include "engine/Gateway.hpp"
#include "http/HttpServer.hpp"
#include "llmgate/app_config.h"
#include "llmgate/environment.h"
#include "llmgate/gateway_config.h"
#include "llmgate/logging.h"
#include "llmgate/middleware/request_id.h"
#include "llmgate/version.h"
#include "providers/ProviderRegistry.hpp"

namespace {
std::atomic<bool> shutdownRequested{false};
#ifndef _WIN32
void installSignalHandlers() {
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    sigaddset(&sigset, SIGTERM);

    pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    std::thread([sigset]() mutable {
        int signo = 0;
        while (sigwait(&sigset, &signo) == 0) {
            if (!shutdownRequested.exchange(true)) {
                drogon::app().getLoop()->queueInLoop([]() {
                    LOG_INFO << "Shutdown signal received. Stopping server.";
                    drogon::app().quit();
                });
            }
        }
    }).detach();
}
#else
BOOL WINAPI consoleHandler(DWORD signal) {
    if (signal == CTRL_C_EVENT || signal == CTRL_BREAK_EVENT || signal == CTRL_CLOSE_EVENT) {
        if (!shutdownRequested.exchange(true)) {
            drogon::app().getLoop()->queueInLoop([]() {
                LOG_INFO << "Shutdown signal received. Stopping server.";
                drogon::app().quit();
            });
        }
        return TRUE;
    }
    return FALSE;
}

void installSignalHandlers() {
    SetConsoleCtrlHandler(consoleHandler, TRUE);
}
#endif

YAML::Node loadYaml(const std::filesystem::path &path) {
    try {
        return YAML::LoadFile(path.string());
    } catch (const std::exception &ex) {
        std::cerr << "Failed to load " << path.string() << ": " << ex.what() << std::endl;
    }
    return YAML::Node();
}

template <typename T>
T getAttribute(const drogon::AttributesPtr &attributes, const std::string &key, T fallback) {
    if (!attributes || !attributes->find(key)) {
        return fallback;
    }
    return attributes->get<T>(key);
}

}  // namespace

int main() {
    using namespace drogon;

    llmgate::loadDotEnv(".env");
    const std::filesystem::path configDir = llmgate::getEnvOrDefault("LLMGATE_CONFIG_DIR", "config");

    YAML::Node serverConfig = loadYaml(configDir / "server.yaml");
    YAML::Node loggingConfig = loadYaml(configDir / "logging.yaml");

    auto config = llmgate::loadAppConfig(serverConfig, loggingConfig);
    llmgate::initializeLogging(config.logLevel, loggingConfig);

    const auto providersPath = configDir / "providers.yaml";
    if (std::filesystem::exists(providersPath)) {
        llmgate::validateProviderConfig(providersPath);
    }
    auto registry = std::make_shared<const llmgate::providers::ProviderRegistry>(
        llmgate::loadProviderProfiles(providersPath));
    for (auto provider : registry->providers()) {
        LOG_INFO << "Provider enabled: " << llmgate::core::providerKey(provider);
    }

    llmgate::http::ServerContext context;
    context.gateway = std::make_shared<const llmgate::engine::Gateway>(
        registry, std::make_shared<llmgate::engine::CprTransport>(), config.stream.maxEventBytes);
    context.upstreamWorkers = std::make_shared<trantor::ConcurrentTaskQueue>(config.upstreamWorkers, "upstream");
    context.stream = config.stream;

    auto &application = drogon::app();
    application.enableServerHeader(false);
    application.enableDateHeader(true);

    llmgate::applyAppConfig(config);

    application.registerFilter(std::make_shared<llmgate::middleware::RequestIdMiddleware>());

    application.registerPostHandlingAdvice([](const HttpRequestPtr &req, const HttpResponsePtr &resp) {
        auto attributes = req->attributes();
        const auto requestId = getAttribute<std::string>(attributes, "request_id", req->getHeader("X-Request-ID"));
        if (resp && !requestId.empty()) {
            resp->addHeader("X-Request-ID", requestId);
        }

        llmgate::LogContext context = llmgate::currentLogContext();
        context.requestId = requestId;
        context.provider = getAttribute<std::string>(attributes, "llmgate.provider", context.provider);
        context.route = std::string{req->path()};
        context.status = resp ? static_cast<int>(resp->getStatusCode()) : 0;
        const auto started = getAttribute(attributes, "request_started", std::chrono::steady_clock::time_point{});
        if (started != std::chrono::steady_clock::time_point{}) {
            context.latencyMs =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        }
        context.hasRequest = true;
        llmgate::updateLogContext(context);
        LOG_INFO << "request complete";

        llmgate::clearLogContext();
    });

    const auto startTime = std::chrono::system_clock::now();

    application.registerHandler(
        "/health",
        [startTime, registry](const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback) {
            Json::Value payload(Json::objectValue);
            payload["status"] = "ok";
            payload["service"] = LLMGATE_SERVICE_NAME;
            payload["version"] = LLMGATE_VERSION;
            payload["uptime_seconds"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startTime).count());
            Json::Value providers(Json::arrayValue);
            for (auto provider : registry->providers()) {
                providers.append(std::string(llmgate::core::providerKey(provider)));
            }
            payload["providers"] = std::move(providers);

            auto response = HttpResponse::newHttpJsonResponse(payload);
            response->setStatusCode(k200OK);
            response->addHeader("Access-Control-Allow-Origin", "*");
            callback(response);
        },
        {Get, std::string{llmgate::middleware::kRequestIdFilter}});

    llmgate::http::HttpServer::registerRoutes(context);

    installSignalHandlers();

    LOG_INFO << "Starting " << LLMGATE_SERVICE_NAME << " " << LLMGATE_VERSION << " on " << config.host << ':'
             << config.port << " with " << config.upstreamWorkers << " upstream workers";

    application.run();
    LOG_INFO << "Server stopped.";

    return 0;
}
