#include "llmgate/logging.h"

#include <drogon/drogon.h>
#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace llmgate {
namespace {

struct RedactionRule {
    std::regex pattern;
    std::string replacement;
};

std::mutex logMutex;
std::unique_ptr<std::ofstream> fileSink;
std::vector<RedactionRule> redactionRules;

thread_local LogContext threadLogContext{};

std::string isoTimestampUtc() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto seconds = time_point_cast<std::chrono::seconds>(now);
    const auto micro = duration_cast<microseconds>(now - seconds).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T");
    oss << '.' << std::setw(6) << std::setfill('0') << micro << 'Z';
    return oss.str();
}

trantor::Logger::LogLevel toTrantorLevel(const std::string &level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") {
        return trantor::Logger::kTrace;
    }
    if (lowered == "debug") {
        return trantor::Logger::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return trantor::Logger::kWarn;
    }
    if (lowered == "error") {
        return trantor::Logger::kError;
    }
    if (lowered == "fatal" || lowered == "critical") {
        return trantor::Logger::kFatal;
    }
    return trantor::Logger::kInfo;
}

// trantor lines look like "20240101 12:00:00.000000 UTC 1234 INFO message - file.cc:42".
std::string extractLevel(std::string_view message) {
    static constexpr std::string_view levels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    for (auto level : levels) {
        auto pos = message.find(level);
        if (pos != std::string_view::npos && pos + level.size() < message.size() &&
            message[pos + level.size()] == ' ') {
            return std::string(level);
        }
    }
    return "INFO";
}

void emitLogPayload(const nlohmann::json &payload) {
    const std::string serialized = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(logMutex);
    std::cout << serialized << std::endl;
    if (fileSink && fileSink->is_open()) {
        (*fileSink) << serialized << std::endl;
    }
}

template <typename T>
void putOrNull(nlohmann::json &payload, const char *key, const T &value, bool present) {
    if (present) {
        payload[key] = value;
    } else {
        payload[key] = nullptr;
    }
}

}  // namespace

ScopedLogContext::ScopedLogContext(LogContext context) : active_(true), previous_(currentLogContext()) {
    setLogContext(context);
}

ScopedLogContext::ScopedLogContext(ScopedLogContext &&other) noexcept
    : active_(std::exchange(other.active_, false)), previous_(std::move(other.previous_)) {}

ScopedLogContext &ScopedLogContext::operator=(ScopedLogContext &&other) noexcept {
    if (this != &other) {
        if (active_) {
            threadLogContext = previous_;
        }
        active_ = std::exchange(other.active_, false);
        previous_ = std::move(other.previous_);
    }
    return *this;
}

ScopedLogContext::~ScopedLogContext() {
    if (active_) {
        threadLogContext = previous_;
    }
}

void installDefaultRedactionRules() {
    redactionRules.clear();
    redactionRules.push_back({std::regex(R"(Bearer\s+[A-Za-z0-9._~+/=-]+)", std::regex::icase), "Bearer [REDACTED]"});
    redactionRules.push_back({std::regex(R"(\bsk-[A-Za-z0-9_-]{8,})"), "[REDACTED]"});
    redactionRules.push_back({std::regex(R"(\b(?:api[_-]?key|token|secret|authorization)\s*[:=]\s*[^\s,&"]+)",
                                         std::regex::icase),
                              "[REDACTED]"});
    redactionRules.push_back({std::regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", std::regex::icase),
                              "[REDACTED]"});
}

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig) {
    using trantor::Logger;

    Logger::setLogLevel(toTrantorLevel(level));

    bool enableStdout = true;
    bool enableFile = false;
    std::filesystem::path logPath;

    installDefaultRedactionRules();

    if (loggingConfig) {
        if (auto logging = loggingConfig["logging"]; logging) {
            if (auto stdoutNode = logging["stdout"]; stdoutNode) {
                enableStdout = stdoutNode.as<bool>(enableStdout);
            }
            if (auto fileNode = logging["file"]; fileNode) {
                enableFile = fileNode["enabled"].as<bool>(enableFile);
                if (enableFile && fileNode["path"]) {
                    logPath = fileNode["path"].as<std::string>();
                    if (!logPath.empty()) {
                        auto parent = logPath.parent_path();
                        if (!parent.empty()) {
                            std::error_code ec;
                            std::filesystem::create_directories(parent, ec);
                        }
                        fileSink = std::make_unique<std::ofstream>(logPath, std::ios::app);
                    }
                }
            }
            if (auto redactNode = logging["redact"]; redactNode) {
                if (auto patterns = redactNode["patterns"]; patterns && patterns.IsSequence()) {
                    for (const auto &pattern : patterns) {
                        try {
                            redactionRules.push_back({std::regex(pattern.as<std::string>()), "[REDACTED]"});
                        } catch (const std::regex_error &) {
                            LOG_WARN << "Invalid redaction regex ignored: " << pattern.as<std::string>("");
                        }
                    }
                }
            }
        }
    }

    if (!enableStdout) {
        std::cout.setstate(std::ios::failbit);
    }

    Logger::setOutputFunction(
        [](const char *msg, const uint64_t len) {
            std::string_view view(msg, len);
            if (!view.empty() && view.back() == '\n') {
                view.remove_suffix(1);
            }

            auto context = currentLogContext();

            nlohmann::json payload;
            payload["ts"] = isoTimestampUtc();
            payload["level"] = extractLevel(view);
            payload["msg"] = redactMessage(view);
            putOrNull(payload, "request_id", context.requestId, !context.requestId.empty());
            putOrNull(payload, "provider", context.provider, !context.provider.empty());
            putOrNull(payload, "route", context.route, !context.route.empty());
            putOrNull(payload, "status", context.status, context.status != 0);
            putOrNull(payload, "latency_ms", context.latencyMs, context.latencyMs > 0.0);

            emitLogPayload(payload);
        },
        []() {
            std::lock_guard<std::mutex> lock(logMutex);
            std::cout << std::flush;
            if (fileSink && fileSink->is_open()) {
                fileSink->flush();
            }
        });

    LOG_INFO << "Logging initialized";
}

void setLogContext(const LogContext &context) {
    threadLogContext = context;
    threadLogContext.hasRequest = true;
}

void updateLogContext(const LogContext &context) {
    if (!context.requestId.empty()) {
        threadLogContext.requestId = context.requestId;
    }
    if (!context.provider.empty()) {
        threadLogContext.provider = context.provider;
    }
    if (!context.route.empty()) {
        threadLogContext.route = context.route;
    }
    if (context.status != 0) {
        threadLogContext.status = context.status;
    }
    if (context.latencyMs > 0.0) {
        threadLogContext.latencyMs = context.latencyMs;
    }
    threadLogContext.hasRequest = threadLogContext.hasRequest || context.hasRequest || !threadLogContext.requestId.empty();
}

LogContext currentLogContext() {
    return threadLogContext;
}

void clearLogContext() {
    threadLogContext = LogContext{};
}

std::string redactMessage(std::string_view message) {
    std::string sanitized(message);
    for (const auto &rule : redactionRules) {
        sanitized = std::regex_replace(sanitized, rule.pattern, rule.replacement);
    }
    return sanitized;
}

}  // namespace llmgate
