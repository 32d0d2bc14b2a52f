#include "llmgate/gateway_config.h"

#include "llmgate/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace llmgate {
namespace {

using providers::ProviderProfile;

constexpr std::array<core::Provider, 4> kProviders{
    core::Provider::OpenAI,
    core::Provider::Groq,
    core::Provider::Fireworks,
    core::Provider::Perplexity,
};

std::map<std::string, std::string> parseStringMap(const YAML::Node &node) {
    std::map<std::string, std::string> values;
    if (!node || !node.IsMap()) {
        return values;
    }
    for (const auto &entry : node) {
        auto key = entry.first.as<std::string>("");
        auto value = resolveScalar(entry.second);
        if (!key.empty()) {
            values[std::move(key)] = std::move(value);
        }
    }
    return values;
}

std::string parseString(const YAML::Node &node, const std::string &fallback) {
    auto scalar = resolveScalar(node);
    return scalar.empty() ? fallback : scalar;
}

std::chrono::milliseconds parseDuration(const YAML::Node &node, std::chrono::milliseconds fallback) {
    if (!node) {
        return fallback;
    }
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return std::chrono::milliseconds(std::stoll(scalar));
    } catch (const std::exception &) {
        return fallback;
    }
}

int parseInt(const YAML::Node &node, int fallback) {
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return std::stoi(scalar);
    } catch (const std::exception &) {
        return fallback;
    }
}

std::optional<double> parseDouble(const YAML::Node &node, std::optional<double> fallback) {
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return std::stod(scalar);
    } catch (const std::exception &) {
        return fallback;
    }
}

bool parseBool(const YAML::Node &node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return YAML::Node(resolveScalar(node)).as<bool>(fallback);
    } catch (const std::exception &) {
        return fallback;
    }
}

// Accepts either a single name or a list of names.
std::vector<std::string> parseKeyNames(const YAML::Node &node, std::vector<std::string> fallback) {
    if (!node) {
        return fallback;
    }
    if (node.IsScalar()) {
        auto name = resolveScalar(node);
        return name.empty() ? fallback : std::vector<std::string>{name};
    }
    if (!node.IsSequence()) {
        return fallback;
    }
    std::vector<std::string> names;
    for (const auto &item : node) {
        auto name = resolveScalar(item);
        if (!name.empty()) {
            names.push_back(std::move(name));
        }
    }
    return names.empty() ? fallback : names;
}

std::vector<int> parseStatuses(const YAML::Node &node, std::vector<int> fallback) {
    if (!node || !node.IsSequence()) {
        return fallback;
    }
    std::vector<int> statuses;
    for (const auto &item : node) {
        auto status = parseInt(item, 0);
        if (status >= 100 && status <= 599) {
            statuses.push_back(status);
        }
    }
    return statuses;
}

}  // namespace

std::string resolveScalar(const YAML::Node &node) {
    if (!node || !node.IsScalar()) {
        return {};
    }
    auto text = node.as<std::string>("");
    if (text.size() >= 3 && text.front() == '$' && text[1] == '{' && text.back() == '}') {
        auto inner = text.substr(2, text.size() - 3);
        auto delim = inner.find(":-");
        std::string envKey = inner.substr(0, delim == std::string::npos ? inner.size() : delim);
        std::string defaultValue = delim == std::string::npos ? std::string{} : inner.substr(delim + 2);
        auto envValue = getEnv(envKey);
        if (envValue.has_value() && !envValue->empty()) {
            return *envValue;
        }
        return defaultValue;
    }
    return text;
}

std::optional<std::string> resolveApiKey(const std::vector<std::string> &envNames) {
    return firstEnv(envNames);
}

ProviderProfile applyProfileOverrides(ProviderProfile profile, const YAML::Node &node) {
    if (!node || !node.IsMap()) {
        return profile;
    }

    profile.name = parseString(node["display_name"], profile.name);
    profile.baseUrl = parseString(node["base_url"], profile.baseUrl);
    profile.chatPath = parseString(node["chat_path"], profile.chatPath);
    profile.apiKeyEnv = parseKeyNames(node["api_key_env"], profile.apiKeyEnv);
    profile.authHeader = parseString(node["auth_header"], profile.authHeader);
    if (node["auth_scheme"]) {
        profile.authScheme = resolveScalar(node["auth_scheme"]);
    }
    for (auto &[key, value] : parseStringMap(node["default_headers"])) {
        profile.defaultHeaders[key] = std::move(value);
    }
    profile.defaultModel = parseString(node["default_model"], profile.defaultModel);
    if (node["model_aliases"]) {
        profile.modelAliases = parseStringMap(node["model_aliases"]);
    }
    if (node["tool_key_renames"]) {
        profile.toolKeyRenames = parseStringMap(node["tool_key_renames"]);
    }
    profile.defaultMaxTokens = parseInt(node["default_max_tokens"], profile.defaultMaxTokens);
    profile.defaultTemperature = parseDouble(node["default_temperature"], profile.defaultTemperature);
    profile.defaultTopP = parseDouble(node["default_top_p"], profile.defaultTopP);
    profile.deadline = parseDuration(node["timeout_ms"], profile.deadline);
    profile.connectTimeout = parseDuration(node["connect_timeout_ms"], profile.connectTimeout);
    profile.requestBudget = parseDuration(node["request_budget_ms"], profile.requestBudget);
    profile.reasoningMethod = parseString(node["reasoning_method"], profile.reasoningMethod);

    if (auto retry = node["retry"]; retry && retry.IsMap()) {
        auto attempts = parseInt(retry["max_attempts"], static_cast<int>(profile.retry.maxAttempts));
        profile.retry.maxAttempts = attempts < 1 ? 1 : static_cast<std::size_t>(attempts);
        profile.retry.backoffStep = parseDuration(retry["backoff_step_ms"], profile.retry.backoffStep);
        profile.retry.retryableStatuses = parseStatuses(retry["retryable_statuses"], profile.retry.retryableStatuses);
    }

    if (auto caps = node["capabilities"]; caps && caps.IsMap()) {
        profile.capabilities.supportsStreaming = parseBool(caps["streaming"], profile.capabilities.supportsStreaming);
        profile.capabilities.supportsTools = parseBool(caps["tools"], profile.capabilities.supportsTools);
        profile.capabilities.tokenCeiling = parseInt(caps["token_ceiling"], profile.capabilities.tokenCeiling);
    }

    if (auto search = node["search"]; search && search.IsMap()) {
        auto base = profile.search.value_or(providers::SearchProfile{.model = profile.defaultModel});
        base.model = parseString(search["model"], base.model);
        base.systemPrompt = parseString(search["system_prompt"], base.systemPrompt);
        base.temperature = parseDouble(search["temperature"], base.temperature).value_or(base.temperature);
        base.maxTokens = parseInt(search["max_tokens"], base.maxTokens);
        profile.search = std::move(base);
    }

    return profile;
}

std::vector<ProviderProfile> loadProviderProfiles(const std::filesystem::path &path) {
    YAML::Node providersNode;
    try {
        if (std::filesystem::exists(path)) {
            providersNode = YAML::LoadFile(path.string())["providers"];
        } else {
            LOG_WARN << "Provider configuration " << path << " not found; using built-in provider defaults.";
        }
    } catch (const std::exception &ex) {
        LOG_WARN << "Unable to load provider configuration from " << path << ": " << ex.what();
        providersNode = YAML::Node();
    }

    std::vector<ProviderProfile> profiles;
    profiles.reserve(kProviders.size());
    for (const auto provider : kProviders) {
        auto profile = providers::defaultProfile(provider);
        if (providersNode && providersNode.IsMap()) {
            const std::string key(core::providerKey(provider));
            if (auto node = providersNode[key]; node) {
                if (!parseBool(node["enabled"], true)) {
                    LOG_INFO << "Provider " << key << " disabled in configuration";
                    continue;
                }
                profile = applyProfileOverrides(std::move(profile), node);
            }
        }
        profile.apiKey = resolveApiKey(profile.apiKeyEnv);
        if (!profile.apiKey.has_value()) {
            LOG_WARN << "Provider " << profile.name << " has no API key; set " << profile.primaryKeyEnv();
        }
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

void validateProviderConfig(const std::filesystem::path &path) {
    try {
        const auto config = YAML::LoadFile(path.string());
        if (!config || !config["providers"]) {
            LOG_WARN << "Provider configuration is empty or missing; built-in defaults apply.";
            return;
        }

        const auto providersNode = config["providers"];
        if (!providersNode.IsMap()) {
            LOG_WARN << "Provider configuration is malformed; expected a map of providers.";
            return;
        }

        for (const auto &entry : providersNode) {
            const auto name = entry.first.as<std::string>("unknown");
            if (!core::parseProvider(name).has_value()) {
                LOG_WARN << "Unknown provider " << name << " in providers.yaml is ignored.";
                continue;
            }
            const auto provider = entry.second;
            if (!provider.IsMap()) {
                LOG_WARN << "Provider " << name << " must be an object in providers.yaml.";
                continue;
            }
            if (provider["base_url"] && resolveScalar(provider["base_url"]).empty()) {
                LOG_WARN << "Provider " << name << " has an empty base_url";
            }
        }
    } catch (const std::exception &ex) {
        LOG_WARN << "Unable to load provider configuration from " << path << ": " << ex.what();
    }
}

}  // namespace llmgate
