#pragma once

#include "core/ChatTypes.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::providers {

// Shared by every adapter; only the numbers differ per provider.
struct RetryPolicy {
    std::size_t maxAttempts{3};
    std::chrono::milliseconds backoffStep{3000};
    std::vector<int> retryableStatuses{502, 504};

    [[nodiscard]] bool isRetryableStatus(int status) const;
    // Linear: attempt 2 waits one step, attempt 3 waits two.
    [[nodiscard]] std::chrono::milliseconds delayBeforeAttempt(std::size_t attempt) const;
};

struct Capabilities {
    bool supportsStreaming{true};
    bool supportsTools{true};
    int tokenCeiling{4096};
};

struct SearchProfile {
    std::string model;
    std::string systemPrompt;
    double temperature{0.7};
    int maxTokens{2048};
};

struct ProviderProfile {
    core::Provider provider{core::Provider::OpenAI};
    std::string name;
    std::string baseUrl;
    std::string chatPath{"chat/completions"};
    // Checked in order; the first non-empty value wins.
    std::vector<std::string> apiKeyEnv;
    std::optional<std::string> apiKey;
    std::string authHeader{"Authorization"};
    std::string authScheme{"Bearer"};
    std::map<std::string, std::string> defaultHeaders;
    std::string defaultModel;
    std::map<std::string, std::string> modelAliases;
    std::map<std::string, std::string> toolKeyRenames;
    int defaultMaxTokens{4096};
    std::optional<double> defaultTemperature;
    std::optional<double> defaultTopP;
    std::chrono::milliseconds deadline{120000};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds requestBudget{300000};
    RetryPolicy retry;
    Capabilities capabilities;
    std::string reasoningMethod{"standard"};
    std::optional<SearchProfile> search;

    [[nodiscard]] std::string primaryKeyEnv() const;
};

ProviderProfile defaultProfile(core::Provider provider);

}  // namespace llmgate::providers
