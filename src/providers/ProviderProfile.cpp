#include "providers/ProviderProfile.hpp"

#include <algorithm>
#include <cstdint>

namespace llmgate::providers {

bool RetryPolicy::isRetryableStatus(int status) const {
    return std::find(retryableStatuses.begin(), retryableStatuses.end(), status) != retryableStatuses.end();
}

std::chrono::milliseconds RetryPolicy::delayBeforeAttempt(std::size_t attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }
    return backoffStep * static_cast<std::int64_t>(attempt - 1);
}

std::string ProviderProfile::primaryKeyEnv() const {
    return apiKeyEnv.empty() ? std::string{"API_KEY"} : apiKeyEnv.front();
}

ProviderProfile defaultProfile(core::Provider provider) {
    ProviderProfile profile;
    profile.provider = provider;

    switch (provider) {
        case core::Provider::OpenAI:
            profile.name = "OpenAI";
            profile.baseUrl = "https://api.openai.com/v1";
            profile.apiKeyEnv = {"OPENAI_API_KEY"};
            profile.defaultModel = "gpt-4.1";
            profile.capabilities = {.supportsStreaming = true, .supportsTools = true, .tokenCeiling = 4096};
            profile.deadline = std::chrono::seconds(120);
            profile.reasoningMethod = "tool_augmented";
            break;
        case core::Provider::Groq:
            profile.name = "Groq";
            profile.baseUrl = "https://api.groq.com/openai/v1";
            profile.apiKeyEnv = {"GROQ_API_KEY", "QROQ_API_KEY"};
            profile.defaultModel = "deepseek-r1-distill-qwen-32b";
            profile.modelAliases = {
                {"qwen-2.5-coder-32b", "llama-3-70b-chat"},
                {"llama-3.3-70b-versatile", "llama-3-70b-chat"},
                {"mixtral-8x7b-32768", "mixtral-8x7b-32768"},
                {"qwen-qwq-32b", "llama-3-70b-chat"},
                {"llama-3.2-90b-vision-preview", "llama-3-70b-chat"},
            };
            profile.defaultTemperature = 0.7;
            profile.capabilities = {.supportsStreaming = true, .supportsTools = true, .tokenCeiling = 32000};
            profile.deadline = std::chrono::seconds(180);
            profile.reasoningMethod = "chain_of_thought";
            break;
        case core::Provider::Fireworks:
            profile.name = "Fireworks";
            profile.baseUrl = "https://api.fireworks.ai/inference/v1";
            profile.apiKeyEnv = {"FIREWORKS_API_KEY"};
            profile.defaultModel = "accounts/fireworks/models/llama-v2-70b-chat";
            profile.defaultTemperature = 0.5;
            profile.defaultTopP = 0.9;
            profile.capabilities = {.supportsStreaming = true, .supportsTools = true, .tokenCeiling = 8192};
            profile.deadline = std::chrono::seconds(28);
            break;
        case core::Provider::Perplexity:
            profile.name = "Perplexity";
            profile.baseUrl = "https://api.perplexity.ai";
            profile.apiKeyEnv = {"PERPLEXITY_API_KEY"};
            profile.defaultModel = "sonar-medium-online";
            profile.capabilities = {.supportsStreaming = false, .supportsTools = false, .tokenCeiling = 8192};
            profile.deadline = std::chrono::seconds(25);
            profile.reasoningMethod = "web_search";
            profile.search = SearchProfile{
                .model = "sonar-medium-online",
                .systemPrompt =
                    "You are a helpful assistant that provides accurate information with online search capabilities.",
                .temperature = 0.7,
                .maxTokens = 2048,
            };
            break;
    }
    return profile;
}

}  // namespace llmgate::providers
