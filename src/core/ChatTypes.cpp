#include "core/ChatTypes.hpp"

#include <algorithm>
#include <cctype>

namespace llmgate::core {

std::string_view providerKey(Provider provider) {
    switch (provider) {
        case Provider::OpenAI:
            return "openai";
        case Provider::Groq:
            return "groq";
        case Provider::Fireworks:
            return "fireworks";
        case Provider::Perplexity:
            return "perplexity";
    }
    return "openai";
}

std::optional<Provider> parseProvider(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "openai") {
        return Provider::OpenAI;
    }
    if (lowered == "groq") {
        return Provider::Groq;
    }
    if (lowered == "fireworks") {
        return Provider::Fireworks;
    }
    if (lowered == "perplexity") {
        return Provider::Perplexity;
    }
    return std::nullopt;
}

}  // namespace llmgate::core
