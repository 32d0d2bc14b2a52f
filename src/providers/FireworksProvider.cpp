#include "providers/FireworksProvider.hpp"

#include <utility>

namespace llmgate::providers {

FireworksProvider::FireworksProvider(ProviderProfile profile) : ChatCompletionsAdapter(std::move(profile)) {}

std::string FireworksProvider::authFailureMessage() const {
    return "Authentication failed. Please check your Fireworks API key.";
}

std::string FireworksProvider::rateLimitMessage() const {
    return "Rate limit exceeded. Please try again in a few moments.";
}

}  // namespace llmgate::providers
