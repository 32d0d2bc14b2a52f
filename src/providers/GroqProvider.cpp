#include "providers/GroqProvider.hpp"

#include <utility>

namespace llmgate::providers {

GroqProvider::GroqProvider(ProviderProfile profile) : ChatCompletionsAdapter(std::move(profile)) {}

std::string GroqProvider::authFailureMessage() const {
    return "Invalid API key. Please check your " + profile().primaryKeyEnv() + ".";
}

}  // namespace llmgate::providers
