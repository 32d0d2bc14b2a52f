#include "providers/ProviderRegistry.hpp"

#include "providers/FireworksProvider.hpp"
#include "providers/GroqProvider.hpp"
#include "providers/OpenAIProvider.hpp"
#include "providers/PerplexityProvider.hpp"

#include <utility>

namespace llmgate::providers {

std::shared_ptr<const ProviderAdapter> makeAdapter(ProviderProfile profile) {
    switch (profile.provider) {
        case core::Provider::OpenAI:
            return std::make_shared<OpenAIProvider>(std::move(profile));
        case core::Provider::Groq:
            return std::make_shared<GroqProvider>(std::move(profile));
        case core::Provider::Fireworks:
            return std::make_shared<FireworksProvider>(std::move(profile));
        case core::Provider::Perplexity:
            return std::make_shared<PerplexityProvider>(std::move(profile));
    }
    return nullptr;
}

ProviderRegistry::ProviderRegistry(std::vector<ProviderProfile> profiles) {
    for (auto &profile : profiles) {
        const auto provider = profile.provider;
        if (auto adapter = makeAdapter(std::move(profile))) {
            adapters_[provider] = std::move(adapter);
        }
    }
}

std::shared_ptr<const ProviderAdapter> ProviderRegistry::find(core::Provider provider) const {
    auto it = adapters_.find(provider);
    if (it == adapters_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<core::Provider> ProviderRegistry::providers() const {
    std::vector<core::Provider> keys;
    keys.reserve(adapters_.size());
    for (const auto &entry : adapters_) {
        keys.push_back(entry.first);
    }
    return keys;
}

}  // namespace llmgate::providers
