#pragma once

#include "providers/ChatCompletionsAdapter.hpp"

namespace llmgate::providers {

class FireworksProvider : public ChatCompletionsAdapter {
   public:
    explicit FireworksProvider(ProviderProfile profile);

   protected:
    std::string authFailureMessage() const override;
    std::string rateLimitMessage() const override;
};

}  // namespace llmgate::providers
