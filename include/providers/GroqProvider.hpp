#pragma once

#include "providers/ChatCompletionsAdapter.hpp"

namespace llmgate::providers {

class GroqProvider : public ChatCompletionsAdapter {
   public:
    explicit GroqProvider(ProviderProfile profile);

   protected:
    std::string authFailureMessage() const override;
};

}  // namespace llmgate::providers
