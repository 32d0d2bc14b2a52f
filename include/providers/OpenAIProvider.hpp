#pragma once

#include "providers/ChatCompletionsAdapter.hpp"

namespace llmgate::providers {

class OpenAIProvider : public ChatCompletionsAdapter {
   public:
    explicit OpenAIProvider(ProviderProfile profile);

   protected:
    Json::Value transformRequest(Json::Value body, const core::ChatRequest &request) const override;
    Json::Value adaptTool(const Json::Value &tool) const override;
};

}  // namespace llmgate::providers
