#pragma once

#include "providers/ChatCompletionsAdapter.hpp"

namespace llmgate::providers {

// Online search models. Answers carry sources either as citation tool calls or
// as top-level citations / search_results arrays.
class PerplexityProvider : public ChatCompletionsAdapter {
   public:
    explicit PerplexityProvider(ProviderProfile profile);

   protected:
    Json::Value transformRequest(Json::Value body, const core::ChatRequest &request) const override;
    std::vector<core::Citation> extractCitations(const Json::Value &payload) const override;
};

}  // namespace llmgate::providers
