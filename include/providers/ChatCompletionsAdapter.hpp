#pragma once

#include "providers/ProviderAdapter.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::providers {

// OpenAI-compatible chat/completions wire format. Every supported provider
// speaks a dialect of it; subclasses override the hooks where they diverge.
class ChatCompletionsAdapter : public ProviderAdapter {
   public:
    explicit ChatCompletionsAdapter(ProviderProfile profile);
    ~ChatCompletionsAdapter() override;

    [[nodiscard]] core::Provider provider() const override { return profile_.provider; }
    [[nodiscard]] const ProviderProfile &profile() const override { return profile_; }

    core::Outcome<OutboundPayload> encode(const core::ChatRequest &request,
                                          core::CallMode mode,
                                          const RequestContext &context) const override;
    core::Outcome<core::ChatResult> decode(std::string_view rawBody) const override;
    core::GatewayError decodeError(int status, std::string_view rawBody, const std::string &model) const override;

   protected:
    virtual Json::Value transformRequest(Json::Value body, const core::ChatRequest &request) const;
    virtual Json::Value adaptTool(const Json::Value &tool) const;
    virtual void augmentHeaders(std::map<std::string, std::string> &headers, core::CallMode mode) const;
    virtual std::vector<core::Citation> extractCitations(const Json::Value &payload) const;

    virtual std::string authFailureMessage() const;
    virtual std::string rateLimitMessage() const;
    virtual std::string modelNotFoundMessage(const std::string &model) const;

    std::map<std::string, std::string> buildHeaders(const std::string &apiKey,
                                                    const RequestContext &context,
                                                    core::CallMode mode) const;
    std::string buildUrl() const;

    // Parses one citation/web_search tool call; never fails.
    static core::Citation parseCitationCall(const Json::Value &toolCall);
    static bool isCitationCall(const Json::Value &toolCall);

   private:
    std::string errorSummary(int status) const;

    ProviderProfile profile_;
};

}  // namespace llmgate::providers
