#pragma once

#include "core/ChatTypes.hpp"
#include "core/GatewayError.hpp"
#include "providers/ProviderProfile.hpp"

#include <json/json.h>

#include <string>

namespace llmgate::engine {

// Turns a client body into a provider-agnostic ChatRequest. Defaults, aliases
// and the token ceiling all come from the provider profile.
class RequestNormalizer {
   public:
    explicit RequestNormalizer(const providers::ProviderProfile &profile) : profile_(profile) {}

    [[nodiscard]] core::Outcome<core::ChatRequest> normalizeChat(const Json::Value &body) const;
    // Body is {"query": "..."}; the rest comes from the search profile.
    [[nodiscard]] core::Outcome<core::ChatRequest> normalizeSearch(const Json::Value &body) const;

    static bool validateMessages(const Json::Value &messages, std::string &error);

   private:
    [[nodiscard]] std::string resolveModel(const std::string &requested) const;
    [[nodiscard]] int clampMaxTokens(double requested) const;

    const providers::ProviderProfile &profile_;
};

}  // namespace llmgate::engine
