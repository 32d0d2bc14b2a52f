#pragma once

#include "core/ChatTypes.hpp"
#include "core/GatewayError.hpp"
#include "providers/ProviderProfile.hpp"

#include <json/json.h>

#include <string>

namespace llmgate::engine {

struct Envelope {
    int status{200};
    Json::Value body;
};

class ResponseTranslator {
   public:
    // {answer, sources:[{title, url, snippet}]}
    static Envelope search(const core::ChatResult &result);
    // Provider body plus performance:{response_time_ms, reasoning_method}.
    static Envelope chat(const core::ChatResult &result, const providers::ProviderProfile &profile);
    // {error, message, details?} with the status the error kind maps to.
    static Envelope error(const core::GatewayError &error);

    // One outbound SSE frame, blank line included.
    static std::string streamFrame(const core::StreamEvent &event);
};

}  // namespace llmgate::engine
