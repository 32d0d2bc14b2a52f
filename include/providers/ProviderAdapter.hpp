#pragma once

#include "core/ChatTypes.hpp"
#include "core/GatewayError.hpp"
#include "providers/ProviderProfile.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <string_view>

namespace llmgate::providers {

struct RequestContext {
    std::string requestId;
};

struct OutboundPayload {
    std::string url;
    std::map<std::string, std::string> headers;
    Json::Value body;
    core::CallMode mode{core::CallMode::Buffered};
    // Model actually sent upstream, used when wording errors.
    std::string model;
};

class ProviderAdapter {
   public:
    virtual ~ProviderAdapter() = default;

    [[nodiscard]] virtual core::Provider provider() const = 0;
    [[nodiscard]] virtual const ProviderProfile &profile() const = 0;

    virtual core::Outcome<OutboundPayload> encode(const core::ChatRequest &request,
                                                  core::CallMode mode,
                                                  const RequestContext &context) const = 0;
    virtual core::Outcome<core::ChatResult> decode(std::string_view rawBody) const = 0;
    virtual core::GatewayError decodeError(int status, std::string_view rawBody, const std::string &model) const = 0;

    [[nodiscard]] const Capabilities &capabilities() const { return profile().capabilities; }
};

}  // namespace llmgate::providers
