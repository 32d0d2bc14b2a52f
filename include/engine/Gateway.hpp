#pragma once

#include "core/CancellationToken.hpp"
#include "core/ChatTypes.hpp"
#include "engine/CallExecutor.hpp"
#include "engine/ResponseTranslator.hpp"
#include "engine/StreamRelay.hpp"
#include "providers/ProviderRegistry.hpp"

#include <json/json.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace llmgate::engine {

// Request pipeline shared by every route: normalize, encode, execute,
// translate. Holds no per-request state.
class Gateway {
   public:
    Gateway(std::shared_ptr<const providers::ProviderRegistry> registry,
            std::shared_ptr<HttpTransport> transport,
            std::size_t maxEventBytes = 1U << 20U);

    [[nodiscard]] bool knows(core::Provider provider) const;

    Envelope chat(core::Provider provider,
                  const Json::Value &body,
                  const providers::RequestContext &context,
                  const core::CancellationToken::Ptr &cancel = nullptr) const;

    Envelope search(const Json::Value &body,
                    const providers::RequestContext &context,
                    const core::CancellationToken::Ptr &cancel = nullptr) const;

    // Returns an envelope when the request is rejected before any upstream
    // call; otherwise the outcome, errors included, goes through the sink.
    std::optional<Envelope> stream(core::Provider provider,
                                   const Json::Value &body,
                                   const providers::RequestContext &context,
                                   EventSink &sink,
                                   const core::CancellationToken::Ptr &cancel = nullptr) const;

    static Envelope unknownProvider(const std::string &name);

   private:
    std::shared_ptr<const providers::ProviderAdapter> adapterFor(core::Provider provider) const;

    std::shared_ptr<const providers::ProviderRegistry> registry_;
    CallExecutor executor_;
    std::size_t maxEventBytes_;
};

}  // namespace llmgate::engine
