#pragma once

#include "core/CancellationToken.hpp"
#include "core/ChatTypes.hpp"
#include "core/GatewayError.hpp"
#include "engine/HttpTransport.hpp"
#include "engine/StreamRelay.hpp"
#include "providers/ProviderAdapter.hpp"

#include <memory>
#include <optional>

namespace llmgate::engine {

// Runs one outbound call under the adapter's deadline and retry policy. Blocks
// the calling thread; callers run it on the upstream worker queue.
class CallExecutor {
   public:
    explicit CallExecutor(std::shared_ptr<HttpTransport> transport);

    [[nodiscard]] core::Outcome<core::ChatResult> execute(const providers::ProviderAdapter &adapter,
                                                          const providers::OutboundPayload &payload,
                                                          const core::CancellationToken::Ptr &cancel = nullptr) const;

    // Drives the relay to Closed. Failures that reach the client in-stream are
    // also returned so the caller can log them.
    std::optional<core::GatewayError> stream(const providers::ProviderAdapter &adapter,
                                             const providers::OutboundPayload &payload,
                                             StreamRelay &relay,
                                             const core::CancellationToken::Ptr &cancel = nullptr) const;

   private:
    std::shared_ptr<HttpTransport> transport_;
};

}  // namespace llmgate::engine
