#pragma once

#include "engine/HttpTransport.hpp"

#include <cstddef>

namespace llmgate::engine {

class CprTransport : public HttpTransport {
   public:
    explicit CprTransport(std::size_t maxErrorBodyBytes = 64 * 1024) : maxErrorBodyBytes_(maxErrorBodyBytes) {}

    TransportResponse post(const TransportRequest &request, const core::CancellationToken::Ptr &cancel) override;
    TransportResponse postStream(const TransportRequest &request,
                                 const StreamCallbacks &callbacks,
                                 const core::CancellationToken::Ptr &cancel) override;

   private:
    std::size_t maxErrorBodyBytes_;
};

}  // namespace llmgate::engine
