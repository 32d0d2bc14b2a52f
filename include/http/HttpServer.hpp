#pragma once

#include "engine/Gateway.hpp"
#include "llmgate/app_config.h"

#include <trantor/utils/ConcurrentTaskQueue.h>

#include <memory>

namespace llmgate::http {

struct ServerContext {
    std::shared_ptr<const engine::Gateway> gateway;
    // Outbound calls block, so they never run on the HTTP event loops.
    std::shared_ptr<trantor::ConcurrentTaskQueue> upstreamWorkers;
    StreamSettings stream;
};

class HttpServer {
  public:
    static void registerRoutes(const ServerContext &context);
};

}  // namespace llmgate::http
