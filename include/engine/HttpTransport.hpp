#pragma once

#include "core/CancellationToken.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace llmgate::engine {

struct TransportRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    // Buffered: whole exchange. Streamed: until response headers arrive.
    std::chrono::milliseconds timeout{120000};
    std::chrono::milliseconds connectTimeout{5000};
};

enum class TransportFailure {
    None,
    Timeout,
    Unreachable,
    Cancelled,
};

struct TransportResponse {
    int status{0};
    // Full body for buffered calls; for streams only the body of a rejected (non-2xx) response.
    std::string body;
    TransportFailure failure{TransportFailure::None};
    std::string errorMessage;

    [[nodiscard]] bool ok() const { return failure == TransportFailure::None; }
};

struct StreamCallbacks {
    // Called once headers are complete. Returning false keeps the body out of onData.
    std::function<bool(int status)> onStatus;
    // Returning false aborts the transfer.
    std::function<bool(std::string_view chunk)> onData;
};

class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    virtual TransportResponse post(const TransportRequest &request, const core::CancellationToken::Ptr &cancel) = 0;
    virtual TransportResponse postStream(const TransportRequest &request,
                                         const StreamCallbacks &callbacks,
                                         const core::CancellationToken::Ptr &cancel) = 0;
};

}  // namespace llmgate::engine
