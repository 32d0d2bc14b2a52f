#include "llmgate/middleware/request_id.h"

#include "llmgate/logging.h"

#include <drogon/HttpRequest.h>
#include <drogon/utils/Utilities.h>

#include <cctype>
#include <chrono>

namespace llmgate::middleware {

namespace {

constexpr std::size_t kMaxRequestIdLength = 128;

// Client supplied ids end up in logs and upstream headers.
bool isAcceptableRequestId(const std::string &value) {
    if (value.empty() || value.size() > kMaxRequestIdLength) {
        return false;
    }
    for (char ch : value) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

}  // namespace

void RequestIdMiddleware::doFilter(const drogon::HttpRequestPtr &req,
                                   drogon::FilterCallback &&fcb,
                                   drogon::FilterChainCallback &&fccb) {
    std::string requestId = req->getHeader("X-Request-ID");
    if (!isAcceptableRequestId(requestId)) {
        requestId = generateRequestId();
    }

    req->attributes()->insert("request_id", requestId);
    req->attributes()->insert("request_started", std::chrono::steady_clock::now());
    req->addHeader("X-Request-ID", requestId);

    LogContext logContext{};
    logContext.requestId = requestId;
    logContext.route = std::string{req->path()};
    logContext.hasRequest = true;
    setLogContext(logContext);

    (void)fcb;
    fccb();
}

std::string RequestIdMiddleware::generateRequestId() {
    return drogon::utils::genRandomString(16);
}

}  // namespace llmgate::middleware
