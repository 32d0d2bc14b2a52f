#pragma once

#include <drogon/HttpFilter.h>
#include <string>

namespace llmgate::middleware {

// Routes list the filter by this name to have it applied.
inline constexpr const char *kRequestIdFilter = "llmgate::middleware::RequestIdMiddleware";

class RequestIdMiddleware : public drogon::HttpFilter<RequestIdMiddleware, false> {
  public:
    void doFilter(const drogon::HttpRequestPtr &req,
                  drogon::FilterCallback &&fcb,
                  drogon::FilterChainCallback &&fccb) override;

  private:
    static std::string generateRequestId();
};

}  // namespace llmgate::middleware
