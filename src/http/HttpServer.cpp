#include "http/HttpServer.hpp"

#include "http/SSE.hpp"
#include "http/ToolCatalog.hpp"
#include "llmgate/logging.h"
#include "llmgate/middleware/request_id.h"

#include <drogon/drogon.h>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llmgate::http {
namespace {

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
using Callback = std::function<void(const HttpResponsePtr &)>;

// Method gating happens in the handler so the 405 carries the JSON body and Allow header.
const std::vector<drogon::internal::HttpConstraint> kAnyMethod{
    drogon::Get,
    drogon::Post,
    drogon::Put,
    drogon::Delete,
    drogon::Patch,
    drogon::Options,
    drogon::Head,
    std::string{middleware::kRequestIdFilter},
};

void addCorsHeaders(const HttpResponsePtr &response) {
    response->addHeader("Access-Control-Allow-Origin", "*");
}

HttpResponsePtr jsonResponse(const engine::Envelope &envelope) {
    auto response = drogon::HttpResponse::newHttpJsonResponse(envelope.body);
    response->setStatusCode(static_cast<drogon::HttpStatusCode>(envelope.status));
    addCorsHeaders(response);
    if (envelope.status < 400) {
        response->addHeader("Cache-Control", "no-cache, no-store, must-revalidate");
    }
    return response;
}

HttpResponsePtr internalErrorResponse(const std::exception &e) {
    return jsonResponse(engine::ResponseTranslator::error(core::GatewayError::internal(e.what())));
}

// Answers preflight and non-POST requests. Returns true when the request was handled.
bool gateMethod(const HttpRequestPtr &req, const Callback &callback) {
    if (req->method() == drogon::Options) {
        auto response = drogon::HttpResponse::newHttpResponse();
        response->setStatusCode(drogon::k204NoContent);
        addCorsHeaders(response);
        response->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        response->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
        response->addHeader("Access-Control-Max-Age", "86400");
        callback(response);
        return true;
    }
    if (req->method() != drogon::Post) {
        Json::Value body(Json::objectValue);
        body["error"] = "Method Not Allowed";
        auto response = jsonResponse(engine::Envelope{.status = 405, .body = std::move(body)});
        response->addHeader("Allow", "POST");
        callback(response);
        return true;
    }
    return false;
}

std::optional<Json::Value> parseBody(const HttpRequestPtr &req, const Callback &callback) {
    auto json = req->getJsonObject();
    if (!json) {
        Json::Value body(Json::objectValue);
        body["error"] = "Invalid JSON in request body";
        const auto &parseError = req->getJsonError();
        body["message"] = parseError.empty() ? std::string{"Request body must be valid JSON"} : parseError;
        callback(jsonResponse(engine::Envelope{.status = 400, .body = std::move(body)}));
        return std::nullopt;
    }
    return *json;
}

std::string resolveRequestId(const HttpRequestPtr &req) {
    auto attributes = req->attributes();
    if (attributes && attributes->find("request_id")) {
        return attributes->get<std::string>("request_id");
    }
    return req->getHeader("X-Request-ID");
}

LogContext requestLogContext(const HttpRequestPtr &req, std::string_view provider) {
    LogContext context;
    context.requestId = resolveRequestId(req);
    context.provider = std::string(provider);
    context.route = std::string{req->path()};
    context.hasRequest = true;
    return context;
}

enum class RouteKind {
    Chat,
    Stream,
    Search,
};

void dispatch(const ServerContext &context,
              RouteKind kind,
              core::Provider provider,
              const HttpRequestPtr &req,
              Callback &&callback) {
    auto body = parseBody(req, callback);
    if (!body.has_value()) {
        return;
    }

    req->attributes()->insert("llmgate.provider", std::string(core::providerKey(provider)));

    auto gateway = context.gateway;
    auto logContext = requestLogContext(req, core::providerKey(provider));
    SseStream::Options streamOptions{
        .heartbeatInterval = context.stream.heartbeat,
        .maxBufferedBytes = context.stream.maxBufferedBytes,
    };

    context.upstreamWorkers->runTaskInQueue(
        [gateway, kind, provider, req, logContext, streamOptions, body = std::move(*body),
         callback = std::move(callback)]() {
            ScopedLogContext scoped(logContext);
            providers::RequestContext requestContext{.requestId = logContext.requestId};

            switch (kind) {
                case RouteKind::Chat:
                case RouteKind::Search:
                    try {
                        callback(jsonResponse(kind == RouteKind::Chat ? gateway->chat(provider, body, requestContext)
                                                                      : gateway->search(body, requestContext)));
                    } catch (const std::exception &e) {
                        LOG_ERROR << "Request handler failed: " << e.what();
                        callback(internalErrorResponse(e));
                    }
                    return;
                case RouteKind::Stream: {
                    auto cancel = core::CancellationToken::create();
                    SseEventSink sink(req, callback, streamOptions);
                    sink.onAbort([cancel]() { cancel->cancel(); });
                    try {
                        if (auto rejected = gateway->stream(provider, body, requestContext, sink, cancel)) {
                            callback(jsonResponse(*rejected));
                        }
                    } catch (const std::exception &e) {
                        LOG_ERROR << "Stream handler failed: " << e.what();
                        if (sink.responded()) {
                            sink.close();
                        } else {
                            callback(internalErrorResponse(e));
                        }
                    }
                    return;
                }
            }
        });
}

void registerFixedRoute(const ServerContext &context, const std::string &path, RouteKind kind, core::Provider provider) {
    drogon::app().registerHandler(
        path,
        [context, kind, provider](const HttpRequestPtr &req, Callback &&callback) {
            if (gateMethod(req, callback)) {
                return;
            }
            dispatch(context, kind, provider, req, std::move(callback));
        },
        kAnyMethod);
}

void registerProviderRoute(const ServerContext &context, const std::string &path, RouteKind kind) {
    drogon::app().registerHandler(
        path,
        [context, kind](const HttpRequestPtr &req, Callback &&callback, const std::string &name) {
            if (gateMethod(req, callback)) {
                return;
            }
            auto provider = core::parseProvider(name);
            if (!provider.has_value() || !context.gateway->knows(*provider)) {
                LOG_WARN << "Request for unknown provider " << name;
                callback(jsonResponse(engine::Gateway::unknownProvider(name)));
                return;
            }
            dispatch(context, kind, *provider, req, std::move(callback));
        },
        kAnyMethod);
}

}  // namespace

void HttpServer::registerRoutes(const ServerContext &context) {
    registerProviderRoute(context, "/api/chat/{provider}", RouteKind::Chat);
    registerProviderRoute(context, "/api/stream/{provider}", RouteKind::Stream);
    registerFixedRoute(context, "/api/search", RouteKind::Search, core::Provider::Perplexity);

    registerFixedRoute(context, "/api/proxy", RouteKind::Chat, core::Provider::Fireworks);
    registerFixedRoute(context, "/api/streaming", RouteKind::Stream, core::Provider::Fireworks);
    registerFixedRoute(context, "/api/perplexity", RouteKind::Search, core::Provider::Perplexity);
    registerFixedRoute(context, "/.netlify/functions/api-proxy", RouteKind::Chat, core::Provider::Groq);

    drogon::app().registerHandler(
        "/api/tools",
        [](const HttpRequestPtr &req, Callback &&callback) {
            if (gateMethod(req, callback)) {
                return;
            }
            callback(jsonResponse(engine::Envelope{.status = 200, .body = toolCatalog()}));
        },
        kAnyMethod);
}

}  // namespace llmgate::http
