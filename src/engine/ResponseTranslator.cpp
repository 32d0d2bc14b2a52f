#include "engine/ResponseTranslator.hpp"

#include <string_view>

namespace llmgate::engine {
namespace {

std::string compactJson(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string defaultSummary(core::ErrorKind kind) {
    switch (kind) {
        case core::ErrorKind::ConfigMissing:
            return "Configuration missing";
        case core::ErrorKind::BadRequest:
            return "Bad Request";
        case core::ErrorKind::UpstreamStatus:
            return "Upstream API error";
        case core::ErrorKind::UpstreamTimeout:
            return "Gateway Timeout";
        case core::ErrorKind::UpstreamUnreachable:
            return "Request Failed";
        case core::ErrorKind::Internal:
            return "Internal Server Error";
    }
    return "Internal Server Error";
}

// Multi-line payloads need one data field per line.
std::string dataFrame(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 8);
    std::size_t start = 0;
    while (true) {
        const auto newline = payload.find('\n', start);
        frame.append("data: ");
        frame.append(payload.substr(start, newline == std::string_view::npos ? std::string_view::npos : newline - start));
        frame.push_back('\n');
        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }
    frame.push_back('\n');
    return frame;
}

}  // namespace

Envelope ResponseTranslator::search(const core::ChatResult &result) {
    Json::Value body(Json::objectValue);
    body["answer"] = result.text;
    Json::Value sources(Json::arrayValue);
    for (const auto &citation : result.citations) {
        Json::Value source(Json::objectValue);
        source["title"] = citation.title;
        source["url"] = citation.url;
        source["snippet"] = citation.snippet;
        sources.append(std::move(source));
    }
    body["sources"] = std::move(sources);
    return Envelope{.status = 200, .body = std::move(body)};
}

Envelope ResponseTranslator::chat(const core::ChatResult &result, const providers::ProviderProfile &profile) {
    Json::Value body = result.raw.isObject() ? result.raw : Json::Value(Json::objectValue);
    Json::Value performance(Json::objectValue);
    performance["response_time_ms"] = static_cast<Json::Int64>(result.latencyMs);
    performance["reasoning_method"] = profile.reasoningMethod;
    body["performance"] = std::move(performance);
    return Envelope{.status = 200, .body = std::move(body)};
}

Envelope ResponseTranslator::error(const core::GatewayError &error) {
    Json::Value body(Json::objectValue);
    body["error"] = error.summary.empty() ? defaultSummary(error.kind) : error.summary;
    body["message"] = error.message;
    if (error.hasDetails()) {
        body["details"] = error.details;
    }
    return Envelope{.status = error.httpStatus(), .body = std::move(body)};
}

std::string ResponseTranslator::streamFrame(const core::StreamEvent &event) {
    switch (event.kind) {
        case core::StreamEvent::Kind::Delta:
        case core::StreamEvent::Kind::ToolCallDelta:
            return dataFrame(event.data);
        case core::StreamEvent::Kind::Done:
            return "data: [DONE]\n\n";
        case core::StreamEvent::Kind::Error: {
            Json::Value payload(Json::objectValue);
            payload["error"] = true;
            payload["message"] = event.data;
            return dataFrame(compactJson(payload));
        }
    }
    return {};
}

}  // namespace llmgate::engine
