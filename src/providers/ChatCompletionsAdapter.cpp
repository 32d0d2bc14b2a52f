#include "providers/ChatCompletionsAdapter.hpp"

#include "llmgate/version.h"

#include <drogon/drogon.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <utility>

namespace llmgate::providers {
namespace {

constexpr std::string_view kUserAgent{LLMGATE_SERVICE_NAME "/" LLMGATE_VERSION};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parseJson(std::string_view text, Json::Value &out, std::string *errors = nullptr) {
    if (text.empty()) {
        return false;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    const bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (errors != nullptr) {
        *errors = errs;
    }
    return ok;
}

std::string stringOr(const Json::Value &node, const char *key, const std::string &fallback) {
    if (node.isObject() && node.isMember(key) && node[key].isString() && !node[key].asString().empty()) {
        return node[key].asString();
    }
    return fallback;
}

std::string contentText(const Json::Value &content) {
    if (content.isString()) {
        return content.asString();
    }
    if (content.isArray()) {
        std::string text;
        for (const auto &part : content) {
            if (part.isObject() && part["text"].isString()) {
                text += part["text"].asString();
            } else if (part.isString()) {
                text += part.asString();
            }
        }
        return text;
    }
    return {};
}

// Null unless the payload has the choices[0].message object shape.
const Json::Value &firstMessage(const Json::Value &payload) {
    static const Json::Value kNone;
    if (!payload.isObject() || !payload["choices"].isArray() || payload["choices"].empty()) {
        return kNone;
    }
    const auto &choice = payload["choices"][0];
    if (!choice.isObject() || !choice["message"].isObject()) {
        return kNone;
    }
    return choice["message"];
}

std::uint64_t tokenCount(const Json::Value &value) {
    return value.isUInt64() ? value.asUInt64() : 0;
}

std::optional<core::Usage> extractUsage(const Json::Value &payload) {
    if (!payload.isObject() || !payload["usage"].isObject()) {
        return std::nullopt;
    }
    const auto &rawUsage = payload["usage"];
    core::Usage usage;
    usage.promptTokens = tokenCount(rawUsage["prompt_tokens"]);
    usage.completionTokens = tokenCount(rawUsage["completion_tokens"]);
    if (rawUsage["total_tokens"].isUInt64()) {
        usage.totalTokens = rawUsage["total_tokens"].asUInt64();
    } else {
        usage.totalTokens = usage.promptTokens + usage.completionTokens;
    }
    return usage;
}

// Best effort: providers nest the human readable text in different places.
std::string extractUpstreamMessage(int status, std::string_view rawBody, const Json::Value &parsed, bool isJson) {
    if (isJson && parsed.isObject()) {
        const auto &error = parsed["error"];
        if (error.isObject() && error["message"].isString()) {
            return error["message"].asString();
        }
        if (error.isString()) {
            return error.asString();
        }
        if (parsed["message"].isString()) {
            return parsed["message"].asString();
        }
        if (parsed["detail"].isString()) {
            return parsed["detail"].asString();
        }
        return "Unknown API error";
    }
    if (!rawBody.empty()) {
        return std::string(rawBody);
    }
    return "Error " + std::to_string(status);
}

}  // namespace

ChatCompletionsAdapter::ChatCompletionsAdapter(ProviderProfile profile) : profile_(std::move(profile)) {}

ChatCompletionsAdapter::~ChatCompletionsAdapter() = default;

core::Outcome<OutboundPayload> ChatCompletionsAdapter::encode(const core::ChatRequest &request,
                                                              core::CallMode mode,
                                                              const RequestContext &context) const {
    if (!profile_.apiKey.has_value() || profile_.apiKey->empty()) {
        return core::Outcome<OutboundPayload>::failure(core::GatewayError::configMissing(
            "API key not configured", "Please set " + profile_.primaryKeyEnv() + " in the gateway environment"));
    }
    if (mode == core::CallMode::Streamed && !profile_.capabilities.supportsStreaming) {
        return core::Outcome<OutboundPayload>::failure(core::GatewayError::badRequest(
            "Streaming not supported", profile_.name + " does not support streamed responses."));
    }
    if (request.messages.empty()) {
        return core::Outcome<OutboundPayload>::failure(
            core::GatewayError::badRequest("Bad Request", "messages must be a non-empty array"));
    }

    Json::Value body(Json::objectValue);
    body["model"] = request.model.empty() ? profile_.defaultModel : request.model;

    Json::Value messages(Json::arrayValue);
    for (const auto &message : request.messages) {
        Json::Value item(Json::objectValue);
        item["role"] = message.role;
        item["content"] = message.content;
        messages.append(std::move(item));
    }
    body["messages"] = std::move(messages);

    const int ceiling = std::max(1, profile_.capabilities.tokenCeiling);
    body["max_tokens"] = std::clamp(request.maxTokens.value_or(profile_.defaultMaxTokens), 1, ceiling);

    if (request.temperature.has_value()) {
        body["temperature"] = *request.temperature;
    }
    if (request.topP.has_value()) {
        body["top_p"] = *request.topP;
    }

    if (profile_.capabilities.supportsTools && !request.tools.empty()) {
        Json::Value tools(Json::arrayValue);
        for (const auto &tool : request.tools) {
            auto adapted = adaptTool(tool);
            if (!adapted.isNull()) {
                tools.append(std::move(adapted));
            }
        }
        if (!tools.empty()) {
            body["tools"] = std::move(tools);
            if (request.toolChoice.has_value() && !request.toolChoice->isNull()) {
                body["tool_choice"] = *request.toolChoice;
            }
        }
    }

    body["stream"] = mode == core::CallMode::Streamed;
    body = transformRequest(std::move(body), request);

    OutboundPayload payload;
    payload.url = buildUrl();
    payload.headers = buildHeaders(*profile_.apiKey, context, mode);
    payload.model = body["model"].asString();
    payload.mode = mode;
    payload.body = std::move(body);
    return core::Outcome<OutboundPayload>::success(std::move(payload));
}

core::Outcome<core::ChatResult> ChatCompletionsAdapter::decode(std::string_view rawBody) const {
    Json::Value payload;
    std::string errors;
    if (!parseJson(rawBody, payload, &errors) || !payload.isObject()) {
        return core::Outcome<core::ChatResult>::failure(core::GatewayError::upstreamStatus(
            502, profile_.name + " API error: invalid response",
            errors.empty() ? "Provider returned invalid JSON payload." : errors, Json::Value(std::string(rawBody))));
    }

    const auto &choices = payload["choices"];
    if (!choices.isArray() || choices.empty()) {
        return core::Outcome<core::ChatResult>::failure(core::GatewayError::upstreamStatus(
            502, profile_.name + " API error: invalid response", "Provider response did not contain any choices.",
            payload));
    }

    const auto &message = firstMessage(payload);
    if (message.isNull()) {
        return core::Outcome<core::ChatResult>::failure(core::GatewayError::upstreamStatus(
            502, profile_.name + " API error: invalid response", "Provider response choice carried no message.",
            payload));
    }

    core::ChatResult result;
    result.text = contentText(message["content"]);
    result.citations = extractCitations(payload);
    result.usage = extractUsage(payload);
    result.raw = std::move(payload);
    return core::Outcome<core::ChatResult>::success(std::move(result));
}

core::GatewayError ChatCompletionsAdapter::decodeError(int status,
                                                       std::string_view rawBody,
                                                       const std::string &model) const {
    Json::Value parsed;
    const bool isJson = parseJson(rawBody, parsed);
    Json::Value details = isJson ? parsed : Json::Value(std::string(rawBody));

    std::string message;
    bool retryable = false;
    switch (status) {
        case 401:
            message = authFailureMessage();
            break;
        case 404:
            message = modelNotFoundMessage(model);
            break;
        case 429:
            message = rateLimitMessage();
            break;
        default:
            if (profile_.retry.isRetryableStatus(status)) {
                message = "Request timed out. Try reducing the max_tokens value.";
                retryable = true;
                break;
            }
            message = extractUpstreamMessage(status, rawBody, parsed, isJson);
            if (auto lowered = toLower(message);
                lowered.find("token") != std::string::npos && lowered.find("limit") != std::string::npos) {
                message = "Token limit exceeded. Try reducing the max_tokens value or using a different model.";
            }
            break;
    }

    auto error = core::GatewayError::upstreamStatus(status, errorSummary(status), std::move(message), std::move(details));
    error.retryable = retryable;
    return error;
}

Json::Value ChatCompletionsAdapter::transformRequest(Json::Value body, const core::ChatRequest &) const {
    return body;
}

Json::Value ChatCompletionsAdapter::adaptTool(const Json::Value &tool) const {
    if (profile_.toolKeyRenames.empty() || !tool.isObject()) {
        return tool;
    }
    auto renameKeys = [this](const Json::Value &source) {
        Json::Value renamed(Json::objectValue);
        for (const auto &key : source.getMemberNames()) {
            auto it = profile_.toolKeyRenames.find(key);
            renamed[it == profile_.toolKeyRenames.end() ? key : it->second] = source[key];
        }
        return renamed;
    };
    auto adapted = renameKeys(tool);
    const auto renamedFunction = profile_.toolKeyRenames.find("function");
    const std::string functionKey =
        renamedFunction == profile_.toolKeyRenames.end() ? std::string{"function"} : renamedFunction->second;
    if (adapted[functionKey].isObject()) {
        adapted[functionKey] = renameKeys(adapted[functionKey]);
    }
    return adapted;
}

void ChatCompletionsAdapter::augmentHeaders(std::map<std::string, std::string> &, core::CallMode) const {}

std::vector<core::Citation> ChatCompletionsAdapter::extractCitations(const Json::Value &payload) const {
    std::vector<core::Citation> citations;
    const auto &message = firstMessage(payload);
    if (!message.isObject()) {
        return citations;
    }
    const auto &toolCalls = message["tool_calls"];
    if (!toolCalls.isArray()) {
        return citations;
    }
    for (const auto &call : toolCalls) {
        if (isCitationCall(call)) {
            citations.push_back(parseCitationCall(call));
        }
    }
    if (!citations.empty()) {
        LOG_DEBUG << "Found " << citations.size() << " citations in " << profile_.name << " response";
    }
    return citations;
}

std::string ChatCompletionsAdapter::authFailureMessage() const {
    return "Authentication failed. Please check your " + profile_.primaryKeyEnv() + ".";
}

std::string ChatCompletionsAdapter::rateLimitMessage() const {
    return "Rate limit exceeded. Please try again later.";
}

std::string ChatCompletionsAdapter::modelNotFoundMessage(const std::string &model) const {
    return "Model not found. The model \"" + model + "\" may not be available.";
}

std::map<std::string, std::string> ChatCompletionsAdapter::buildHeaders(const std::string &apiKey,
                                                                        const RequestContext &context,
                                                                        core::CallMode mode) const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Accept"] = mode == core::CallMode::Streamed ? "text/event-stream" : "application/json";
    headers["User-Agent"] = std::string(kUserAgent);
    if (!context.requestId.empty()) {
        headers["X-Request-ID"] = context.requestId;
    }

    for (const auto &entry : profile_.defaultHeaders) {
        headers[entry.first] = entry.second;
    }

    headers[profile_.authHeader] = profile_.authScheme.empty() ? apiKey : profile_.authScheme + " " + apiKey;
    augmentHeaders(headers, mode);
    return headers;
}

std::string ChatCompletionsAdapter::buildUrl() const {
    std::string base = profile_.baseUrl;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    const auto &path = profile_.chatPath;
    if (!path.empty() && path.front() != '/') {
        base.push_back('/');
    }
    base.append(path);
    return base;
}

bool ChatCompletionsAdapter::isCitationCall(const Json::Value &toolCall) {
    if (!toolCall.isObject() || !toolCall["function"].isObject() || !toolCall["function"]["name"].isString()) {
        return false;
    }
    const auto name = toolCall["function"]["name"].asString();
    return name == "citation" || name == "web_search";
}

core::Citation ChatCompletionsAdapter::parseCitationCall(const Json::Value &toolCall) {
    const auto &arguments = toolCall["function"]["arguments"];
    Json::Value args;
    bool ok = false;
    if (arguments.isObject()) {
        args = arguments;
        ok = true;
    } else if (arguments.isString()) {
        ok = parseJson(arguments.asString(), args) && args.isObject();
    }
    if (!ok) {
        LOG_WARN << "Error parsing citation arguments; substituting placeholder";
        return core::Citation{.title = "Citation", .url = "#", .snippet = ""};
    }
    return core::Citation{
        .title = stringOr(args, "title", "Source"),
        .url = stringOr(args, "url", ""),
        .snippet = stringOr(args, "snippet", ""),
    };
}

std::string ChatCompletionsAdapter::errorSummary(int status) const {
    return profile_.name + " API error: " + std::to_string(status);
}

}  // namespace llmgate::providers
