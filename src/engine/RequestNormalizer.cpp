#include "engine/RequestNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace llmgate::engine {
namespace {

core::Outcome<core::ChatRequest> badRequest(std::string message) {
    return core::Outcome<core::ChatRequest>::failure(core::GatewayError::badRequest("Bad Request", std::move(message)));
}

bool isAbsent(const Json::Value &body, const char *key) {
    return !body.isMember(key) || body[key].isNull();
}

bool readOptionalNumber(const Json::Value &body,
                        const char *key,
                        std::optional<double> fallback,
                        std::optional<double> &out,
                        std::string &error) {
    if (isAbsent(body, key)) {
        out = fallback;
        return true;
    }
    const auto &value = body[key];
    if (!value.isNumeric() || value.isBool()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    out = value.asDouble();
    return true;
}

}  // namespace

bool RequestNormalizer::validateMessages(const Json::Value &messages, std::string &error) {
    if (!messages.isArray() || messages.empty()) {
        error = "messages must be a non-empty array";
        return false;
    }
    for (const auto &message : messages) {
        if (!message.isObject()) {
            error = "each message must be an object";
            return false;
        }
        if (!message.isMember("role") || !message["role"].isString()) {
            error = "message.role must be a string";
            return false;
        }
        if (message.isMember("content")) {
            const auto &content = message["content"];
            if (!(content.isString() || content.isArray() || content.isNull())) {
                error = "message.content must be a string, array or null";
                return false;
            }
        }
    }
    return true;
}

core::Outcome<core::ChatRequest> RequestNormalizer::normalizeChat(const Json::Value &body) const {
    if (!body.isObject()) {
        return badRequest("request body must be a JSON object");
    }
    if (!body.isMember("messages")) {
        return badRequest("messages field is required");
    }

    std::string error;
    if (!validateMessages(body["messages"], error)) {
        return badRequest(std::move(error));
    }

    core::ChatRequest request;
    request.provider = profile_.provider;

    if (!isAbsent(body, "model") && !body["model"].isString()) {
        return badRequest("model must be a string");
    }
    request.model = resolveModel(isAbsent(body, "model") ? std::string{} : body["model"].asString());

    for (const auto &message : body["messages"]) {
        request.messages.push_back(core::Message{
            .role = message["role"].asString(),
            .content = message.isMember("content") ? message["content"] : Json::Value(),
        });
    }

    if (isAbsent(body, "max_tokens")) {
        request.maxTokens = clampMaxTokens(profile_.defaultMaxTokens);
    } else {
        const auto &maxTokens = body["max_tokens"];
        if (!maxTokens.isNumeric() || maxTokens.isBool()) {
            return badRequest("max_tokens must be a number");
        }
        request.maxTokens = clampMaxTokens(maxTokens.asDouble());
    }

    if (!readOptionalNumber(body, "temperature", profile_.defaultTemperature, request.temperature, error) ||
        !readOptionalNumber(body, "top_p", profile_.defaultTopP, request.topP, error)) {
        return badRequest(std::move(error));
    }

    if (profile_.capabilities.supportsTools && !isAbsent(body, "tools")) {
        const auto &tools = body["tools"];
        if (!tools.isArray()) {
            return badRequest("tools must be an array");
        }
        for (const auto &tool : tools) {
            request.tools.push_back(tool);
        }
        if (!request.tools.empty() && !isAbsent(body, "tool_choice")) {
            const auto &choice = body["tool_choice"];
            if (!(choice.isString() && choice.asString().empty())) {
                request.toolChoice = choice;
            }
        }
    }

    request.stream = body.isMember("stream") && body["stream"].isBool() && body["stream"].asBool();
    return core::Outcome<core::ChatRequest>::success(std::move(request));
}

core::Outcome<core::ChatRequest> RequestNormalizer::normalizeSearch(const Json::Value &body) const {
    if (!body.isObject() || !body["query"].isString() || body["query"].asString().empty()) {
        return core::Outcome<core::ChatRequest>::failure(core::GatewayError::badRequest(
            "Missing required parameter: query", "The request body must contain a non-empty query string."));
    }

    const auto search = profile_.search.value_or(providers::SearchProfile{
        .model = profile_.defaultModel,
        .systemPrompt = "",
        .temperature = 0.7,
        .maxTokens = 2048,
    });

    core::ChatRequest request;
    request.provider = profile_.provider;
    request.model = resolveModel(search.model);
    if (!search.systemPrompt.empty()) {
        request.messages.push_back(core::Message{.role = "system", .content = Json::Value(search.systemPrompt)});
    }
    request.messages.push_back(core::Message{.role = "user", .content = body["query"]});
    request.temperature = search.temperature;
    request.maxTokens = clampMaxTokens(search.maxTokens);
    return core::Outcome<core::ChatRequest>::success(std::move(request));
}

std::string RequestNormalizer::resolveModel(const std::string &requested) const {
    const auto &model = requested.empty() ? profile_.defaultModel : requested;
    auto alias = profile_.modelAliases.find(model);
    return alias == profile_.modelAliases.end() ? model : alias->second;
}

int RequestNormalizer::clampMaxTokens(double requested) const {
    const int ceiling = std::max(1, profile_.capabilities.tokenCeiling);
    if (std::isnan(requested)) {
        return ceiling;
    }
    return static_cast<int>(std::clamp(std::floor(requested), 1.0, static_cast<double>(ceiling)));
}

}  // namespace llmgate::engine
