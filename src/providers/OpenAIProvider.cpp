#include "providers/OpenAIProvider.hpp"

#include <algorithm>
#include <utility>

namespace llmgate::providers {
namespace {

constexpr const char *kWebSearchTool = "web_search_preview";

bool isWebSearchTool(const Json::Value &tool) {
    return tool.isObject() && tool["type"].isString() && tool["type"].asString() == kWebSearchTool;
}

}  // namespace

OpenAIProvider::OpenAIProvider(ProviderProfile profile) : ChatCompletionsAdapter(std::move(profile)) {}

// The chat completions endpoint takes web search as a top-level option rather
// than as an entry in tools.
Json::Value OpenAIProvider::transformRequest(Json::Value body, const core::ChatRequest &request) const {
    if (!profile().capabilities.supportsTools) {
        return body;
    }
    const bool wantsSearch = std::any_of(request.tools.begin(), request.tools.end(), isWebSearchTool);
    if (wantsSearch) {
        body["web_search_options"] = Json::Value(Json::objectValue);
    }
    return body;
}

Json::Value OpenAIProvider::adaptTool(const Json::Value &tool) const {
    if (isWebSearchTool(tool)) {
        return Json::Value();
    }
    return ChatCompletionsAdapter::adaptTool(tool);
}

}  // namespace llmgate::providers
