#include "providers/PerplexityProvider.hpp"

#include <set>
#include <utility>

namespace llmgate::providers {

PerplexityProvider::PerplexityProvider(ProviderProfile profile) : ChatCompletionsAdapter(std::move(profile)) {}

// Perplexity rejects two consecutive messages with the same role, so adjacent
// string contents are joined with a blank line.
Json::Value PerplexityProvider::transformRequest(Json::Value body, const core::ChatRequest &) const {
    const auto &messages = body["messages"];
    Json::Value merged(Json::arrayValue);
    for (const auto &message : messages) {
        if (!merged.empty()) {
            auto &last = merged[merged.size() - 1];
            if (last["role"] == message["role"] && last["content"].isString() && message["content"].isString()) {
                last["content"] = last["content"].asString() + "\n\n" + message["content"].asString();
                continue;
            }
        }
        merged.append(message);
    }
    body["messages"] = std::move(merged);
    return body;
}

std::vector<core::Citation> PerplexityProvider::extractCitations(const Json::Value &payload) const {
    auto citations = ChatCompletionsAdapter::extractCitations(payload);

    // Placeholder URLs identify nothing, so they never suppress a search result.
    const auto isPlaceholder = [](const std::string &url) { return url.empty() || url == "#"; };
    std::set<std::string> seen;
    for (const auto &citation : citations) {
        if (!isPlaceholder(citation.url)) {
            seen.insert(citation.url);
        }
    }

    const auto &results = payload["search_results"];
    if (results.isArray()) {
        for (const auto &result : results) {
            if (!result.isObject() || !result["url"].isString()) {
                continue;
            }
            core::Citation citation{
                .title = result["title"].isString() && !result["title"].asString().empty() ? result["title"].asString()
                                                                                            : "Source",
                .url = result["url"].asString(),
                .snippet = result["snippet"].isString() ? result["snippet"].asString() : "",
            };
            if (isPlaceholder(citation.url) || seen.insert(citation.url).second) {
                citations.push_back(std::move(citation));
            }
        }
    }

    const auto &urls = payload["citations"];
    if (urls.isArray()) {
        for (const auto &url : urls) {
            if (url.isString() && !isPlaceholder(url.asString()) && seen.insert(url.asString()).second) {
                citations.push_back(core::Citation{.title = "Source", .url = url.asString(), .snippet = ""});
            }
        }
    }
    return citations;
}

}  // namespace llmgate::providers
