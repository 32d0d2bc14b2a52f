#pragma once

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace llmgate::core {

enum class Provider {
    OpenAI,
    Groq,
    Fireworks,
    Perplexity,
};

std::string_view providerKey(Provider provider);
std::optional<Provider> parseProvider(std::string_view key);

// Decided by the route that was invoked, never by the request body.
enum class CallMode {
    Buffered,
    Streamed,
};

struct Message {
    std::string role;
    // String, array of content parts, or null.
    Json::Value content;
};

struct ChatRequest {
    Provider provider{Provider::OpenAI};
    std::string model;
    std::vector<Message> messages;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> maxTokens;
    // Opaque tool definitions, passed through as sent.
    std::vector<Json::Value> tools;
    std::optional<Json::Value> toolChoice;
    bool stream{false};
};

struct Citation {
    std::string title;
    std::string url;
    std::string snippet;
};

struct Usage {
    std::uint64_t promptTokens{0};
    std::uint64_t completionTokens{0};
    std::uint64_t totalTokens{0};
};

struct ChatResult {
    std::string text;
    std::vector<Citation> citations;
    std::optional<Usage> usage;
    std::int64_t latencyMs{0};
    // Provider body as received; the general chat envelope echoes it.
    Json::Value raw;
};

struct StreamEvent {
    enum class Kind {
        Delta,
        ToolCallDelta,
        Done,
        Error,
    };

    Kind kind{Kind::Delta};
    // Upstream payload for deltas, failure message for errors.
    std::string data;

    static StreamEvent delta(std::string text) { return {Kind::Delta, std::move(text)}; }
    static StreamEvent toolCallDelta(std::string raw) { return {Kind::ToolCallDelta, std::move(raw)}; }
    static StreamEvent done() { return {Kind::Done, {}}; }
    static StreamEvent error(std::string message) { return {Kind::Error, std::move(message)}; }
};

}  // namespace llmgate::core
