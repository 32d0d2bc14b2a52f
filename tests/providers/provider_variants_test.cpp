#include "providers/ProviderRegistry.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace {

using llmgate::core::CallMode;
using llmgate::core::ChatRequest;
using llmgate::core::Message;
using llmgate::core::Provider;
using llmgate::providers::makeAdapter;
using llmgate::providers::ProviderRegistry;
using llmgate::providers::RequestContext;
using llmgate::providers::RetryPolicy;
using llmgate::testing::parseJsonText;
using llmgate::testing::testProfile;

ChatRequest requestWith(std::vector<Message> messages) {
    ChatRequest request;
    request.messages = std::move(messages);
    return request;
}

}  // namespace

TEST(ProviderVariantsTest, MakeAdapterHonoursProfileProvider) {
    for (auto provider : {Provider::OpenAI, Provider::Groq, Provider::Fireworks, Provider::Perplexity}) {
        auto adapter = makeAdapter(testProfile(provider));
        ASSERT_NE(adapter, nullptr);
        EXPECT_EQ(adapter->provider(), provider);
    }
}

TEST(ProviderVariantsTest, RegistryOnlyKnowsConfiguredProviders) {
    ProviderRegistry registry({testProfile(Provider::Groq), testProfile(Provider::Perplexity)});

    EXPECT_FALSE(registry.empty());
    EXPECT_NE(registry.find(Provider::Groq), nullptr);
    EXPECT_EQ(registry.find(Provider::OpenAI), nullptr);
    EXPECT_EQ(registry.providers(), (std::vector<Provider>{Provider::Groq, Provider::Perplexity}));
    EXPECT_TRUE(ProviderRegistry().empty());
}

TEST(ProviderVariantsTest, OpenAIMovesWebSearchToolIntoOptions) {
    auto adapter = makeAdapter(testProfile(Provider::OpenAI));
    auto request = requestWith({Message{.role = "user", .content = Json::Value("news?")}});
    request.tools.push_back(parseJsonText(R"({"type":"web_search_preview"})"));
    request.tools.push_back(parseJsonText(R"({"type":"function","function":{"name":"get_current_weather"}})"));
    request.toolChoice = Json::Value("auto");

    auto payload = adapter->encode(request, CallMode::Buffered, RequestContext{});
    ASSERT_TRUE(payload.ok());
    const auto &body = payload.data->body;
    ASSERT_TRUE(body["web_search_options"].isObject());
    ASSERT_EQ(body["tools"].size(), 1U);
    EXPECT_EQ(body["tools"][0]["function"]["name"].asString(), "get_current_weather");
    EXPECT_EQ(body["tool_choice"].asString(), "auto");
}

TEST(ProviderVariantsTest, OpenAIDropsToolChoiceWhenOnlyWebSearchRequested) {
    auto adapter = makeAdapter(testProfile(Provider::OpenAI));
    auto request = requestWith({Message{.role = "user", .content = Json::Value("news?")}});
    request.tools.push_back(parseJsonText(R"({"type":"web_search_preview"})"));
    request.toolChoice = Json::Value("auto");

    auto payload = adapter->encode(request, CallMode::Buffered, RequestContext{});
    ASSERT_TRUE(payload.ok());
    EXPECT_TRUE(payload.data->body.isMember("web_search_options"));
    EXPECT_FALSE(payload.data->body.isMember("tools"));
    EXPECT_FALSE(payload.data->body.isMember("tool_choice"));
}

TEST(ProviderVariantsTest, PerplexityMergesConsecutiveSameRoleMessages) {
    auto adapter = makeAdapter(testProfile(Provider::Perplexity));
    auto request = requestWith({
        Message{.role = "system", .content = Json::Value("rules")},
        Message{.role = "user", .content = Json::Value("first")},
        Message{.role = "user", .content = Json::Value("second")},
        Message{.role = "assistant", .content = Json::Value("reply")},
        Message{.role = "user", .content = parseJsonText(R"([{"type":"text","text":"parts"}])")},
        Message{.role = "user", .content = Json::Value("after parts")},
    });

    auto payload = adapter->encode(request, CallMode::Buffered, RequestContext{});
    ASSERT_TRUE(payload.ok());
    const auto &messages = payload.data->body["messages"];
    ASSERT_EQ(messages.size(), 5U);
    EXPECT_EQ(messages[1]["content"].asString(), "first\n\nsecond");
    EXPECT_TRUE(messages[3]["content"].isArray());
    EXPECT_EQ(messages[4]["content"].asString(), "after parts");
}

TEST(ProviderVariantsTest, PerplexityCollectsCitationsFromEverySource) {
    auto adapter = makeAdapter(testProfile(Provider::Perplexity));

    auto result = adapter->decode(R"({
        "choices": [{"message": {"content": "Answer", "tool_calls": [
            {"function": {"name": "citation", "arguments": "{\"title\":\"A\",\"url\":\"https://a.example\"}"}}
        ]}}],
        "search_results": [
            {"title": "A again", "url": "https://a.example"},
            {"title": "B", "url": "https://b.example", "snippet": "about b"}
        ],
        "citations": ["https://b.example", "https://c.example"]
    })");

    ASSERT_TRUE(result.ok());
    const auto &citations = result.data->citations;
    ASSERT_EQ(citations.size(), 3U);
    EXPECT_EQ(citations[0].title, "A");
    EXPECT_EQ(citations[1].title, "B");
    EXPECT_EQ(citations[1].snippet, "about b");
    EXPECT_EQ(citations[2].title, "Source");
    EXPECT_EQ(citations[2].url, "https://c.example");
}

TEST(ProviderVariantsTest, PerplexityKeepsSearchResultWithoutUrl) {
    auto adapter = makeAdapter(testProfile(Provider::Perplexity));

    auto result = adapter->decode(R"({
        "choices": [{"message": {"content": "Answer", "tool_calls": [
            {"function": {"name": "citation", "arguments": "{not json"}},
            {"function": {"name": "citation", "arguments": "{\"title\":\"Untitled\"}"}}
        ]}}],
        "search_results": [
            {"title": "Offline source", "url": ""},
            {"title": "Another offline source", "url": ""}
        ],
        "citations": ["", "#"]
    })");

    ASSERT_TRUE(result.ok());
    const auto &citations = result.data->citations;
    ASSERT_EQ(citations.size(), 4U);
    EXPECT_EQ(citations[0].url, "#");
    EXPECT_EQ(citations[1].url, "");
    EXPECT_EQ(citations[2].title, "Offline source");
    EXPECT_EQ(citations[3].title, "Another offline source");
}

TEST(RetryPolicyTest, BackoffGrowsLinearlyWithAttempt) {
    using std::chrono::milliseconds;
    RetryPolicy policy;

    EXPECT_EQ(policy.delayBeforeAttempt(1), milliseconds(0));
    EXPECT_EQ(policy.delayBeforeAttempt(2), milliseconds(3000));
    EXPECT_EQ(policy.delayBeforeAttempt(3), milliseconds(6000));

    policy.backoffStep = milliseconds(250);
    EXPECT_EQ(policy.delayBeforeAttempt(4), milliseconds(750));
}

TEST(ProviderVariantsTest, ProviderSpecificErrorWording) {
    auto groq = makeAdapter(testProfile(Provider::Groq));
    EXPECT_EQ(groq->decodeError(401, "{}", "m").message, "Invalid API key. Please check your GROQ_API_KEY.");
    EXPECT_EQ(groq->decodeError(401, "{}", "m").summary, "Groq API error: 401");

    auto fireworks = makeAdapter(testProfile(Provider::Fireworks));
    EXPECT_EQ(fireworks->decodeError(401, "{}", "m").message,
              "Authentication failed. Please check your Fireworks API key.");
    EXPECT_EQ(fireworks->decodeError(429, "{}", "m").message,
              "Rate limit exceeded. Please try again in a few moments.");

    auto perplexity = makeAdapter(testProfile(Provider::Perplexity));
    EXPECT_EQ(perplexity->decodeError(401, "{}", "m").message,
              "Authentication failed. Please check your PERPLEXITY_API_KEY.");
}

TEST(ProviderVariantsTest, PerplexityIgnoresTools) {
    auto adapter = makeAdapter(testProfile(Provider::Perplexity));
    auto request = requestWith({Message{.role = "user", .content = Json::Value("q")}});
    request.tools.push_back(parseJsonText(R"({"type":"function","function":{"name":"x"}})"));

    auto payload = adapter->encode(request, CallMode::Buffered, RequestContext{});
    ASSERT_TRUE(payload.ok());
    EXPECT_FALSE(payload.data->body.isMember("tools"));
    EXPECT_EQ(payload.data->url, "https://api.perplexity.ai/chat/completions");
}
