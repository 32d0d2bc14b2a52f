#include "providers/ChatCompletionsAdapter.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

using llmgate::core::CallMode;
using llmgate::core::ChatRequest;
using llmgate::core::ErrorKind;
using llmgate::core::Message;
using llmgate::core::Provider;
using llmgate::providers::ChatCompletionsAdapter;
using llmgate::providers::RequestContext;
using llmgate::testing::parseJsonText;
using llmgate::testing::testProfile;

class TestAdapter : public ChatCompletionsAdapter {
   public:
    using ChatCompletionsAdapter::ChatCompletionsAdapter;

    using ChatCompletionsAdapter::isCitationCall;
    using ChatCompletionsAdapter::parseCitationCall;
};

ChatRequest simpleRequest() {
    ChatRequest request;
    request.model = "gpt-4.1-mini";
    request.messages.push_back(Message{.role = "system", .content = Json::Value("be brief")});
    request.messages.push_back(Message{.role = "user", .content = Json::Value("hi")});
    request.maxTokens = 256;
    return request;
}

Json::Value citationCall(const std::string &arguments) {
    Json::Value call(Json::objectValue);
    call["type"] = "function";
    call["function"]["name"] = "citation";
    call["function"]["arguments"] = arguments;
    return call;
}

class ChatCompletionsAdapterTest : public ::testing::Test {
   protected:
    ChatCompletionsAdapterTest() : adapter_(testProfile(Provider::OpenAI)) { context_.requestId = "req-42"; }

    TestAdapter adapter_;
    RequestContext context_;
};

}  // namespace

TEST_F(ChatCompletionsAdapterTest, EncodeBuildsBufferedPayload) {
    auto payload = adapter_.encode(simpleRequest(), CallMode::Buffered, context_);

    ASSERT_TRUE(payload.ok());
    EXPECT_EQ(payload.data->url, "https://api.openai.com/v1/chat/completions");
    EXPECT_EQ(payload.data->model, "gpt-4.1-mini");

    const auto &body = payload.data->body;
    EXPECT_EQ(body["model"].asString(), "gpt-4.1-mini");
    ASSERT_EQ(body["messages"].size(), 2U);
    EXPECT_EQ(body["messages"][1]["content"].asString(), "hi");
    EXPECT_EQ(body["max_tokens"].asInt(), 256);
    EXPECT_FALSE(body["stream"].asBool());
    EXPECT_FALSE(body.isMember("temperature"));
    EXPECT_FALSE(body.isMember("top_p"));
    EXPECT_FALSE(body.isMember("tools"));
    EXPECT_FALSE(body.isMember("tool_choice"));
}

TEST_F(ChatCompletionsAdapterTest, EncodeBuildsHeaders) {
    auto buffered = adapter_.encode(simpleRequest(), CallMode::Buffered, context_);
    ASSERT_TRUE(buffered.ok());

    const auto &headers = buffered.data->headers;
    EXPECT_EQ(headers.at("Content-Type"), "application/json");
    EXPECT_EQ(headers.at("Accept"), "application/json");
    EXPECT_EQ(headers.at("User-Agent"), "llmgate/0.1.0");
    EXPECT_EQ(headers.at("X-Request-ID"), "req-42");
    EXPECT_EQ(headers.at("Authorization"), "Bearer test-key");

    auto streamed = adapter_.encode(simpleRequest(), CallMode::Streamed, context_);
    ASSERT_TRUE(streamed.ok());
    EXPECT_EQ(streamed.data->headers.at("Accept"), "text/event-stream");
    EXPECT_TRUE(streamed.data->body["stream"].asBool());
}

TEST_F(ChatCompletionsAdapterTest, CallModeOverridesClientStreamFlag) {
    auto request = simpleRequest();
    request.stream = true;

    auto payload = adapter_.encode(request, CallMode::Buffered, context_);
    ASSERT_TRUE(payload.ok());
    EXPECT_FALSE(payload.data->body["stream"].asBool());
}

TEST_F(ChatCompletionsAdapterTest, EncodeWithoutApiKeyIsConfigMissing) {
    auto profile = testProfile(Provider::OpenAI);
    profile.apiKey.reset();
    TestAdapter adapter(profile);

    auto payload = adapter.encode(simpleRequest(), CallMode::Buffered, context_);
    ASSERT_FALSE(payload.ok());
    EXPECT_EQ(payload.error->kind, ErrorKind::ConfigMissing);
    EXPECT_EQ(payload.error->httpStatus(), 500);
    EXPECT_EQ(payload.error->summary, "API key not configured");
    EXPECT_EQ(payload.error->message, "Please set OPENAI_API_KEY in the gateway environment");
}

TEST_F(ChatCompletionsAdapterTest, StreamingRejectedWhenProviderCannotStream) {
    TestAdapter adapter(testProfile(Provider::Perplexity));

    auto payload = adapter.encode(simpleRequest(), CallMode::Streamed, context_);
    ASSERT_FALSE(payload.ok());
    EXPECT_EQ(payload.error->kind, ErrorKind::BadRequest);
    EXPECT_EQ(payload.error->summary, "Streaming not supported");
}

TEST_F(ChatCompletionsAdapterTest, EncodeClampsAndForwardsTools) {
    auto request = simpleRequest();
    request.maxTokens = 50000;
    request.temperature = 0.0;
    Json::Value tool(Json::objectValue);
    tool["type"] = "function";
    tool["function"]["name"] = "calculate_expression";
    request.tools.push_back(tool);
    request.toolChoice = Json::Value("auto");

    auto payload = adapter_.encode(request, CallMode::Buffered, context_);
    ASSERT_TRUE(payload.ok());
    EXPECT_EQ(payload.data->body["max_tokens"].asInt(), 4096);
    EXPECT_DOUBLE_EQ(payload.data->body["temperature"].asDouble(), 0.0);
    ASSERT_EQ(payload.data->body["tools"].size(), 1U);
    EXPECT_EQ(payload.data->body["tool_choice"].asString(), "auto");
}

TEST_F(ChatCompletionsAdapterTest, ToolKeysRenamedPerProfile) {
    auto profile = testProfile(Provider::Fireworks);
    profile.toolKeyRenames = {{"function", "fn"}, {"parameters", "schema"}};
    TestAdapter adapter(profile);

    auto request = simpleRequest();
    Json::Value tool(Json::objectValue);
    tool["type"] = "function";
    tool["function"]["name"] = "lookup";
    tool["function"]["parameters"]["type"] = "object";
    request.tools.push_back(tool);

    auto payload = adapter.encode(request, CallMode::Buffered, context_);
    ASSERT_TRUE(payload.ok());
    const auto &sent = payload.data->body["tools"][0];
    EXPECT_FALSE(sent.isMember("function"));
    EXPECT_EQ(sent["fn"]["name"].asString(), "lookup");
    EXPECT_EQ(sent["fn"]["schema"]["type"].asString(), "object");
}

TEST_F(ChatCompletionsAdapterTest, DecodeExtractsTextUsageAndCitations) {
    auto result = adapter_.decode(R"({
        "choices": [{"message": {"role": "assistant", "content": "Answer",
            "tool_calls": [
                {"type": "function", "function": {"name": "citation",
                    "arguments": "{\"title\":\"Docs\",\"url\":\"https://docs.example\",\"snippet\":\"s\"}"}},
                {"type": "function", "function": {"name": "calculate_expression", "arguments": "{}"}}
            ]}}],
        "usage": {"prompt_tokens": 3, "completion_tokens": 5}
    })");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data->text, "Answer");
    ASSERT_EQ(result.data->citations.size(), 1U);
    EXPECT_EQ(result.data->citations[0].title, "Docs");
    EXPECT_EQ(result.data->citations[0].url, "https://docs.example");
    ASSERT_TRUE(result.data->usage.has_value());
    EXPECT_EQ(result.data->usage->totalTokens, 8U);
    EXPECT_TRUE(result.data->raw.isMember("choices"));
}

TEST_F(ChatCompletionsAdapterTest, DecodeRejectsInvalidBodies) {
    auto invalid = adapter_.decode("<html>bad gateway</html>");
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error->kind, ErrorKind::UpstreamStatus);
    EXPECT_EQ(invalid.error->httpStatus(), 502);

    auto noChoices = adapter_.decode(R"({"choices":[]})");
    ASSERT_FALSE(noChoices.ok());
    EXPECT_EQ(noChoices.error->httpStatus(), 502);
}

TEST_F(ChatCompletionsAdapterTest, DecodeSurvivesOddlyShapedBodies) {
    auto stringChoice = adapter_.decode(R"({"choices":["oops"]})");
    ASSERT_FALSE(stringChoice.ok());
    EXPECT_EQ(stringChoice.error->httpStatus(), 502);

    auto stringMessage = adapter_.decode(R"({"choices":[{"message":"oops"}]})");
    ASSERT_FALSE(stringMessage.ok());
    EXPECT_EQ(stringMessage.error->httpStatus(), 502);

    auto objectName = adapter_.decode(R"({"choices":[{"message":{"content":"ok",
        "tool_calls":[{"function":{"name":{"x":1},"arguments":"{}"}}]}}]})");
    ASSERT_TRUE(objectName.ok());
    EXPECT_EQ(objectName.data->text, "ok");
    EXPECT_TRUE(objectName.data->citations.empty());

    auto negativeUsage = adapter_.decode(R"({"choices":[{"message":{"content":"ok"}}],
        "usage":{"prompt_tokens":-1,"completion_tokens":"5","total_tokens":-3}})");
    ASSERT_TRUE(negativeUsage.ok());
    ASSERT_TRUE(negativeUsage.data->usage.has_value());
    EXPECT_EQ(negativeUsage.data->usage->promptTokens, 0U);
    EXPECT_EQ(negativeUsage.data->usage->completionTokens, 0U);
    EXPECT_EQ(negativeUsage.data->usage->totalTokens, 0U);
}

TEST_F(ChatCompletionsAdapterTest, EncodedMessageComesBackFromMatchingReply) {
    auto request = simpleRequest();
    auto payload = adapter_.encode(request, CallMode::Buffered, context_);
    ASSERT_TRUE(payload.ok());

    // A provider that echoes the last message it was sent.
    const auto &sent = payload.data->body["messages"];
    Json::Value reply(Json::objectValue);
    reply["model"] = payload.data->body["model"];
    reply["choices"][0]["index"] = 0;
    reply["choices"][0]["message"]["role"] = "assistant";
    reply["choices"][0]["message"]["content"] = sent[sent.size() - 1]["content"];
    Json::StreamWriterBuilder writer;

    auto result = adapter_.decode(Json::writeString(writer, reply));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data->text, request.messages.back().content.asString());
    EXPECT_EQ(result.data->raw["model"].asString(), "gpt-4.1-mini");
}

TEST_F(ChatCompletionsAdapterTest, CitationArgumentsNeverFail) {
    auto missing = TestAdapter::parseCitationCall(citationCall(R"({"url":"https://a.example"})"));
    EXPECT_EQ(missing.title, "Source");
    EXPECT_EQ(missing.url, "https://a.example");
    EXPECT_EQ(missing.snippet, "");

    auto broken = TestAdapter::parseCitationCall(citationCall("{not json"));
    EXPECT_EQ(broken.title, "Citation");
    EXPECT_EQ(broken.url, "#");
    EXPECT_EQ(broken.snippet, "");

    auto webSearch = citationCall("{}");
    webSearch["function"]["name"] = "web_search";
    EXPECT_TRUE(TestAdapter::isCitationCall(webSearch));
    EXPECT_FALSE(TestAdapter::isCitationCall(parseJsonText(R"({"function":{"name":"other"}})")));
}

TEST_F(ChatCompletionsAdapterTest, DecodeErrorMapsWellKnownStatuses) {
    auto auth = adapter_.decodeError(401, R"({"error":{"message":"bad key"}})", "gpt-4.1");
    EXPECT_EQ(auth.httpStatus(), 401);
    EXPECT_EQ(auth.summary, "OpenAI API error: 401");
    EXPECT_EQ(auth.message, "Authentication failed. Please check your OPENAI_API_KEY.");
    EXPECT_EQ(auth.details["error"]["message"].asString(), "bad key");

    auto missing = adapter_.decodeError(404, "{}", "gpt-9");
    EXPECT_EQ(missing.message, "Model not found. The model \"gpt-9\" may not be available.");

    auto limited = adapter_.decodeError(429, "", "gpt-4.1");
    EXPECT_EQ(limited.message, "Rate limit exceeded. Please try again later.");
    EXPECT_FALSE(limited.retryable);

    auto gateway = adapter_.decodeError(502, "upstream down", "gpt-4.1");
    EXPECT_TRUE(gateway.retryable);
    EXPECT_EQ(gateway.message, "Request timed out. Try reducing the max_tokens value.");
    EXPECT_EQ(gateway.details.asString(), "upstream down");
}

TEST_F(ChatCompletionsAdapterTest, DecodeErrorRewritesTokenLimitMessages) {
    auto error = adapter_.decodeError(400, R"({"error":{"message":"This request exceeds the Token LIMIT"}})", "gpt-4.1");
    EXPECT_EQ(error.httpStatus(), 400);
    EXPECT_EQ(error.message, "Token limit exceeded. Try reducing the max_tokens value or using a different model.");

    auto other = adapter_.decodeError(400, R"({"error":{"message":"messages[0].role is invalid"}})", "gpt-4.1");
    EXPECT_EQ(other.message, "messages[0].role is invalid");

    auto unknown = adapter_.decodeError(500, R"({"unexpected":true})", "gpt-4.1");
    EXPECT_EQ(unknown.message, "Unknown API error");
}
