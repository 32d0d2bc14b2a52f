#include "engine/StreamRelay.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

namespace {

using llmgate::core::StreamEvent;
using llmgate::engine::SseEvent;
using llmgate::engine::StreamRelay;
using llmgate::testing::RecordingSink;

class StreamRelayTest : public ::testing::Test {
   protected:
    RecordingSink sink_;
};

}  // namespace

TEST_F(StreamRelayTest, ForwardsDeltasAndEndsWithExactlyOneDone) {
    StreamRelay relay(sink_, 1024);

    ASSERT_TRUE(relay.begin());
    EXPECT_EQ(relay.state(), StreamRelay::State::Relaying);
    EXPECT_TRUE(relay.consume("data: Hello\n\nda"));
    EXPECT_TRUE(relay.consume("ta: world\n\ndata: [DONE]\n\n"));
    relay.finish();
    relay.finish();
    relay.fail("late failure");

    ASSERT_EQ(sink_.events.size(), 3U);
    EXPECT_EQ(sink_.events[0].data, "Hello");
    EXPECT_EQ(sink_.events[1].data, "world");
    EXPECT_EQ(sink_.events[2].kind, StreamEvent::Kind::Done);
    EXPECT_EQ(relay.eventsForwarded(), 2U);
    EXPECT_EQ(relay.state(), StreamRelay::State::Closed);
    EXPECT_EQ(sink_.opens, 1);
    EXPECT_EQ(sink_.closes, 1);
}

TEST_F(StreamRelayTest, FailureAfterDeltasEmitsErrorThenDone) {
    StreamRelay relay(sink_, 1024);
    relay.begin();
    relay.consume("data: partial\n\n");

    relay.fail("Stream interrupted: connection reset");

    ASSERT_EQ(sink_.events.size(), 3U);
    EXPECT_EQ(sink_.events[1].kind, StreamEvent::Kind::Error);
    EXPECT_EQ(sink_.events[1].data, "Stream interrupted: connection reset");
    EXPECT_EQ(sink_.events[2].kind, StreamEvent::Kind::Done);
    EXPECT_FALSE(relay.consume("data: more\n\n"));
}

TEST_F(StreamRelayTest, FailureBeforeBeginOpensThenReports) {
    StreamRelay relay(sink_, 1024);

    relay.fail("Groq API error: 502");

    EXPECT_TRUE(relay.opened());
    EXPECT_EQ(sink_.opens, 1);
    ASSERT_EQ(sink_.events.size(), 2U);
    EXPECT_EQ(sink_.events[0].kind, StreamEvent::Kind::Error);
    EXPECT_EQ(sink_.events[1].kind, StreamEvent::Kind::Done);
}

TEST_F(StreamRelayTest, ClientDisconnectStopsRelayWithoutDone) {
    sink_.acceptedSends = 1;
    StreamRelay relay(sink_, 1024);
    relay.begin();

    EXPECT_FALSE(relay.consume("data: one\n\ndata: two\n\n"));
    relay.finish();

    EXPECT_TRUE(relay.clientGone());
    EXPECT_EQ(relay.state(), StreamRelay::State::Closed);
    EXPECT_EQ(sink_.events.size(), 1U);
    EXPECT_EQ(sink_.count(StreamEvent::Kind::Done), 0U);
    EXPECT_EQ(sink_.closes, 1);
}

TEST_F(StreamRelayTest, RefusedOpenClosesImmediately) {
    sink_.acceptOpen = false;
    StreamRelay relay(sink_, 1024);

    EXPECT_FALSE(relay.begin());
    EXPECT_TRUE(relay.clientGone());
    EXPECT_FALSE(relay.consume("data: ignored\n\n"));
    EXPECT_TRUE(sink_.events.empty());
}

TEST_F(StreamRelayTest, OversizedEventBecomesStreamError) {
    StreamRelay relay(sink_, 8);
    relay.begin();

    EXPECT_FALSE(relay.consume("data: far too large for the limit\n\n"));

    ASSERT_EQ(sink_.events.size(), 2U);
    EXPECT_EQ(sink_.events[0].kind, StreamEvent::Kind::Error);
    EXPECT_EQ(sink_.events[0].data, "Upstream event exceeded 8 bytes");
    EXPECT_EQ(sink_.events[1].kind, StreamEvent::Kind::Done);
}

TEST_F(StreamRelayTest, ClassifiesToolCallDeltas) {
    auto toolCall = StreamRelay::classify(SseEvent{
        .event = "",
        .data = R"({"choices":[{"delta":{"tool_calls":[{"index":0}]}}]})",
    });
    EXPECT_EQ(toolCall.kind, StreamEvent::Kind::ToolCallDelta);

    auto text = StreamRelay::classify(SseEvent{.event = "", .data = R"({"choices":[{"delta":{"content":"x"}}]})"});
    EXPECT_EQ(text.kind, StreamEvent::Kind::Delta);
}

TEST_F(StreamRelayTest, ForwardsUnframedChunksVerbatim) {
    StreamRelay relay(sink_, 1024);
    relay.begin();

    EXPECT_TRUE(relay.consume("Hello"));
    EXPECT_TRUE(relay.consume(" world"));
    relay.finish();

    EXPECT_EQ(relay.framing(), StreamRelay::Framing::Raw);
    ASSERT_EQ(sink_.events.size(), 3U);
    EXPECT_EQ(sink_.events[0].kind, StreamEvent::Kind::Delta);
    EXPECT_EQ(sink_.events[0].data, "Hello");
    EXPECT_EQ(sink_.events[1].data, " world");
    EXPECT_EQ(sink_.events[2].kind, StreamEvent::Kind::Done);
    EXPECT_EQ(sink_.count(StreamEvent::Kind::Done), 1U);
}

TEST_F(StreamRelayTest, ForwardsJsonBodyFromProviderThatIgnoredStreaming) {
    const std::string body = R"({"id":"chatcmpl-1","choices":[{"message":{"role":"assistant","content":"hi"}}]})";
    StreamRelay relay(sink_, 1024);
    relay.begin();

    EXPECT_TRUE(relay.consume(body));
    relay.finish();

    ASSERT_EQ(sink_.events.size(), 2U);
    EXPECT_EQ(sink_.events[0].kind, StreamEvent::Kind::Delta);
    EXPECT_EQ(sink_.events[0].data, body);
    EXPECT_EQ(sink_.events[1].kind, StreamEvent::Kind::Done);
}

TEST_F(StreamRelayTest, ShortUnframedBodyIsFlushedOnFinish) {
    StreamRelay relay(sink_, 1024);
    relay.begin();

    EXPECT_TRUE(relay.consume("da"));
    EXPECT_TRUE(sink_.events.empty());
    relay.finish();

    ASSERT_EQ(sink_.events.size(), 2U);
    EXPECT_EQ(sink_.events[0].data, "da");
    EXPECT_EQ(sink_.events[1].kind, StreamEvent::Kind::Done);
}

TEST_F(StreamRelayTest, DetectsFramingFromLeadingBytes) {
    using Framing = StreamRelay::Framing;
    EXPECT_EQ(StreamRelay::detectFraming("data: x", false), Framing::EventStream);
    EXPECT_EQ(StreamRelay::detectFraming("\r\n: keep-alive", false), Framing::EventStream);
    EXPECT_EQ(StreamRelay::detectFraming("event:", false), Framing::EventStream);
    EXPECT_EQ(StreamRelay::detectFraming("dat", false), Framing::Unknown);
    EXPECT_EQ(StreamRelay::detectFraming("dat", true), Framing::Raw);
    EXPECT_EQ(StreamRelay::detectFraming("{\"id\":1}", false), Framing::Raw);
    EXPECT_EQ(StreamRelay::detectFraming("Hello", false), Framing::Raw);
}
