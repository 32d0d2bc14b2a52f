#pragma once

#include "core/ChatTypes.hpp"
#include "engine/SseParser.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace llmgate::engine {

// Outbound side of a relayed stream. Framing is the sink's business.
class EventSink {
   public:
    virtual ~EventSink() = default;

    // Starts the client response. False when the client is already gone.
    virtual bool open() = 0;
    // False when the client refused the write.
    virtual bool send(const core::StreamEvent &event) = 0;
    virtual void close() = 0;
};

// Idle -> Relaying -> Closed. Every path into Closed that still has a client
// emits exactly one Done, preceded by one Error on failure.
//
// The first upstream bytes decide the framing: text/event-stream fields are
// parsed and their data payloads forwarded, anything else is forwarded
// chunk by chunk as raw deltas.
class StreamRelay {
   public:
    enum class State {
        Idle,
        Relaying,
        Closed,
    };

    enum class Framing {
        Unknown,
        EventStream,
        Raw,
    };

    StreamRelay(EventSink &sink, std::size_t maxEventBytes);

    StreamRelay(const StreamRelay &) = delete;
    StreamRelay &operator=(const StreamRelay &) = delete;

    // Opens the outbound stream. False when the client is gone.
    bool begin();
    // Feeds upstream bytes. False means stop reading upstream.
    bool consume(std::string_view chunk);
    // Upstream reached end of stream.
    void finish();
    // Upstream failed, before or after begin().
    void fail(const std::string &message);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool opened() const { return opened_; }
    [[nodiscard]] bool clientGone() const { return clientGone_; }
    [[nodiscard]] std::size_t eventsForwarded() const { return forwarded_; }
    [[nodiscard]] Framing framing() const { return framing_; }

    static core::StreamEvent classify(const SseEvent &event);
    // Unknown while `prefix` could still be either framing; `complete` means
    // no more bytes will follow.
    static Framing detectFraming(std::string_view prefix, bool complete);

   private:
    bool consumeFramed(std::string_view chunk);
    bool forwardRaw(std::string_view chunk);
    bool forward(const SseEvent &event);
    bool emit(const core::StreamEvent &event);
    void close(const std::string *errorMessage);

    EventSink &sink_;
    SseParser parser_;
    std::size_t maxEventBytes_;
    State state_{State::Idle};
    Framing framing_{Framing::Unknown};
    std::string sniffed_;
    bool opened_{false};
    bool clientGone_{false};
    std::size_t forwarded_{0};
};

}  // namespace llmgate::engine
