#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace llmgate::engine {

struct SseEvent {
    std::string event;
    std::string data;
};

// Incremental text/event-stream parser. Lines and partially assembled events
// survive across feed() calls, so chunk boundaries may fall anywhere.
class SseParser {
   public:
    enum class Status {
        Ok,
        // The callback returned false.
        Stopped,
        // A single event grew past maxEventBytes.
        Overflow,
    };

    using Callback = std::function<bool(const SseEvent &event)>;

    explicit SseParser(std::size_t maxEventBytes = 1U << 20U) : maxEventBytes_(maxEventBytes) {}

    Status feed(std::string_view chunk, const Callback &callback);
    // Dispatches an event the upstream left unterminated when it closed.
    Status finish(const Callback &callback);
    void reset();

    [[nodiscard]] std::size_t pendingBytes() const { return buffer_.size() + data_.size(); }

   private:
    Status processLine(std::string_view line, const Callback &callback);
    Status dispatch(const Callback &callback);

    std::size_t maxEventBytes_;
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool hasData_{false};
};

}  // namespace llmgate::engine
