#pragma once

#include "engine/StreamRelay.hpp"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/net/EventLoop.h>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace llmgate::http {

class SseStream : public std::enable_shared_from_this<SseStream> {
   public:
    using Ptr = std::shared_ptr<SseStream>;

    struct Options {
        std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(15)};
        std::size_t maxBufferedBytes{4U << 20U};
    };

    static std::pair<drogon::HttpResponsePtr, Ptr> create(const drogon::HttpRequestPtr &request,
                                                          Options options = {});

    // Queues one pre-framed event. False once the stream is closed or the client is gone.
    bool sendFrame(std::string frame);
    // Flushes what is queued, then ends the response.
    void close();
    [[nodiscard]] bool isOpen() const;

    // Invoked once if the client goes away or the buffer overflows.
    void onAbort(std::function<void()> handler);

   private:
    explicit SseStream(Options options);

    void onStreamReady(drogon::ResponseStreamPtr stream);
    void flushUnlocked();
    void abortUnlocked();
    void finishUnlocked();
    void scheduleHeartbeatUnlocked();
    void cancelHeartbeatUnlocked();
    void sendHeartbeatUnlocked();

    mutable std::mutex mutex_;
    Options options_;
    drogon::ResponseStreamPtr stream_;
    trantor::EventLoop *loop_{nullptr};
    trantor::TimerId heartbeatTimer_{};
    bool streamReady_{false};
    bool closeRequested_{false};
    bool closed_{false};
    std::deque<std::string> pending_;
    std::size_t bufferedBytes_{0};
    std::function<void()> abortHandler_;
};

// EventSink that answers the HTTP request with an SSE response the first
// time the relay opens, and frames every event onto it.
class SseEventSink : public engine::EventSink {
   public:
    using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

    SseEventSink(drogon::HttpRequestPtr request, Callback callback, SseStream::Options options);

    bool open() override;
    bool send(const core::StreamEvent &event) override;
    void close() override;

    // Called when the client disappears before the relay is done.
    void onAbort(std::function<void()> handler) { abortHandler_ = std::move(handler); }
    [[nodiscard]] bool responded() const { return responded_; }

   private:
    drogon::HttpRequestPtr request_;
    Callback callback_;
    SseStream::Options options_;
    SseStream::Ptr stream_;
    std::function<void()> abortHandler_;
    bool responded_{false};
};

}  // namespace llmgate::http
