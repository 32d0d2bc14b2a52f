#include "http/SSE.hpp"

#include "engine/ResponseTranslator.hpp"

#include <drogon/drogon.h>

#include <string_view>
#include <utility>

namespace llmgate::http {
namespace {
constexpr std::string_view kHeartbeatComment{": heartbeat\n\n"};
}  // namespace

std::pair<drogon::HttpResponsePtr, SseStream::Ptr> SseStream::create(const drogon::HttpRequestPtr &request,
                                                                     Options options) {
    auto stream = std::shared_ptr<SseStream>(new SseStream(options));
    // Frames queued before the response is written must outlive the producer.
    auto response = drogon::HttpResponse::newAsyncStreamResponse(
        [stream](drogon::ResponseStreamPtr responseStream) { stream->onStreamReady(std::move(responseStream)); },
        true);
    response->setStatusCode(drogon::k200OK);
    response->setContentTypeString("text/event-stream");
    response->addHeader("Cache-Control", "no-cache");
    response->addHeader("Connection", "keep-alive");
    response->addHeader("X-Accel-Buffering", "no");
    response->addHeader("Access-Control-Allow-Origin", "*");
    if (request) {
        auto reqId = request->getHeader("X-Request-ID");
        if (!reqId.empty()) {
            response->addHeader("X-Request-ID", reqId);
        }
    }
    return {response, std::move(stream)};
}

SseStream::SseStream(Options options) : options_(options) {}

void SseStream::onStreamReady(drogon::ResponseStreamPtr stream) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        if (stream) {
            stream->close();
        }
        return;
    }
    stream_ = std::move(stream);
    streamReady_ = true;
    loop_ = trantor::EventLoop::getEventLoopOfCurrentThread();
    flushUnlocked();
    if (closeRequested_) {
        finishUnlocked();
        return;
    }
    scheduleHeartbeatUnlocked();
}

bool SseStream::sendFrame(std::string frame) {
    std::lock_guard lock(mutex_);
    if (closed_ || closeRequested_) {
        return false;
    }
    if (frame.empty()) {
        return true;
    }
    bufferedBytes_ += frame.size();
    pending_.push_back(std::move(frame));
    if (bufferedBytes_ > options_.maxBufferedBytes) {
        LOG_WARN << "SSE buffer exceeded " << options_.maxBufferedBytes << " bytes; dropping client";
        abortUnlocked();
        return false;
    }
    flushUnlocked();
    return !closed_;
}

void SseStream::flushUnlocked() {
    if (!streamReady_ || !stream_) {
        return;
    }
    while (!pending_.empty()) {
        auto &front = pending_.front();
        if (!stream_->send(front)) {
            abortUnlocked();
            return;
        }
        bufferedBytes_ -= front.size();
        pending_.pop_front();
    }
}

void SseStream::abortUnlocked() {
    if (closed_) {
        return;
    }
    closed_ = true;
    cancelHeartbeatUnlocked();
    pending_.clear();
    bufferedBytes_ = 0;
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    if (auto handler = std::exchange(abortHandler_, nullptr)) {
        handler();
    }
}

void SseStream::finishUnlocked() {
    closed_ = true;
    cancelHeartbeatUnlocked();
    pending_.clear();
    bufferedBytes_ = 0;
    abortHandler_ = nullptr;
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

void SseStream::scheduleHeartbeatUnlocked() {
    if (!loop_ || closed_) {
        return;
    }
    if (options_.heartbeatInterval.count() <= 0) {
        return;
    }
    auto weak = weak_from_this();
    heartbeatTimer_ = loop_->runEvery(options_.heartbeatInterval, [weak]() {
        if (auto self = weak.lock()) {
            std::lock_guard guard(self->mutex_);
            if (!self->closed_) {
                self->sendHeartbeatUnlocked();
            }
        }
    });
}

void SseStream::cancelHeartbeatUnlocked() {
    if (loop_ && heartbeatTimer_ != trantor::TimerId{}) {
        loop_->invalidateTimer(heartbeatTimer_);
        heartbeatTimer_ = {};
    }
}

void SseStream::sendHeartbeatUnlocked() {
    if (!streamReady_ || closed_ || closeRequested_) {
        return;
    }
    pending_.emplace_back(kHeartbeatComment);
    bufferedBytes_ += kHeartbeatComment.size();
    flushUnlocked();
}

void SseStream::close() {
    std::lock_guard lock(mutex_);
    if (closed_ || closeRequested_) {
        return;
    }
    closeRequested_ = true;
    if (streamReady_) {
        flushUnlocked();
        finishUnlocked();
    }
}

bool SseStream::isOpen() const {
    std::lock_guard lock(mutex_);
    return !closed_ && !closeRequested_;
}

void SseStream::onAbort(std::function<void()> handler) {
    std::lock_guard lock(mutex_);
    abortHandler_ = std::move(handler);
}

SseEventSink::SseEventSink(drogon::HttpRequestPtr request, Callback callback, SseStream::Options options)
    : request_(std::move(request)), callback_(std::move(callback)), options_(options) {}

bool SseEventSink::open() {
    if (responded_) {
        return stream_ && stream_->isOpen();
    }
    auto [response, stream] = SseStream::create(request_, options_);
    stream_ = std::move(stream);
    if (abortHandler_) {
        stream_->onAbort(abortHandler_);
    }
    responded_ = true;
    callback_(response);
    return true;
}

bool SseEventSink::send(const core::StreamEvent &event) {
    if (!stream_) {
        return false;
    }
    return stream_->sendFrame(engine::ResponseTranslator::streamFrame(event));
}

void SseEventSink::close() {
    if (stream_) {
        stream_->close();
    }
}

}  // namespace llmgate::http
