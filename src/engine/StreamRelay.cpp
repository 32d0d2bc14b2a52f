#include "engine/StreamRelay.hpp"

#include <drogon/drogon.h>

#include <array>

namespace llmgate::engine {
namespace {

constexpr std::string_view kUpstreamDone{"[DONE]"};
constexpr std::size_t kMaxSniffBytes{64};
constexpr std::array<std::string_view, 4> kSseFields{"data", "event", "id", "retry"};

bool isSseField(std::string_view name) {
    for (const auto field : kSseFields) {
        if (name == field) {
            return true;
        }
    }
    return false;
}

bool isSseFieldPrefix(std::string_view name) {
    for (const auto field : kSseFields) {
        if (field.substr(0, name.size()) == name) {
            return true;
        }
    }
    return false;
}

}  // namespace

StreamRelay::StreamRelay(EventSink &sink, std::size_t maxEventBytes)
    : sink_(sink), parser_(maxEventBytes), maxEventBytes_(maxEventBytes) {}

bool StreamRelay::begin() {
    if (state_ != State::Idle) {
        return state_ == State::Relaying;
    }
    opened_ = true;
    if (!sink_.open()) {
        clientGone_ = true;
        state_ = State::Closed;
        sink_.close();
        return false;
    }
    state_ = State::Relaying;
    return true;
}

bool StreamRelay::consume(std::string_view chunk) {
    if (state_ != State::Relaying) {
        return false;
    }
    if (framing_ != Framing::Unknown) {
        return consumeFramed(chunk);
    }
    sniffed_.append(chunk);
    framing_ = detectFraming(sniffed_, false);
    if (framing_ == Framing::Unknown) {
        if (sniffed_.size() <= kMaxSniffBytes) {
            return true;
        }
        framing_ = Framing::Raw;
    }
    const std::string buffered = std::move(sniffed_);
    sniffed_.clear();
    return consumeFramed(buffered);
}

StreamRelay::Framing StreamRelay::detectFraming(std::string_view prefix, bool complete) {
    const auto start = prefix.find_first_not_of("\r\n");
    if (start == std::string_view::npos) {
        return complete ? Framing::EventStream : Framing::Unknown;
    }
    if (prefix[start] == ':') {
        return Framing::EventStream;
    }
    const auto end = prefix.find_first_of(":\r\n", start);
    if (end == std::string_view::npos) {
        const auto partial = prefix.substr(start);
        if (!complete && isSseFieldPrefix(partial)) {
            return Framing::Unknown;
        }
        return isSseField(partial) ? Framing::EventStream : Framing::Raw;
    }
    return isSseField(prefix.substr(start, end - start)) ? Framing::EventStream : Framing::Raw;
}

bool StreamRelay::consumeFramed(std::string_view chunk) {
    if (framing_ == Framing::Raw) {
        return forwardRaw(chunk);
    }
    switch (parser_.feed(chunk, [this](const SseEvent &event) { return forward(event); })) {
        case SseParser::Status::Ok:
            return true;
        case SseParser::Status::Stopped:
            return false;
        case SseParser::Status::Overflow: {
            const std::string message = "Upstream event exceeded " + std::to_string(maxEventBytes_) + " bytes";
            LOG_WARN << message;
            close(&message);
            return false;
        }
    }
    return false;
}

void StreamRelay::finish() {
    if (state_ != State::Relaying) {
        return;
    }
    if (framing_ == Framing::Unknown) {
        framing_ = detectFraming(sniffed_, true);
        const std::string buffered = std::move(sniffed_);
        sniffed_.clear();
        if (!buffered.empty() && !consumeFramed(buffered)) {
            return;
        }
    }
    if (framing_ == Framing::Raw) {
        close(nullptr);
        return;
    }
    const auto status = parser_.finish([this](const SseEvent &event) { return forward(event); });
    if (status == SseParser::Status::Overflow) {
        const std::string message = "Upstream event exceeded " + std::to_string(maxEventBytes_) + " bytes";
        close(&message);
        return;
    }
    if (state_ == State::Relaying) {
        close(nullptr);
    }
}

void StreamRelay::fail(const std::string &message) {
    if (state_ == State::Closed) {
        return;
    }
    if (state_ == State::Idle && !begin()) {
        return;
    }
    close(&message);
}

core::StreamEvent StreamRelay::classify(const SseEvent &event) {
    if (event.data.find("\"tool_calls\"") != std::string::npos) {
        return core::StreamEvent::toolCallDelta(event.data);
    }
    return core::StreamEvent::delta(event.data);
}

bool StreamRelay::forwardRaw(std::string_view chunk) {
    if (state_ != State::Relaying) {
        return false;
    }
    if (chunk.empty()) {
        return true;
    }
    if (!emit(core::StreamEvent::delta(std::string(chunk)))) {
        return false;
    }
    ++forwarded_;
    return true;
}

bool StreamRelay::forward(const SseEvent &event) {
    if (state_ != State::Relaying) {
        return false;
    }
    if (event.data == kUpstreamDone) {
        return true;
    }
    if (!emit(classify(event))) {
        return false;
    }
    ++forwarded_;
    return true;
}

bool StreamRelay::emit(const core::StreamEvent &event) {
    if (clientGone_) {
        return false;
    }
    if (!sink_.send(event)) {
        LOG_INFO << "Client disconnected; cancelling upstream stream";
        clientGone_ = true;
        state_ = State::Closed;
        sink_.close();
        return false;
    }
    return true;
}

void StreamRelay::close(const std::string *errorMessage) {
    if (state_ != State::Relaying) {
        return;
    }
    if (errorMessage != nullptr && !emit(core::StreamEvent::error(*errorMessage))) {
        return;
    }
    if (!emit(core::StreamEvent::done())) {
        return;
    }
    state_ = State::Closed;
    sink_.close();
}

}  // namespace llmgate::engine
