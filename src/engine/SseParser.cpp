#include "engine/SseParser.hpp"

namespace llmgate::engine {

SseParser::Status SseParser::feed(std::string_view chunk, const Callback &callback) {
    buffer_.append(chunk);

    std::size_t pos = 0;
    while (pos < buffer_.size()) {
        const auto newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            break;
        }
        std::string_view line(buffer_.data() + pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        pos = newline + 1;

        const auto status = processLine(line, callback);
        if (status != Status::Ok) {
            buffer_.erase(0, pos);
            return status;
        }
    }
    buffer_.erase(0, pos);

    if (pendingBytes() > maxEventBytes_) {
        return Status::Overflow;
    }
    return Status::Ok;
}

SseParser::Status SseParser::finish(const Callback &callback) {
    if (!buffer_.empty()) {
        std::string line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (auto status = processLine(line, callback); status != Status::Ok) {
            return status;
        }
    }
    if (hasData_) {
        return dispatch(callback);
    }
    return Status::Ok;
}

void SseParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    hasData_ = false;
}

SseParser::Status SseParser::processLine(std::string_view line, const Callback &callback) {
    if (line.empty()) {
        if (hasData_) {
            return dispatch(callback);
        }
        event_.clear();
        return Status::Ok;
    }
    if (line.front() == ':') {
        return Status::Ok;
    }

    auto colon = line.find(':');
    std::string_view field = line.substr(0, colon);
    std::string_view value;
    if (colon != std::string_view::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (hasData_) {
            data_.push_back('\n');
        }
        data_.append(value);
        hasData_ = true;
        if (data_.size() > maxEventBytes_) {
            return Status::Overflow;
        }
    } else if (field == "event") {
        event_.assign(value);
    }
    return Status::Ok;
}

SseParser::Status SseParser::dispatch(const Callback &callback) {
    SseEvent event{std::move(event_), std::move(data_)};
    event_.clear();
    data_.clear();
    hasData_ = false;
    return callback(event) ? Status::Ok : Status::Stopped;
}

}  // namespace llmgate::engine
