#include "engine/CprTransport.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <cctype>
#include <cstdint>
#include <string>

namespace llmgate::engine {
namespace {

using Clock = std::chrono::steady_clock;

cpr::Header toCprHeader(const std::map<std::string, std::string> &headers) {
    cpr::Header header;
    for (const auto &entry : headers) {
        header[entry.first] = entry.second;
    }
    return header;
}

TransportFailure classifyError(cpr::ErrorCode code) {
    switch (code) {
        case cpr::ErrorCode::OK:
            return TransportFailure::None;
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;
        default:
            return TransportFailure::Unreachable;
    }
}

// "HTTP/1.1 200 OK" or "HTTP/2 200"; 0 when the line is not a status line.
int parseStatusLine(std::string_view line) {
    if (line.rfind("HTTP/", 0) != 0) {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    int status = 0;
    std::size_t digits = 0;
    for (auto pos = space + 1; pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos])); ++pos) {
        status = status * 10 + (line[pos] - '0');
        ++digits;
    }
    return digits == 3 ? status : 0;
}

bool isBlankHeaderLine(std::string_view line) {
    return line == "\r\n" || line == "\n" || line.empty();
}

}  // namespace

TransportResponse CprTransport::post(const TransportRequest &request, const core::CancellationToken::Ptr &cancel) {
    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetTimeout(cpr::Timeout{static_cast<std::int32_t>(request.timeout.count())});
    session.SetConnectTimeout(cpr::ConnectTimeout{static_cast<std::int32_t>(request.connectTimeout.count())});
    session.SetHeader(toCprHeader(request.headers));
    session.SetBody(cpr::Body{request.body});
    session.SetProgressCallback(cpr::ProgressCallback{[cancel](auto, auto, auto, auto, std::intptr_t) {
        return !(cancel && cancel->cancelled());
    }});

    cpr::Response response = session.Post();

    TransportResponse result;
    if (cancel && cancel->cancelled()) {
        result.failure = TransportFailure::Cancelled;
        result.errorMessage = "Request cancelled";
        return result;
    }
    result.failure = classifyError(response.error.code);
    if (!result.ok()) {
        result.errorMessage = response.error.message;
        return result;
    }
    result.status = static_cast<int>(response.status_code);
    result.body = std::move(response.text);
    return result;
}

TransportResponse CprTransport::postStream(const TransportRequest &request,
                                           const StreamCallbacks &callbacks,
                                           const core::CancellationToken::Ptr &cancel) {
    const auto headerDeadline = Clock::now() + request.timeout;

    int status = 0;
    bool headersComplete = false;
    bool forwarding = false;
    bool headerTimeout = false;
    bool consumerStopped = false;
    std::string rejectedBody;

    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    // No overall timeout: once headers arrive the stream may run as long as the upstream keeps it open.
    session.SetConnectTimeout(cpr::ConnectTimeout{static_cast<std::int32_t>(request.connectTimeout.count())});
    session.SetHeader(toCprHeader(request.headers));
    session.SetBody(cpr::Body{request.body});

    session.SetHeaderCallback(cpr::HeaderCallback{[&](auto header, std::intptr_t) {
        std::string_view line(header.data(), header.size());
        if (auto parsed = parseStatusLine(line); parsed != 0) {
            status = parsed;
            return true;
        }
        if (isBlankHeaderLine(line) && status >= 200 && !headersComplete) {
            headersComplete = true;
            forwarding = status >= 200 && status < 300 && (!callbacks.onStatus || callbacks.onStatus(status));
        }
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](auto data, std::intptr_t) {
        std::string_view chunk(data.data(), data.size());
        if (!forwarding) {
            if (rejectedBody.size() < maxErrorBodyBytes_) {
                rejectedBody.append(chunk.substr(0, maxErrorBodyBytes_ - rejectedBody.size()));
            }
            return true;
        }
        if ((cancel && cancel->cancelled()) || !callbacks.onData || !callbacks.onData(chunk)) {
            consumerStopped = true;
            return false;
        }
        return true;
    }});

    session.SetProgressCallback(cpr::ProgressCallback{[&](auto, auto, auto, auto, std::intptr_t) {
        if (cancel && cancel->cancelled()) {
            consumerStopped = true;
            return false;
        }
        if (!headersComplete && Clock::now() >= headerDeadline) {
            headerTimeout = true;
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Post();

    TransportResponse result;
    result.status = status != 0 ? status : static_cast<int>(response.status_code);
    if (headerTimeout) {
        result.failure = TransportFailure::Timeout;
        result.errorMessage = "No response headers within " + std::to_string(request.timeout.count()) + " ms";
        return result;
    }
    if (consumerStopped || (cancel && cancel->cancelled())) {
        result.failure = TransportFailure::Cancelled;
        result.errorMessage = "Stream cancelled";
        return result;
    }
    result.failure = classifyError(response.error.code);
    if (!result.ok()) {
        result.errorMessage = response.error.message;
        return result;
    }
    if (!forwarding) {
        result.body = std::move(rejectedBody);
    }
    return result;
}

}  // namespace llmgate::engine
