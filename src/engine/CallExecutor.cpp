#include "engine/CallExecutor.hpp"

#include "llmgate/logging.h"

#include <drogon/drogon.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace llmgate::engine {
namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

std::string serialize(const Json::Value &body) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, body);
}

TransportRequest buildRequest(const providers::OutboundPayload &payload, const providers::ProviderProfile &profile) {
    TransportRequest request;
    request.url = payload.url;
    request.headers = payload.headers;
    request.body = serialize(payload.body);
    request.timeout = profile.deadline;
    request.connectTimeout = profile.connectTimeout;
    return request;
}

core::GatewayError timeoutError(const providers::ProviderProfile &profile) {
    const auto seconds = std::max<std::int64_t>(1, profile.deadline.count() / 1000);
    return core::GatewayError::upstreamTimeout("The request to the " + profile.name + " API took too long to complete (>" +
                                               std::to_string(seconds) + " seconds).");
}

core::GatewayError cancelledError() {
    return core::GatewayError::internal("Request cancelled before the upstream call completed");
}

// Waits out the backoff before `attempt`. False when cancelled.
bool backoff(const providers::ProviderProfile &profile, std::size_t attempt, core::CancellationToken &cancel) {
    const auto delay = profile.retry.delayBeforeAttempt(attempt);
    if (delay.count() <= 0) {
        return !cancel.cancelled();
    }
    LOG_DEBUG << "Waiting " << delay.count() << " ms before attempt " << attempt << " to " << profile.name;
    return cancel.waitFor(delay);
}

std::int64_t elapsedMs(Clock::time_point start) {
    return duration_cast<milliseconds>(Clock::now() - start).count();
}

}  // namespace

CallExecutor::CallExecutor(std::shared_ptr<HttpTransport> transport) : transport_(std::move(transport)) {}

core::Outcome<core::ChatResult> CallExecutor::execute(const providers::ProviderAdapter &adapter,
                                                      const providers::OutboundPayload &payload,
                                                      const core::CancellationToken::Ptr &cancel) const {
    using Result = core::Outcome<core::ChatResult>;

    const auto &profile = adapter.profile();
    const auto token = cancel ? cancel : core::CancellationToken::create();
    const auto start = Clock::now();
    const auto attempts = std::max<std::size_t>(1, profile.retry.maxAttempts);
    auto request = buildRequest(payload, profile);

    std::optional<core::GatewayError> lastError;
    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            const auto delay = profile.retry.delayBeforeAttempt(attempt);
            if (milliseconds(elapsedMs(start)) + delay >= profile.requestBudget) {
                LOG_WARN << "Request budget of " << profile.requestBudget.count() << " ms spent after "
                         << (attempt - 1) << " attempts to " << profile.name;
                lastError = core::GatewayError::upstreamTimeout("The request to the " + profile.name +
                                                                " API exceeded its time budget of " +
                                                                std::to_string(profile.requestBudget.count()) + " ms.");
                break;
            }
            if (!backoff(profile, attempt, *token)) {
                return Result::failure(cancelledError());
            }
        }

        const auto remaining = profile.requestBudget - milliseconds(elapsedMs(start));
        if (remaining.count() <= 0) {
            lastError = timeoutError(profile);
            break;
        }
        request.timeout = std::min(profile.deadline, remaining);

        auto response = transport_->post(request, token);
        switch (response.failure) {
            case TransportFailure::Cancelled:
                return Result::failure(cancelledError());
            case TransportFailure::Timeout:
                LOG_WARN << "Attempt " << attempt << "/" << attempts << " to " << profile.name << " timed out";
                lastError = timeoutError(profile);
                continue;
            case TransportFailure::Unreachable:
                LOG_WARN << "Attempt " << attempt << "/" << attempts << " to " << profile.name
                         << " failed: " << response.errorMessage;
                lastError = core::GatewayError::upstreamUnreachable(response.errorMessage.empty()
                                                                        ? "Unable to reach " + profile.name
                                                                        : response.errorMessage);
                continue;
            case TransportFailure::None:
                break;
        }

        if (response.status >= 200 && response.status < 300) {
            auto decoded = adapter.decode(response.body);
            const auto latency = elapsedMs(start);
            if (decoded.ok()) {
                decoded.data->latencyMs = latency;
                updateLogContext(LogContext{.status = 200, .latencyMs = static_cast<double>(latency)});
                LOG_INFO << profile.name << " responded after " << attempt << " attempt(s) in " << latency << " ms";
            } else {
                LOG_ERROR << profile.name << " returned an undecodable body: " << decoded.error->message;
            }
            return decoded;
        }

        auto error = adapter.decodeError(response.status, response.body, payload.model);
        if (!profile.retry.isRetryableStatus(response.status)) {
            LOG_WARN << profile.name << " rejected the request with status " << response.status;
            return Result::failure(std::move(error));
        }
        LOG_WARN << "Attempt " << attempt << "/" << attempts << " to " << profile.name << " returned status "
                 << response.status;
        lastError = std::move(error);
    }

    if (!lastError.has_value()) {
        lastError = timeoutError(profile);
    }
    LOG_ERROR << "Giving up on " << profile.name << ": " << lastError->message;
    return Result::failure(std::move(*lastError));
}

std::optional<core::GatewayError> CallExecutor::stream(const providers::ProviderAdapter &adapter,
                                                       const providers::OutboundPayload &payload,
                                                       StreamRelay &relay,
                                                       const core::CancellationToken::Ptr &cancel) const {
    const auto &profile = adapter.profile();
    const auto token = cancel ? cancel : core::CancellationToken::create();
    const auto attempts = std::max<std::size_t>(1, profile.retry.maxAttempts);
    const auto start = Clock::now();
    const auto request = buildRequest(payload, profile);

    // The relay may already be open for heartbeats; only accepted headers end the retry window.
    bool headersReceived = false;
    StreamCallbacks callbacks{
        .onStatus =
            [&relay, &headersReceived](int) {
                headersReceived = true;
                return relay.begin();
            },
        .onData = [&relay](std::string_view chunk) { return relay.consume(chunk); },
    };

    std::optional<core::GatewayError> lastError;
    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1 && !backoff(profile, attempt, *token)) {
            relay.fail("Stream cancelled");
            return cancelledError();
        }

        auto response = transport_->postStream(request, callbacks, token);

        // Past the headers nothing is retried; the relay owns the outcome.
        if (headersReceived) {
            if (relay.state() == StreamRelay::State::Closed) {
                return std::nullopt;
            }
            if (response.ok()) {
                relay.finish();
                LOG_INFO << profile.name << " stream completed with " << relay.eventsForwarded() << " events in "
                         << elapsedMs(start) << " ms";
                return std::nullopt;
            }
            auto message = response.failure == TransportFailure::Cancelled
                               ? std::string{"Stream cancelled"}
                               : "Stream interrupted: " + response.errorMessage;
            LOG_WARN << profile.name << " stream failed after " << relay.eventsForwarded() << " events: " << message;
            relay.fail(message);
            return core::GatewayError::upstreamUnreachable(std::move(message));
        }

        switch (response.failure) {
            case TransportFailure::Cancelled:
                relay.fail("Stream cancelled");
                return cancelledError();
            case TransportFailure::Timeout:
                LOG_WARN << "Stream attempt " << attempt << "/" << attempts << " to " << profile.name
                         << " got no headers in time";
                lastError = timeoutError(profile);
                continue;
            case TransportFailure::Unreachable:
                LOG_WARN << "Stream attempt " << attempt << "/" << attempts << " to " << profile.name
                         << " failed: " << response.errorMessage;
                lastError = core::GatewayError::upstreamUnreachable(response.errorMessage.empty()
                                                                        ? "Unable to reach " + profile.name
                                                                        : response.errorMessage);
                continue;
            case TransportFailure::None:
                break;
        }

        if (response.status >= 200 && response.status < 300) {
            lastError = core::GatewayError::upstreamUnreachable(profile.name + " closed the stream before it started");
            break;
        }

        auto error = adapter.decodeError(response.status, response.body, payload.model);
        if (!profile.retry.isRetryableStatus(response.status)) {
            lastError = std::move(error);
            break;
        }
        LOG_WARN << "Stream attempt " << attempt << "/" << attempts << " to " << profile.name << " returned status "
                 << response.status;
        lastError = std::move(error);
    }

    if (!lastError.has_value()) {
        lastError = timeoutError(profile);
    }
    LOG_ERROR << "Giving up on " << profile.name << " stream: " << lastError->message;
    relay.fail(lastError->message);
    return lastError;
}

}  // namespace llmgate::engine
