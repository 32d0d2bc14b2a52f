#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <utility>

namespace llmgate::core {

enum class ErrorKind {
    ConfigMissing,
    BadRequest,
    UpstreamStatus,
    UpstreamTimeout,
    UpstreamUnreachable,
    Internal,
};

struct GatewayError {
    ErrorKind kind{ErrorKind::Internal};
    // Upstream HTTP status, only meaningful for UpstreamStatus.
    int upstreamCode{0};
    // Short summary, becomes the envelope's "error" field.
    std::string summary;
    std::string message;
    Json::Value details;
    bool retryable{false};

    [[nodiscard]] int httpStatus() const;
    [[nodiscard]] bool hasDetails() const { return !details.isNull(); }

    static GatewayError configMissing(std::string summary, std::string message);
    static GatewayError badRequest(std::string summary, std::string message);
    static GatewayError upstreamStatus(int status, std::string summary, std::string message, Json::Value details = {});
    static GatewayError upstreamTimeout(std::string message);
    static GatewayError upstreamUnreachable(std::string message);
    static GatewayError internal(std::string message);
};

std::string toString(ErrorKind kind);

// Either a value or the error that prevented it.
template <typename T>
struct Outcome {
    std::optional<T> data;
    std::optional<GatewayError> error;

    [[nodiscard]] bool ok() const { return data.has_value(); }

    static Outcome success(T value) {
        Outcome outcome;
        outcome.data = std::move(value);
        return outcome;
    }

    static Outcome failure(GatewayError err) {
        Outcome outcome;
        outcome.error = std::move(err);
        return outcome;
    }
};

}  // namespace llmgate::core
