#include "core/GatewayError.hpp"

namespace llmgate::core {

int GatewayError::httpStatus() const {
    switch (kind) {
        case ErrorKind::ConfigMissing:
            return 500;
        case ErrorKind::BadRequest:
            return 400;
        case ErrorKind::UpstreamStatus:
            return upstreamCode >= 400 && upstreamCode < 600 ? upstreamCode : 502;
        case ErrorKind::UpstreamTimeout:
            return 504;
        case ErrorKind::UpstreamUnreachable:
            return 502;
        case ErrorKind::Internal:
            return 500;
    }
    return 500;
}

GatewayError GatewayError::configMissing(std::string summary, std::string message) {
    GatewayError error;
    error.kind = ErrorKind::ConfigMissing;
    error.summary = std::move(summary);
    error.message = std::move(message);
    return error;
}

GatewayError GatewayError::badRequest(std::string summary, std::string message) {
    GatewayError error;
    error.kind = ErrorKind::BadRequest;
    error.summary = std::move(summary);
    error.message = std::move(message);
    return error;
}

GatewayError GatewayError::upstreamStatus(int status, std::string summary, std::string message, Json::Value details) {
    GatewayError error;
    error.kind = ErrorKind::UpstreamStatus;
    error.upstreamCode = status;
    error.summary = std::move(summary);
    error.message = std::move(message);
    error.details = std::move(details);
    return error;
}

GatewayError GatewayError::upstreamTimeout(std::string message) {
    GatewayError error;
    error.kind = ErrorKind::UpstreamTimeout;
    error.summary = "Gateway Timeout";
    error.message = std::move(message);
    error.retryable = true;
    return error;
}

GatewayError GatewayError::upstreamUnreachable(std::string message) {
    GatewayError error;
    error.kind = ErrorKind::UpstreamUnreachable;
    error.summary = "Request Failed";
    error.message = std::move(message);
    error.retryable = true;
    return error;
}

GatewayError GatewayError::internal(std::string message) {
    GatewayError error;
    error.kind = ErrorKind::Internal;
    error.summary = "Internal Server Error";
    error.message = std::move(message);
    return error;
}

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigMissing:
            return "config_missing";
        case ErrorKind::BadRequest:
            return "bad_request";
        case ErrorKind::UpstreamStatus:
            return "upstream_status";
        case ErrorKind::UpstreamTimeout:
            return "upstream_timeout";
        case ErrorKind::UpstreamUnreachable:
            return "upstream_unreachable";
        case ErrorKind::Internal:
            return "internal";
    }
    return "internal";
}

}  // namespace llmgate::core
