#include "engine/Gateway.hpp"

#include "engine/RequestNormalizer.hpp"

#include <drogon/drogon.h>

#include <exception>
#include <utility>

namespace llmgate::engine {
namespace {

Envelope notConfigured(core::Provider provider) {
    return ResponseTranslator::error(core::GatewayError::configMissing(
        "Provider not configured", std::string(core::providerKey(provider)) + " is disabled on this gateway"));
}

Envelope internalError(const std::string &provider, const std::exception &e) {
    LOG_ERROR << provider << " request failed unexpectedly: " << e.what();
    return ResponseTranslator::error(core::GatewayError::internal(e.what()));
}

}  // namespace

Gateway::Gateway(std::shared_ptr<const providers::ProviderRegistry> registry,
                 std::shared_ptr<HttpTransport> transport,
                 std::size_t maxEventBytes)
    : registry_(std::move(registry)), executor_(std::move(transport)), maxEventBytes_(maxEventBytes) {}

bool Gateway::knows(core::Provider provider) const {
    return adapterFor(provider) != nullptr;
}

Envelope Gateway::chat(core::Provider provider,
                       const Json::Value &body,
                       const providers::RequestContext &context,
                       const core::CancellationToken::Ptr &cancel) const {
    auto adapter = adapterFor(provider);
    if (!adapter) {
        return notConfigured(provider);
    }

    auto request = RequestNormalizer(adapter->profile()).normalizeChat(body);
    if (!request.ok()) {
        return ResponseTranslator::error(*request.error);
    }
    auto payload = adapter->encode(*request.data, core::CallMode::Buffered, context);
    if (!payload.ok()) {
        return ResponseTranslator::error(*payload.error);
    }

    try {
        auto result = executor_.execute(*adapter, *payload.data, cancel);
        if (!result.ok()) {
            return ResponseTranslator::error(*result.error);
        }
        return ResponseTranslator::chat(*result.data, adapter->profile());
    } catch (const std::exception &e) {
        return internalError(adapter->profile().name, e);
    }
}

Envelope Gateway::search(const Json::Value &body,
                         const providers::RequestContext &context,
                         const core::CancellationToken::Ptr &cancel) const {
    auto adapter = adapterFor(core::Provider::Perplexity);
    if (!adapter) {
        return notConfigured(core::Provider::Perplexity);
    }

    auto request = RequestNormalizer(adapter->profile()).normalizeSearch(body);
    if (!request.ok()) {
        return ResponseTranslator::error(*request.error);
    }
    const auto &query = request.data->messages.back().content.asString();
    LOG_INFO << "Search query: \"" << query.substr(0, 100) << (query.size() > 100 ? "..." : "") << "\"";

    auto payload = adapter->encode(*request.data, core::CallMode::Buffered, context);
    if (!payload.ok()) {
        return ResponseTranslator::error(*payload.error);
    }

    try {
        auto result = executor_.execute(*adapter, *payload.data, cancel);
        if (!result.ok()) {
            return ResponseTranslator::error(*result.error);
        }
        return ResponseTranslator::search(*result.data);
    } catch (const std::exception &e) {
        return internalError(adapter->profile().name, e);
    }
}

std::optional<Envelope> Gateway::stream(core::Provider provider,
                                        const Json::Value &body,
                                        const providers::RequestContext &context,
                                        EventSink &sink,
                                        const core::CancellationToken::Ptr &cancel) const {
    auto adapter = adapterFor(provider);
    if (!adapter) {
        return notConfigured(provider);
    }

    auto request = RequestNormalizer(adapter->profile()).normalizeChat(body);
    if (!request.ok()) {
        return ResponseTranslator::error(*request.error);
    }
    auto payload = adapter->encode(*request.data, core::CallMode::Streamed, context);
    if (!payload.ok()) {
        return ResponseTranslator::error(*payload.error);
    }

    // Open before the first attempt: a client leaving during retries cancels them.
    StreamRelay relay(sink, maxEventBytes_);
    if (!relay.begin()) {
        LOG_INFO << "Client left before " << adapter->profile().name << " stream started";
        return std::nullopt;
    }
    try {
        if (auto error = executor_.stream(*adapter, *payload.data, relay, cancel)) {
            LOG_WARN << adapter->profile().name << " stream ended with " << core::toString(error->kind) << ": "
                     << error->message;
        }
    } catch (const std::exception &e) {
        LOG_ERROR << adapter->profile().name << " stream failed unexpectedly: " << e.what();
        relay.fail(e.what());
    }
    return std::nullopt;
}

Envelope Gateway::unknownProvider(const std::string &name) {
    Envelope envelope;
    envelope.status = 404;
    envelope.body = Json::Value(Json::objectValue);
    envelope.body["error"] = "Unknown provider";
    envelope.body["message"] = "No provider named \"" + name + "\". Expected one of: openai, groq, fireworks, perplexity.";
    return envelope;
}

std::shared_ptr<const providers::ProviderAdapter> Gateway::adapterFor(core::Provider provider) const {
    return registry_ ? registry_->find(provider) : nullptr;
}

}  // namespace llmgate::engine
