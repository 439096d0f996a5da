#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"
#include "protocol/event_contract.hpp"

namespace chatflow::provider {

struct ProviderRequest {
    nlohmann::json body;  // OpenAI chat-completions request
    std::optional<std::string> previous_response_id;
};

// One provider response, as a sequence of events in provider order.
class EventSource {
public:
    virtual ~EventSource() = default;

    // An empty optional means the provider closed the stream.
    virtual core::errors::Result<std::optional<protocol::StreamEvent>> next() = 0;

    // Called from the consuming thread when the stream is abandoned.
    virtual void cancel() = 0;
};

// Connection to the model provider. Retries and timeouts live here.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Result<std::unique_ptr<EventSource>> open(
        const ProviderRequest& request) = 0;
};

}  // namespace chatflow::provider
