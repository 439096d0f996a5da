#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "provider/transport.hpp"

namespace chatflow::provider {

// Serves a recorded chat-completions SSE body. Every "[DONE]" closes one
// provider response; each open() call replays the next one.
class ReplayTransport : public Transport {
public:
    // Each turn is the list of SSE data payloads of one response.
    explicit ReplayTransport(std::vector<std::vector<std::string>> turns);

    static core::errors::Result<std::unique_ptr<ReplayTransport>> from_sse(const std::string& body);
    static core::errors::Result<std::unique_ptr<ReplayTransport>> from_file(const std::string& path);

    core::errors::Result<std::unique_ptr<EventSource>> open(const ProviderRequest& request) override;

    std::size_t turn_count() const { return turns_.size(); }
    std::size_t requests_served() const { return next_turn_; }
    const std::vector<ProviderRequest>& requests() const { return requests_; }

private:
    std::vector<std::vector<std::string>> turns_;
    std::vector<ProviderRequest> requests_;
    std::size_t next_turn_ = 0;
};

}  // namespace chatflow::provider
