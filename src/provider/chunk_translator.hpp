#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/flow_errors.hpp"
#include "protocol/event_contract.hpp"

namespace chatflow::provider {

// Turns chat-completions stream chunks (SSE data payloads) into provider
// events. One translator per provider response.
class ChunkTranslator {
public:
    core::errors::Result<std::vector<protocol::StreamEvent>> translate(const std::string& data);

    bool done() const { return done_; }
    const std::optional<std::string>& response_id() const { return response_id_; }

private:
    struct OpenCall {
        std::string call_id;
        bool completed = false;
    };

    void complete_open_calls(std::vector<protocol::StreamEvent>& events);

    std::map<long long, OpenCall> calls_;  // keyed by the chunk's tool_calls index
    std::optional<std::string> response_id_;
    bool done_ = false;
};

}  // namespace chatflow::provider
