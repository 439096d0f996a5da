#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/generate_config.hpp"
#include "core/errors/flow_errors.hpp"
#include "protocol/message_contract.hpp"
#include "provider/transport.hpp"
#include "tools/tool_registry.hpp"

namespace chatflow::provider {

// Converts the transcript into chat-completions "messages". Consecutive
// assistant text and tool-call records collapse into one assistant
// message; tool results become role "tool" messages.
core::errors::Result<nlohmann::json> to_chat_messages(
    const std::vector<protocol::Message>& transcript);

core::errors::Result<ProviderRequest> build_chat_request(
    const std::vector<protocol::Message>& transcript,
    const tools::ToolRegistry& tools,
    const core::config::GenerateConfig& config,
    const std::optional<std::string>& cursor);

}  // namespace chatflow::provider
