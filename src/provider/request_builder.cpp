#include "provider/request_builder.hpp"

namespace chatflow::provider {

using core::errors::ErrorCategory;
using core::errors::FlowError;
using nlohmann::json;
using protocol::Message;
using protocol::Role;

namespace {

json call_to_json(const protocol::ToolCall& call) {
    json function;
    function["name"] = call.name;
    function["arguments"] = call.args.is_null() ? std::string("{}") : call.args.dump();
    return json{{"id", call.id}, {"type", "function"}, {"function", function}};
}

}  // namespace

core::errors::Result<json> to_chat_messages(const std::vector<Message>& transcript) {
    json messages = json::array();
    bool last_was_assistant_text = false;

    for (const auto& message : transcript) {
        switch (message.role) {
            case Role::System:
            case Role::Developer:
            case Role::User:
                messages.push_back(
                    json{{"role", protocol::to_string(message.role)},
                         {"content", message.content}});
                last_was_assistant_text = false;
                break;
            case Role::Assistant: {
                if (message.tool_calls.empty()) {
                    messages.push_back(json{{"role", "assistant"}, {"content", message.content}});
                    last_was_assistant_text = true;
                    break;
                }
                json calls = json::array();
                for (const auto& call : message.tool_calls) {
                    calls.push_back(call_to_json(call));
                }
                if (last_was_assistant_text) {
                    messages.back()["tool_calls"] = std::move(calls);
                } else {
                    messages.push_back(json{{"role", "assistant"},
                                            {"content", nullptr},
                                            {"tool_calls", std::move(calls)}});
                }
                last_was_assistant_text = false;
                break;
            }
            case Role::Tool:
                if (!message.tool_call_id.has_value()) {
                    return FlowError{ErrorCategory::Input,
                                     "Tool message " + message.id + " has no tool_call_id.",
                                     "invalid_transcript"};
                }
                messages.push_back(json{{"role", "tool"},
                                        {"tool_call_id", message.tool_call_id.value()},
                                        {"content", message.payload.dump()}});
                last_was_assistant_text = false;
                break;
            default:
                return FlowError{ErrorCategory::Internal,
                                 "Unknown role in message " + message.id,
                                 "invalid_transcript"};
        }
    }
    return messages;
}

core::errors::Result<ProviderRequest> build_chat_request(
    const std::vector<Message>& transcript, const tools::ToolRegistry& tools,
    const core::config::GenerateConfig& config,
    const std::optional<std::string>& cursor) {
    auto messages = to_chat_messages(transcript);
    if (core::errors::is_error(messages)) {
        return core::errors::get_error(messages);
    }

    json body;
    body["model"] = config.model;
    body["messages"] = core::errors::get_value(messages);
    body["stream"] = true;
    body["stream_options"] = json{{"include_usage", true}};

    const json definitions = tools.definitions();
    if (!definitions.empty()) {
        body["tools"] = definitions;
        body["tool_choice"] = core::config::to_string(config.tool_choice);
        body["parallel_tool_calls"] = config.parallel_tool_calls;
    }
    if (config.temperature.has_value()) {
        body["temperature"] = config.temperature.value();
    }
    if (config.max_output_tokens.has_value()) {
        body["max_completion_tokens"] = config.max_output_tokens.value();
    }
    for (auto it = config.extra.begin(); it != config.extra.end(); ++it) {
        body[it.key()] = it.value();
    }

    ProviderRequest request;
    request.body = std::move(body);
    request.previous_response_id = cursor;
    return request;
}

}  // namespace chatflow::provider
