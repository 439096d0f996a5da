#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tool_contract.hpp"

namespace chatflow::protocol {

    enum class Role {
        System,
        Developer,
        User,
        Assistant,
        Tool
    };

    // One transcript entry. Messages are never edited once appended.
    struct Message {
        std::string id;
        Role role = Role::User;
        std::string content;

        // Assistant tool-call record: every call the model made in one turn.
        std::vector<ToolCall> tool_calls;

        // Tool result: the call this answers and its structured payload.
        std::optional<std::string> tool_call_id;
        nlohmann::json payload;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:
                return "system";
            case Role::Developer:
                return "developer";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    Message make_text_message(Role role, std::string content);
    Message make_tool_call_record(std::vector<ToolCall> calls);
    Message make_tool_result_message(const ToolResult& result);

} // namespace chatflow::protocol
