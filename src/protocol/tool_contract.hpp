#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace chatflow::protocol {

    // How the model asks the application to do something
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "add", "say_hello"
        std::string arguments;  // Raw argument buffer as streamed
        nlohmann::json args;    // Repaired arguments; null until the call completes
    };

    // How the application replies back
    struct ToolResult {
        std::string tool_call_id;
        std::string name;
        bool success = false;
        nlohmann::json value;       // executor output
        std::string error_message;  // failure reason fed back to the model
        double duration_ms = 0.0;
    };

    // Payload of the tool-role message: the value itself, or {"error": ...}
    inline nlohmann::json to_payload(const ToolResult& result) {
        if (result.success) {
            return result.value;
        }
        return nlohmann::json{{"error", result.error_message}};
    }

    inline ToolResult make_failure(const std::string& call_id, const std::string& name,
                                   const std::string& error_message) {
        ToolResult result;
        result.tool_call_id = call_id;
        result.name = name;
        result.success = false;
        result.error_message = error_message;
        return result;
    }

} // namespace chatflow::protocol
