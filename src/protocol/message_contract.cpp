#include "protocol/message_contract.hpp"

#include <utility>
#include "core/config/ids.hpp"

namespace chatflow::protocol {

Message make_text_message(const Role role, std::string content) {
    Message message;
    message.id = core::config::generate_message_id();
    message.role = role;
    message.content = std::move(content);
    return message;
}

Message make_tool_call_record(std::vector<ToolCall> calls) {
    Message message;
    message.id = core::config::generate_message_id();
    message.role = Role::Assistant;
    message.tool_calls = std::move(calls);
    return message;
}

Message make_tool_result_message(const ToolResult& result) {
    Message message;
    message.id = core::config::generate_message_id();
    message.role = Role::Tool;
    message.tool_call_id = result.tool_call_id;
    message.payload = to_payload(result);
    message.content = message.payload.dump();
    return message;
}

}  // namespace chatflow::protocol
