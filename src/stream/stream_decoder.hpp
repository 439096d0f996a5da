#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>
#include "core/errors/flow_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/json_repair.hpp"

namespace chatflow::stream {

enum class DecoderState {
    Idle,
    Streaming,
    Finalizing,
    Done,
    Errored
};

std::string to_string(DecoderState state);

// A tool call whose argument buffer is frozen. decode_error is set when
// the buffer could not be repaired into JSON.
struct CompletedToolCall {
    protocol::ToolCall call;
    std::optional<core::errors::FlowError> decode_error;
};

// ---- Units produced by the decoder ----

struct DecodedText { std::string delta; };
struct DecodedToolCall { CompletedToolCall completed; };
struct DecodedUsage { protocol::UsageDelta usage; };

// End of turn: the full assistant text and every call in completion order.
struct DecodedTurnEnd {
    std::string assistant_text;
    std::vector<CompletedToolCall> tool_calls;
    std::optional<std::string> response_id;
};

using DecodedItem = std::variant<DecodedText, DecodedToolCall, DecodedUsage, DecodedTurnEnd>;

// Reassembles one provider turn from raw events. Argument buffers are
// repaired once, when their call completes; never per delta.
class StreamDecoder {
public:
    explicit StreamDecoder(tools::JsonRepairFn repair = tools::repair_json);

    core::errors::Result<std::vector<DecodedItem>> feed(const protocol::StreamEvent& event);

    DecoderState state() const { return state_; }
    std::size_t open_call_count() const { return open_order_.size(); }
    std::size_t completed_call_count() const { return completed_.size(); }

private:
    struct OpenCall {
        std::string name;
        std::string buffer;
    };

    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::TextDelta& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::ToolCallStarted& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::ToolCallArgumentsDelta& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::ToolCallCompleted& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::TurnCompleted& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::UsageUpdate& event);
    core::errors::Result<std::vector<DecodedItem>> handle(const protocol::ProviderError& event);

    CompletedToolCall finalize(const std::string& call_id);
    core::errors::FlowError fail(const std::string& message, const std::string& code,
                                 core::errors::ErrorCategory category =
                                     core::errors::ErrorCategory::Protocol);
    void transition(DecoderState next);

    tools::JsonRepairFn repair_;
    DecoderState state_ = DecoderState::Idle;
    std::string assistant_text_;
    std::unordered_map<std::string, OpenCall> open_;
    std::vector<std::string> open_order_;
    std::vector<CompletedToolCall> completed_;
    std::unordered_set<std::string> finalized_;
};

}  // namespace chatflow::stream
