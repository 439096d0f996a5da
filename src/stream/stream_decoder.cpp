#include "stream/stream_decoder.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace chatflow::stream {

using core::errors::ErrorCategory;
using core::errors::FlowError;
using Items = std::vector<DecodedItem>;

std::string to_string(const DecoderState state) {
    switch (state) {
        case DecoderState::Idle:
            return "idle";
        case DecoderState::Streaming:
            return "streaming";
        case DecoderState::Finalizing:
            return "finalizing";
        case DecoderState::Done:
            return "done";
        case DecoderState::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

StreamDecoder::StreamDecoder(tools::JsonRepairFn repair) : repair_(std::move(repair)) {}

core::errors::Result<Items> StreamDecoder::feed(const protocol::StreamEvent& event) {
    if (state_ == DecoderState::Errored) {
        return FlowError{ErrorCategory::Protocol,
                         "Decoder already failed; no further events accepted.",
                         "decoder_errored"};
    }
    if (state_ == DecoderState::Done) {
        return fail("Event received after the turn completed.", "event_after_done");
    }
    if (state_ == DecoderState::Idle) {
        transition(DecoderState::Streaming);
    }
    return std::visit([this](const auto& concrete) { return handle(concrete); }, event);
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::TextDelta& event) {
    if (event.text.empty()) {
        return Items{};
    }
    assistant_text_ += event.text;
    return Items{DecodedText{event.text}};
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::ToolCallStarted& event) {
    if (event.call_id.empty()) {
        return fail("Tool call started without an identifier.", "missing_call_id");
    }
    if (open_.count(event.call_id) != 0 || finalized_.count(event.call_id) != 0) {
        return fail("Duplicate tool call id in turn: " + event.call_id,
                    "duplicate_tool_call");
    }
    open_.emplace(event.call_id, OpenCall{event.name, std::string()});
    open_order_.push_back(event.call_id);
    CHATFLOW_LOG_DEBUG("StreamDecoder: call " + event.call_id + " (" + event.name +
                       ") opened");
    return Items{};
}

core::errors::Result<Items> StreamDecoder::handle(
    const protocol::ToolCallArgumentsDelta& event) {
    if (finalized_.count(event.call_id) != 0) {
        return fail("Argument delta for completed call: " + event.call_id,
                    "tool_call_already_completed");
    }
    auto it = open_.find(event.call_id);
    if (it == open_.end()) {
        return fail("Argument delta for unknown call: " + event.call_id,
                    "unknown_tool_call");
    }
    it->second.buffer += event.delta;
    return Items{};
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::ToolCallCompleted& event) {
    if (finalized_.count(event.call_id) != 0) {
        return fail("Call completed twice: " + event.call_id,
                    "tool_call_already_completed");
    }
    if (open_.count(event.call_id) == 0) {
        return fail("Completion for unknown call: " + event.call_id, "unknown_tool_call");
    }
    return Items{DecodedToolCall{finalize(event.call_id)}};
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::TurnCompleted& event) {
    transition(DecoderState::Finalizing);

    Items items;
    // Calls the provider never closed are frozen as they stand.
    const std::vector<std::string> still_open = open_order_;
    for (const auto& call_id : still_open) {
        CHATFLOW_LOG_WARN("StreamDecoder: call " + call_id +
                          " still open at turn end; finalizing");
        items.push_back(DecodedToolCall{finalize(call_id)});
    }

    DecodedTurnEnd turn_end;
    turn_end.assistant_text = std::move(assistant_text_);
    turn_end.tool_calls = completed_;
    turn_end.response_id = event.response_id;
    items.push_back(std::move(turn_end));

    transition(DecoderState::Done);
    return items;
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::UsageUpdate& event) {
    return Items{DecodedUsage{event.usage}};
}

core::errors::Result<Items> StreamDecoder::handle(const protocol::ProviderError& event) {
    FlowError error = fail("Provider reported an error: " + event.message,
                           event.code.empty() ? "provider_error" : event.code,
                           ErrorCategory::Provider);
    return error;
}

CompletedToolCall StreamDecoder::finalize(const std::string& call_id) {
    auto node = open_.extract(call_id);
    open_order_.erase(std::remove(open_order_.begin(), open_order_.end(), call_id),
                      open_order_.end());
    finalized_.insert(call_id);

    CompletedToolCall completed;
    completed.call.id = call_id;
    completed.call.name = std::move(node.mapped().name);
    completed.call.arguments = std::move(node.mapped().buffer);

    auto repaired = repair_(completed.call.arguments);
    if (core::errors::is_error(repaired)) {
        completed.decode_error = core::errors::get_error(repaired);
        CHATFLOW_LOG_WARN("StreamDecoder: call " + call_id +
                          " arguments unrepairable: " + completed.decode_error->message);
    } else {
        completed.call.args = core::errors::take_value(repaired);
    }

    completed_.push_back(completed);
    CHATFLOW_LOG_DEBUG("StreamDecoder: call " + call_id + " completed");
    return completed;
}

FlowError StreamDecoder::fail(const std::string& message, const std::string& code,
                              const ErrorCategory category) {
    transition(DecoderState::Errored);
    CHATFLOW_LOG_ERROR("StreamDecoder: " + message);
    return FlowError{category, message, code};
}

void StreamDecoder::transition(const DecoderState next) {
    CHATFLOW_LOG_DEBUG("StreamDecoder: " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

}  // namespace chatflow::stream
