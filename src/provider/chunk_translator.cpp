#include "provider/chunk_translator.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace chatflow::provider {

using core::errors::ErrorCategory;
using core::errors::FlowError;
using nlohmann::json;

namespace {

std::uint64_t count_at(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer() || it->get<std::int64_t>() < 0) {
        return 0;
    }
    return it->get<std::uint64_t>();
}

std::string string_at(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

core::errors::Result<std::vector<protocol::StreamEvent>> ChunkTranslator::translate(
    const std::string& data) {
    std::vector<protocol::StreamEvent> events;

    if (done_) {
        return FlowError{ErrorCategory::Protocol, "Chunk received after [DONE].",
                         "chunk_after_done"};
    }
    if (data == "[DONE]") {
        complete_open_calls(events);
        events.emplace_back(protocol::TurnCompleted{response_id_});
        done_ = true;
        return events;
    }

    json chunk = json::parse(data, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object()) {
        return FlowError{ErrorCategory::Protocol, "Unparseable stream chunk: " + data,
                         "invalid_chunk"};
    }

    auto error = chunk.find("error");
    if (error != chunk.end() && error->is_object()) {
        events.emplace_back(protocol::ProviderError{
            string_at(*error, "message"),
            error->contains("code") && (*error)["code"].is_string()
                ? (*error)["code"].get<std::string>()
                : string_at(*error, "type")});
        return events;
    }

    if (!response_id_.has_value()) {
        std::string id = string_at(chunk, "id");
        if (!id.empty()) {
            response_id_ = std::move(id);
        }
    }

    auto choices = chunk.find("choices");
    if (choices != chunk.end() && choices->is_array() && !choices->empty()) {
        const json& choice = choices->front();
        auto delta = choice.find("delta");
        if (delta != choice.end() && delta->is_object()) {
            std::string text = string_at(*delta, "content");
            if (!text.empty()) {
                events.emplace_back(protocol::TextDelta{std::move(text)});
            }
            std::string refusal = string_at(*delta, "refusal");
            if (!refusal.empty()) {
                events.emplace_back(protocol::TextDelta{std::move(refusal)});
            }

            auto tool_calls = delta->find("tool_calls");
            if (tool_calls != delta->end() && tool_calls->is_array()) {
                for (const auto& fragment : *tool_calls) {
                    if (!fragment.is_object()) {
                        return FlowError{ErrorCategory::Protocol,
                                         "Tool call fragment is not an object: " + fragment.dump(),
                                         "invalid_chunk"};
                    }
                    auto index = fragment.find("index");
                    if (index == fragment.end() || !index->is_number_integer()) {
                        return FlowError{ErrorCategory::Protocol,
                                         "Tool call fragment without index: " + fragment.dump(),
                                         "invalid_chunk"};
                    }
                    const long long key = index->get<long long>();
                    json function = fragment.value("function", json::object());
                    if (!function.is_object()) {
                        function = json::object();
                    }

                    auto open = calls_.find(key);
                    if (open == calls_.end()) {
                        std::string call_id = string_at(fragment, "id");
                        if (call_id.empty()) {
                            call_id = core::config::generate_call_id();
                            CHATFLOW_LOG_DEBUG("Synthesised id " + call_id +
                                               " for tool call index " + std::to_string(key));
                        }
                        open = calls_.emplace(key, OpenCall{call_id, false}).first;
                        events.emplace_back(protocol::ToolCallStarted{
                            call_id, string_at(function, "name")});
                    }

                    std::string arguments = string_at(function, "arguments");
                    if (!arguments.empty()) {
                        events.emplace_back(protocol::ToolCallArgumentsDelta{
                            open->second.call_id, std::move(arguments)});
                    }
                }
            }
        }

        auto finish = choice.find("finish_reason");
        if (finish != choice.end() && finish->is_string()) {
            complete_open_calls(events);
        }
    }

    auto usage = chunk.find("usage");
    if (usage != chunk.end() && usage->is_object()) {
        protocol::UsageDelta delta;
        delta.input_tokens = count_at(*usage, "prompt_tokens");
        delta.output_tokens = count_at(*usage, "completion_tokens");
        auto details = usage->find("prompt_tokens_details");
        if (details != usage->end() && details->is_object()) {
            delta.cached_input_tokens = count_at(*details, "cached_tokens");
        }
        events.emplace_back(protocol::UsageUpdate{delta});
    }

    return events;
}

void ChunkTranslator::complete_open_calls(std::vector<protocol::StreamEvent>& events) {
    for (auto& entry : calls_) {
        if (!entry.second.completed) {
            entry.second.completed = true;
            events.emplace_back(protocol::ToolCallCompleted{entry.second.call_id});
        }
    }
}

}  // namespace chatflow::provider
