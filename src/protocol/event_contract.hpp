#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "tool_contract.hpp"

namespace chatflow::protocol {

    // Token counts as reported by the provider for one request.
    // input_tokens includes cached_input_tokens.
    struct UsageDelta {
        std::uint64_t input_tokens = 0;
        std::uint64_t cached_input_tokens = 0;
        std::uint64_t output_tokens = 0;
    };

    // ---- Raw provider events, in provider order ----

    struct TextDelta { std::string text; };
    struct ToolCallStarted { std::string call_id; std::string name; };
    struct ToolCallArgumentsDelta { std::string call_id; std::string delta; };
    struct ToolCallCompleted { std::string call_id; };
    struct TurnCompleted { std::optional<std::string> response_id; };
    struct UsageUpdate { UsageDelta usage; };
    struct ProviderError { std::string message; std::string code; };

    using StreamEvent = std::variant<
        TextDelta,
        ToolCallStarted,
        ToolCallArgumentsDelta,
        ToolCallCompleted,
        TurnCompleted,
        UsageUpdate,
        ProviderError
    >;

    // ---- Session updates handed to the caller ----

    struct AssistantTextUpdate { std::string delta; };

    // A completed call. Client tools are surfaced here and left for the
    // caller to answer.
    struct ToolCallUpdate { ToolCall call; bool client_tool = false; };

    struct ToolResultUpdate { ToolResult result; };

    // Running totals; input_tokens excludes the cached ones.
    struct UsageTotals {
        std::uint64_t input_tokens = 0;
        std::uint64_t cached_input_tokens = 0;
        std::uint64_t output_tokens = 0;
    };

    struct UsageChangedUpdate { UsageTotals totals; double cost = 0.0; };

    struct TurnFinishedUpdate {
        std::uint32_t round = 0;
        std::size_t pending_client_calls = 0;
    };

    using SessionUpdate = std::variant<
        AssistantTextUpdate,
        ToolCallUpdate,
        ToolResultUpdate,
        UsageChangedUpdate,
        TurnFinishedUpdate
    >;

} // namespace chatflow::protocol
