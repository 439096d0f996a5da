#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <variant>
#include "protocol/tool_contract.hpp"
#include "stream/stream_decoder.hpp"
#include "tools/tool_registry.hpp"

namespace chatflow::tools {

// Outcome known without running anything: unknown tool, unrepairable
// arguments. Fed back to the model like any other result.
struct ImmediateResult {
    protocol::ToolResult result;
};

// Client tool: the caller supplies the result before the next request.
struct PendingClientCall {
    protocol::ToolCall call;
};

// Executor running on its own task.
struct RunningExecution {
    std::future<protocol::ToolResult> result;
};

using DispatchOutcome = std::variant<ImmediateResult, PendingClientCall, RunningExecution>;

class ToolDispatcher {
public:
    explicit ToolDispatcher(const ToolRegistry& registry,
                            std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Never blocks: executions are started and handed back as futures.
    DispatchOutcome dispatch(const stream::CompletedToolCall& completed) const;

    // Resolves and runs one call on the calling thread.
    protocol::ToolResult execute(const stream::CompletedToolCall& completed) const;

    const std::shared_ptr<std::atomic_bool>& cancel_token() const { return cancel_token_; }

private:
    static protocol::ToolResult run(const std::shared_ptr<const ToolSpec>& spec,
                                    const protocol::ToolCall& call,
                                    const std::shared_ptr<std::atomic_bool>& cancel_token);

    const ToolRegistry& registry_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace chatflow::tools
