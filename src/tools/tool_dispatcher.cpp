#include "tools/tool_dispatcher.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace chatflow::tools {

using protocol::ToolCall;
using protocol::ToolResult;

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry,
                               std::shared_ptr<std::atomic_bool> cancel_token)
    : registry_(registry),
      cancel_token_(cancel_token ? std::move(cancel_token)
                                 : std::make_shared<std::atomic_bool>(false)) {}

DispatchOutcome ToolDispatcher::dispatch(const stream::CompletedToolCall& completed) const {
    const ToolCall& call = completed.call;

    auto lookup = registry_.get(call.name);
    if (core::errors::is_error(lookup)) {
        CHATFLOW_LOG_WARN("ToolDispatcher: " + core::errors::get_error(lookup).message);
        return ImmediateResult{protocol::make_failure(
            call.id, call.name, core::errors::get_error(lookup).message)};
    }
    if (completed.decode_error.has_value()) {
        return ImmediateResult{protocol::make_failure(
            call.id, call.name, completed.decode_error->message)};
    }

    const auto spec = core::errors::get_value(lookup);
    if (spec->is_client_tool()) {
        CHATFLOW_LOG_INFO("ToolDispatcher: call " + call.id + " (" + call.name +
                          ") deferred to client");
        return PendingClientCall{call};
    }

    CHATFLOW_LOG_DEBUG("ToolDispatcher: starting call " + call.id + " (" + call.name + ")");
    auto future = std::async(std::launch::async, &ToolDispatcher::run, spec, call,
                             cancel_token_);
    return RunningExecution{std::move(future)};
}

ToolResult ToolDispatcher::execute(const stream::CompletedToolCall& completed) const {
    const ToolCall& call = completed.call;

    auto lookup = registry_.get(call.name);
    if (core::errors::is_error(lookup)) {
        return protocol::make_failure(call.id, call.name,
                                      core::errors::get_error(lookup).message);
    }
    if (completed.decode_error.has_value()) {
        return protocol::make_failure(call.id, call.name, completed.decode_error->message);
    }
    const auto spec = core::errors::get_value(lookup);
    if (spec->is_client_tool()) {
        return protocol::make_failure(call.id, call.name,
                                      "Client tool '" + call.name +
                                          "' must be answered by the application.");
    }
    return run(spec, call, cancel_token_);
}

ToolResult ToolDispatcher::run(const std::shared_ptr<const ToolSpec>& spec,
                               const ToolCall& call,
                               const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        return protocol::make_failure(call.id, call.name, "Tool call cancelled.");
    }

    const auto started = std::chrono::steady_clock::now();
    const ToolInvocation invocation = spec->make_invocation(call, cancel_token);
    auto outcome = spec->execute(invocation);
    const double duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    ToolResult result;
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        CHATFLOW_LOG_WARN("ToolDispatcher: call " + call.id + " (" + call.name +
                          ") failed [" + error.code + "]: " + error.message);
        result = protocol::make_failure(call.id, call.name, error.message);
    } else {
        result.tool_call_id = call.id;
        result.name = call.name;
        result.success = true;
        result.value = core::errors::get_value(outcome);
    }
    result.duration_ms = duration_ms;
    return result;
}

}  // namespace chatflow::tools
