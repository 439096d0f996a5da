#include "runtime/response_stream.hpp"

#include <atomic>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "provider/request_builder.hpp"
#include "stream/stream_decoder.hpp"
#include "tools/tool_dispatcher.hpp"

namespace chatflow::runtime {

using core::errors::ErrorCategory;
using core::errors::FlowError;
using core::errors::get_error;
using core::errors::is_error;
using protocol::SessionUpdate;

namespace {

enum class Phase {
    Requesting,  // next provider request not opened yet
    Streaming,   // pulling provider events
    Collecting,  // appending tool results in completion order
    Finished
};

struct InFlight {
    std::string call_id;
    std::string name;
    tools::DispatchOutcome outcome;
};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

struct ResponseStream::State {
    State(session::SessionLease lease_in, const tools::ToolRegistry& tools_in,
          provider::Transport& transport_in, core::config::GenerateConfig config_in,
          tools::JsonRepairFn repair_in)
        : lease(std::move(lease_in)),
          tools(tools_in),
          transport(transport_in),
          config(std::move(config_in)),
          repair(std::move(repair_in)),
          pricing(core::config::pricing_for(config.model)),
          cancel_token(std::make_shared<std::atomic_bool>(false)),
          dispatcher(tools_in, cancel_token) {}

    session::SessionLease lease;
    std::string session_id;
    const tools::ToolRegistry& tools;
    provider::Transport& transport;
    core::config::GenerateConfig config;
    tools::JsonRepairFn repair;
    std::optional<core::config::ModelPricing> pricing;
    std::shared_ptr<std::atomic_bool> cancel_token;
    tools::ToolDispatcher dispatcher;

    Phase phase = Phase::Requesting;
    std::uint32_t round = 0;
    std::unique_ptr<provider::EventSource> source;
    std::unique_ptr<stream::StreamDecoder> decoder;
    std::deque<SessionUpdate> ready;
    std::deque<InFlight> in_flight;
    std::size_t round_calls = 0;
    std::size_t client_calls = 0;

    core::errors::Status open_round();
    core::errors::Status pull_event();
    core::errors::Status on_item(stream::DecodedItem item);
    core::errors::Status end_turn(stream::DecodedTurnEnd turn_end);
    core::errors::Status collect_one();
    void finish_round();
    FlowError fail(FlowError error);
    void stop();
};

core::errors::Status ResponseStream::State::open_round() {
    auto session = lease.session();
    if (is_error(session)) {
        return get_error(session);
    }
    const session::Session* current = core::errors::get_value(session);

    auto request = provider::build_chat_request(current->transcript(), tools, config,
                                                current->cursor());
    if (is_error(request)) {
        return get_error(request);
    }

    ++round;
    round_calls = 0;
    client_calls = 0;
    CHATFLOW_LOG_INFO("Session " + current->id() + ": opening provider request, round " +
                      std::to_string(round));

    auto opened = transport.open(core::errors::get_value(request));
    if (is_error(opened)) {
        return get_error(opened);
    }
    source = core::errors::take_value(opened);
    decoder = std::make_unique<stream::StreamDecoder>(repair);
    phase = Phase::Streaming;
    return core::errors::ok();
}

core::errors::Status ResponseStream::State::pull_event() {
    auto event = source->next();
    if (is_error(event)) {
        return get_error(event);
    }
    const auto& maybe_event = core::errors::get_value(event);
    if (!maybe_event.has_value()) {
        return FlowError{ErrorCategory::Protocol,
                         "Provider stream ended before the turn completed.",
                         "stream_ended_early"};
    }

    auto items = decoder->feed(maybe_event.value());
    if (is_error(items)) {
        return get_error(items);
    }
    for (auto& item : core::errors::take_value(items)) {
        auto status = on_item(std::move(item));
        if (is_error(status)) {
            return status;
        }
        if (phase != Phase::Streaming) {
            break;
        }
    }
    return core::errors::ok();
}

core::errors::Status ResponseStream::State::on_item(stream::DecodedItem item) {
    return std::visit(
        overloaded{
            [this](stream::DecodedText& text) -> core::errors::Status {
                ready.emplace_back(protocol::AssistantTextUpdate{std::move(text.delta)});
                return core::errors::ok();
            },
            [this](stream::DecodedToolCall& decoded) -> core::errors::Status {
                const auto& call = decoded.completed.call;
                tools::DispatchOutcome outcome = dispatcher.dispatch(decoded.completed);
                const bool client = std::holds_alternative<tools::PendingClientCall>(outcome);
                ++round_calls;
                if (client) {
                    ++client_calls;
                }
                ready.emplace_back(protocol::ToolCallUpdate{call, client});
                in_flight.push_back(InFlight{call.id, call.name, std::move(outcome)});
                return core::errors::ok();
            },
            [this](stream::DecodedUsage& usage) -> core::errors::Status {
                auto changed = lease.add_usage(usage.usage, pricing);
                if (is_error(changed)) {
                    return get_error(changed);
                }
                ready.emplace_back(core::errors::take_value(changed));
                return core::errors::ok();
            },
            [this](stream::DecodedTurnEnd& turn_end) -> core::errors::Status {
                return end_turn(std::move(turn_end));
            }},
        item);
}

core::errors::Status ResponseStream::State::end_turn(stream::DecodedTurnEnd turn_end) {
    // The provider must close the stream once the turn is complete. Checked
    // before anything is appended so a violation leaves the turn unrecorded.
    auto trailing = source->next();
    if (is_error(trailing)) {
        return get_error(trailing);
    }
    const auto& trailing_event = core::errors::get_value(trailing);
    if (trailing_event.has_value()) {
        auto rejected = decoder->feed(trailing_event.value());
        if (is_error(rejected)) {
            return get_error(rejected);
        }
        return FlowError{ErrorCategory::Internal, "Decoder accepted an event after turn end.",
                         "event_after_done"};
    }
    source.reset();

    if (!turn_end.assistant_text.empty()) {
        auto status = lease.append(protocol::make_text_message(
            protocol::Role::Assistant, std::move(turn_end.assistant_text)));
        if (is_error(status)) {
            return status;
        }
    }
    if (!turn_end.tool_calls.empty()) {
        std::vector<protocol::ToolCall> calls;
        calls.reserve(turn_end.tool_calls.size());
        for (auto& completed : turn_end.tool_calls) {
            calls.push_back(std::move(completed.call));
        }
        auto status = lease.append(protocol::make_tool_call_record(std::move(calls)));
        if (is_error(status)) {
            return status;
        }
    }
    if (turn_end.response_id.has_value()) {
        auto status = lease.set_cursor(std::move(turn_end.response_id.value()));
        if (is_error(status)) {
            return status;
        }
    }

    phase = Phase::Collecting;
    return core::errors::ok();
}

core::errors::Status ResponseStream::State::collect_one() {
    InFlight entry = std::move(in_flight.front());
    in_flight.pop_front();

    std::optional<protocol::ToolResult> result = std::visit(
        overloaded{
            [](tools::ImmediateResult& immediate) -> std::optional<protocol::ToolResult> {
                return std::move(immediate.result);
            },
            [](tools::PendingClientCall&) -> std::optional<protocol::ToolResult> {
                return std::nullopt;
            },
            [](tools::RunningExecution& running) -> std::optional<protocol::ToolResult> {
                return running.result.get();
            }},
        entry.outcome);

    if (!result.has_value()) {
        return core::errors::ok();
    }
    auto status = lease.append(protocol::make_tool_result_message(result.value()));
    if (is_error(status)) {
        return status;
    }
    ready.emplace_back(protocol::ToolResultUpdate{std::move(result.value())});
    return core::errors::ok();
}

void ResponseStream::State::finish_round() {
    ready.emplace_back(protocol::TurnFinishedUpdate{round, client_calls});

    if (round_calls == 0) {
        CHATFLOW_LOG_INFO("Session " + session_id + ": turn " + std::to_string(round) +
                          " finished without tool calls");
        phase = Phase::Finished;
    } else if (client_calls > 0) {
        CHATFLOW_LOG_INFO("Session " + session_id + ": turn " + std::to_string(round) + " left " +
                          std::to_string(client_calls) + " client tool call(s) pending");
        phase = Phase::Finished;
    } else if (round >= config.max_tool_rounds) {
        CHATFLOW_LOG_WARN("Session " + session_id + ": stopping after " + std::to_string(round) +
                          " tool rounds (max_tool_rounds reached)");
        phase = Phase::Finished;
    } else {
        phase = Phase::Requesting;
    }
}

FlowError ResponseStream::State::fail(FlowError error) {
    CHATFLOW_LOG_ERROR("Session " + session_id + ": stream failed in round " +
                       std::to_string(round) + ": [" + error.code + "] " + error.message);
    stop();
    return error;
}

void ResponseStream::State::stop() {
    cancel_token->store(true);
    if (source) {
        source->cancel();
        source.reset();
    }
    // The tool-call record is already in the transcript while collecting;
    // every server call in it gets an answer so the session can stream again.
    if (phase == Phase::Collecting && lease.valid()) {
        for (auto& entry : in_flight) {
            std::optional<protocol::ToolResult> result = std::visit(
                overloaded{
                    [](tools::ImmediateResult& immediate) -> std::optional<protocol::ToolResult> {
                        return std::move(immediate.result);
                    },
                    [](tools::PendingClientCall&) -> std::optional<protocol::ToolResult> {
                        return std::nullopt;
                    },
                    [&entry](tools::RunningExecution&) -> std::optional<protocol::ToolResult> {
                        return protocol::make_failure(entry.call_id, entry.name,
                                                      "Tool call cancelled.");
                    }},
                entry.outcome);
            if (!result.has_value()) {
                continue;
            }
            auto status = lease.append(protocol::make_tool_result_message(result.value()));
            if (is_error(status)) {
                CHATFLOW_LOG_ERROR("Session " + session_id + ": cannot record call " +
                                   entry.call_id + ": " + get_error(status).message);
            }
        }
    }
    // Futures from std::async wait for their execution when destroyed;
    // executors taking a Cancellation see the token and return early.
    in_flight.clear();
    ready.clear();
    phase = Phase::Finished;
    lease.release();
}

ResponseStream::ResponseStream(std::unique_ptr<State> state) : state_(std::move(state)) {}

ResponseStream::ResponseStream(ResponseStream&&) noexcept = default;

ResponseStream& ResponseStream::operator=(ResponseStream&& other) noexcept {
    if (this != &other) {
        cancel();
        state_ = std::move(other.state_);
    }
    return *this;
}

ResponseStream::~ResponseStream() {
    cancel();
}

core::errors::Result<std::optional<SessionUpdate>> ResponseStream::next() {
    if (!state_) {
        return std::optional<SessionUpdate>{};
    }
    State& state = *state_;

    while (true) {
        if (!state.ready.empty()) {
            SessionUpdate update = std::move(state.ready.front());
            state.ready.pop_front();
            return std::optional<SessionUpdate>{std::move(update)};
        }

        core::errors::Status status = core::errors::ok();
        switch (state.phase) {
            case Phase::Finished:
                if (state.lease.valid()) {
                    CHATFLOW_LOG_DEBUG("Session " + state.session_id + ": stream drained after " +
                                       std::to_string(state.round) + " round(s)");
                    state.lease.release();
                }
                return std::optional<SessionUpdate>{};
            case Phase::Requesting:
                status = state.open_round();
                break;
            case Phase::Streaming:
                status = state.pull_event();
                break;
            case Phase::Collecting:
                if (state.in_flight.empty()) {
                    state.finish_round();
                } else {
                    status = state.collect_one();
                }
                break;
        }
        if (is_error(status)) {
            return state.fail(get_error(status));
        }
    }
}

void ResponseStream::cancel() {
    if (!state_ || (state_->phase == Phase::Finished && !state_->lease.valid())) {
        return;
    }
    CHATFLOW_LOG_INFO("Session " + state_->session_id + ": stream cancelled in round " +
                      std::to_string(state_->round));
    state_->stop();
}

bool ResponseStream::finished() const {
    return !state_ || (state_->phase == Phase::Finished && state_->ready.empty());
}

std::uint32_t ResponseStream::round() const {
    return state_ ? state_->round : 0;
}

core::errors::Result<ResponseStream> responses_stream(
    session::Session& session, const tools::ToolRegistry& tools,
    provider::Transport& transport, core::config::GenerateConfig config) {
    auto lease = session.try_acquire();
    if (is_error(lease)) {
        return get_error(lease);
    }
    return responses_stream(core::errors::take_value(lease), tools, transport,
                            std::move(config));
}

core::errors::Result<ResponseStream> responses_stream(
    session::SessionLease lease, const tools::ToolRegistry& tools,
    provider::Transport& transport, core::config::GenerateConfig config,
    tools::JsonRepairFn repair) {
    auto session = lease.session();
    if (is_error(session)) {
        return get_error(session);
    }
    const session::Session* current = core::errors::get_value(session);

    const auto pending = current->pending_tool_calls();
    if (!pending.empty()) {
        return FlowError{ErrorCategory::Input,
                         "Session " + current->id() + " has " +
                             std::to_string(pending.size()) + " unanswered tool call(s).",
                         "unresolved_client_tool_calls",
                         "Answer them with SessionLease::submit_tool_result first."};
    }
    if (config.max_tool_rounds == 0) {
        return FlowError{ErrorCategory::Input, "max_tool_rounds must be at least 1.",
                         "invalid_config"};
    }
    if (!core::config::pricing_for(config.model).has_value()) {
        CHATFLOW_LOG_WARN("No pricing for model " + config.model +
                          "; usage will be counted without cost");
    }

    auto state = std::make_unique<ResponseStream::State>(
        std::move(lease), tools, transport, std::move(config), std::move(repair));
    state->session_id = current->id();
    return ResponseStream(std::move(state));
}

}  // namespace chatflow::runtime
