#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include "app/cli_parser.hpp"
#include "app/demo_tools.hpp"
#include "core/config/generate_config.hpp"
#include "core/errors/flow_errors.hpp"
#include "core/logging/logger.hpp"
#include "provider/replay_transport.hpp"
#include "runtime/response_stream.hpp"
#include "session/session.hpp"
#include "tools/tool_registry.hpp"

namespace {

    using namespace chatflow;

    void print_update(const protocol::SessionUpdate& update) {
        std::visit([](const auto& u) {
            using T = std::decay_t<decltype(u)>;
            if constexpr (std::is_same_v<T, protocol::AssistantTextUpdate>) {
                std::cout << u.delta << std::flush;
            } else if constexpr (std::is_same_v<T, protocol::ToolCallUpdate>) {
                std::cout << "\n[tool call] " << u.call.name << " " << u.call.args.dump()
                          << " (" << u.call.id << (u.client_tool ? ", client" : "") << ")\n";
            } else if constexpr (std::is_same_v<T, protocol::ToolResultUpdate>) {
                std::cout << "[tool result] " << u.result.name << " -> "
                          << protocol::to_payload(u.result).dump() << "\n";
            } else if constexpr (std::is_same_v<T, protocol::UsageChangedUpdate>) {
                std::cout << "[usage] in=" << u.totals.input_tokens
                          << " cached=" << u.totals.cached_input_tokens
                          << " out=" << u.totals.output_tokens << " cost=$" << u.cost << "\n";
            } else if constexpr (std::is_same_v<T, protocol::TurnFinishedUpdate>) {
                std::cout << "\n[turn " << u.round << " finished, "
                          << u.pending_client_calls << " client call(s) pending]\n";
            }
        }, update);
    }

    // ask_user is answered from stdin, one line per question.
    core::errors::Status answer_client_calls(session::Session& conversation) {
        auto lease = conversation.try_acquire();
        if (core::errors::is_error(lease)) {
            return core::errors::get_error(lease);
        }
        auto& held = std::get<session::SessionLease>(lease);
        for (const auto& call : conversation.pending_tool_calls()) {
            const std::string question = call.args.is_object()
                ? call.args.value("question", std::string("?"))
                : std::string("?");
            std::cout << "[ask_user] " << question << "\n> " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer)) {
                answer.clear();
            }
            protocol::ToolResult result;
            result.tool_call_id = call.id;
            result.name = call.name;
            result.success = true;
            result.value = nlohmann::json{{"answer", answer}};
            auto submitted = held.submit_tool_result(result);
            if (core::errors::is_error(submitted)) {
                return submitted;
            }
        }
        return core::errors::ok();
    }

    void log_failure(const std::string& what, const core::errors::FlowError& err) {
        CHATFLOW_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CHATFLOW_LOG_INFO("Hint: " + err.hint);
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = chatflow::app::cli::parse_and_validate(argc, argv);
    if (chatflow::core::errors::is_error(parsed)) {
        log_failure("Input error", chatflow::core::errors::get_error(parsed));
        return 2;
    }
    const auto& req = chatflow::core::errors::get_value(parsed);
    if (req.verbose) {
        chatflow::core::logging::Logger::get().set_min_level(chatflow::core::logging::LogLevel::DEBUG);
    }

    // 2. Resolve generation settings
    chatflow::core::config::GenerateConfig config;
    if (req.config_file) {
        auto loaded = chatflow::core::config::load_generate_config(req.config_file.value());
        if (chatflow::core::errors::is_error(loaded)) {
            log_failure("Config error", chatflow::core::errors::get_error(loaded));
            return 2;
        }
        config = chatflow::core::errors::get_value(loaded);
    }
    if (req.model) config.model = req.model.value();
    if (req.max_tool_rounds) config.max_tool_rounds = req.max_tool_rounds.value();

    // 3. Tools, session and provider
    chatflow::tools::ToolRegistry registry;
    auto registered = chatflow::app::register_demo_tools(registry);
    if (chatflow::core::errors::is_error(registered)) {
        log_failure("Tool registration failed", chatflow::core::errors::get_error(registered));
        return 3;
    }

    auto transport = chatflow::provider::ReplayTransport::from_file(req.sse_file.string());
    if (chatflow::core::errors::is_error(transport)) {
        log_failure("Cannot load recording", chatflow::core::errors::get_error(transport));
        return 2;
    }
    auto& replay = *chatflow::core::errors::get_value(transport);

    chatflow::session::Session session;
    chatflow::core::logging::Logger::get().set_session_id(session.id());
    {
        auto lease = session.acquire();
        auto appended = lease.append(chatflow::protocol::make_text_message(
            chatflow::protocol::Role::User, req.prompt));
        if (chatflow::core::errors::is_error(appended)) {
            log_failure("Cannot seed session", chatflow::core::errors::get_error(appended));
            return 3;
        }
    }
    CHATFLOW_LOG_INFO("Replaying " + std::to_string(replay.turn_count()) + " recorded response(s) from " +
                      req.sse_file.string());

    // 4. Stream until the recording has no response left for us
    while (replay.requests_served() < replay.turn_count()) {
        auto started = chatflow::runtime::responses_stream(session, registry, replay, config);
        if (chatflow::core::errors::is_error(started)) {
            log_failure("Cannot start stream", chatflow::core::errors::get_error(started));
            return 3;
        }
        auto& stream = std::get<chatflow::runtime::ResponseStream>(started);

        while (true) {
            auto next = stream.next();
            if (chatflow::core::errors::is_error(next)) {
                log_failure("Stream failed", chatflow::core::errors::get_error(next));
                return 1;
            }
            const auto& update = chatflow::core::errors::get_value(next);
            if (!update.has_value()) {
                break;
            }
            print_update(update.value());
        }

        if (session.pending_tool_calls().empty()) {
            break;
        }
        auto answered = answer_client_calls(session);
        if (chatflow::core::errors::is_error(answered)) {
            log_failure("Cannot answer client tool", chatflow::core::errors::get_error(answered));
            return 3;
        }
    }

    const auto usage = session.usage();
    std::cout << "\nTotal usage: input=" << usage.input_tokens
              << " cached=" << usage.cached_input_tokens
              << " output=" << usage.output_tokens
              << " cost=$" << session.cost() << "\n";
    CHATFLOW_LOG_INFO("Transcript has " + std::to_string(session.message_count()) + " message(s)");
    return 0;
}
