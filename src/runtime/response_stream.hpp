#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include "core/config/generate_config.hpp"
#include "core/errors/flow_errors.hpp"
#include "protocol/event_contract.hpp"
#include "provider/transport.hpp"
#include "session/session.hpp"
#include "tools/json_repair.hpp"
#include "tools/tool_registry.hpp"

namespace chatflow::runtime {

class ResponseStream;

// Takes the session lease without waiting; fails with "session_busy" when
// another stream holds it.
core::errors::Result<ResponseStream> responses_stream(
    session::Session& session, const tools::ToolRegistry& tools,
    provider::Transport& transport, core::config::GenerateConfig config = {});

// Same, with a lease the caller already holds.
core::errors::Result<ResponseStream> responses_stream(
    session::SessionLease lease, const tools::ToolRegistry& tools,
    provider::Transport& transport, core::config::GenerateConfig config = {},
    tools::JsonRepairFn repair = tools::repair_json);

// Lazy, single-pass sequence of session updates for one user request.
//
// Owns the session lease for its whole life. The lease is released when
// next() reports the end of the stream, when a fatal error is returned,
// on cancel(), or on destruction. The registry and transport must outlive
// the stream.
class ResponseStream {
public:
    ResponseStream(ResponseStream&&) noexcept;
    ResponseStream& operator=(ResponseStream&&) noexcept;
    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;
    ~ResponseStream();

    // Next update, an empty optional once drained, or a fatal
    // protocol/provider error. After either of the latter, keeps
    // returning an empty optional.
    core::errors::Result<std::optional<protocol::SessionUpdate>> next();

    // Stops outstanding executions and the provider source. Updates not
    // yet pulled are dropped.
    void cancel();

    bool finished() const;
    std::uint32_t round() const;

private:
    struct State;
    explicit ResponseStream(std::unique_ptr<State> state);

    friend core::errors::Result<ResponseStream> responses_stream(
        session::SessionLease lease, const tools::ToolRegistry& tools,
        provider::Transport& transport, core::config::GenerateConfig config,
        tools::JsonRepairFn repair);

    std::unique_ptr<State> state_;
};

}  // namespace chatflow::runtime
