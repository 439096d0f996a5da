#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/config/generate_config.hpp"
#include "core/errors/flow_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"

namespace chatflow::session {

class SessionLease;

// One conversation: transcript, usage counters, provider cursor.
//
// Reads are always allowed and return snapshots. Writes go through a
// SessionLease, of which at most one exists at a time. A stream holds the
// lease from creation until it is drained, cancelled or destroyed.
//
// The Session must outlive every lease taken on it.
class Session {
public:
    explicit Session(std::string id = "");
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }

    // Blocks until the lease is free.
    SessionLease acquire();

    // Fails with "session_busy" instead of waiting.
    core::errors::Result<SessionLease> try_acquire();

    bool is_leased() const;

    std::vector<protocol::Message> transcript() const;
    std::size_t message_count() const;
    protocol::UsageTotals usage() const;
    double cost() const;
    std::optional<std::string> cursor() const;

    // Tool calls from the transcript that have no tool-role answer yet.
    std::vector<protocol::ToolCall> pending_tool_calls() const;

private:
    friend class SessionLease;

    void release_lease();

    std::string id_;

    mutable std::mutex lease_mutex_;
    std::condition_variable lease_released_;
    bool leased_ = false;

    mutable std::mutex state_mutex_;
    std::vector<protocol::Message> transcript_;
    protocol::UsageTotals usage_;
    double cost_ = 0.0;
    std::optional<std::string> cursor_;
};

// Exclusive, movable write access to a Session.
class SessionLease {
public:
    SessionLease() = default;
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    ~SessionLease();

    bool valid() const { return session_ != nullptr; }
    explicit operator bool() const { return valid(); }

    // Read access for the holder; fails the same way writes do once released.
    core::errors::Result<const Session*> session() const;

    core::errors::Status append(protocol::Message message);

    // Adds one request's usage. Counters only ever grow; cost is
    // accumulated when the model has known pricing.
    core::errors::Result<protocol::UsageChangedUpdate> add_usage(
        const protocol::UsageDelta& delta,
        const std::optional<core::config::ModelPricing>& pricing);

    core::errors::Status set_cursor(std::string cursor);

    // Answers a pending client tool call out of band.
    core::errors::Status submit_tool_result(const protocol::ToolResult& result);

    void release();

private:
    friend class Session;
    explicit SessionLease(Session* session) : session_(session) {}

    core::errors::Status check_valid() const;

    Session* session_ = nullptr;
};

}  // namespace chatflow::session
