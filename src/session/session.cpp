#include "session/session.hpp"

#include <unordered_set>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace chatflow::session {

using core::errors::ErrorCategory;
using core::errors::FlowError;

Session::Session(std::string id)
    : id_(id.empty() ? core::config::generate_session_id() : std::move(id)) {}

SessionLease Session::acquire() {
    std::unique_lock<std::mutex> lock(lease_mutex_);
    lease_released_.wait(lock, [this] { return !leased_; });
    leased_ = true;
    CHATFLOW_LOG_DEBUG("Session " + id_ + ": lease acquired");
    return SessionLease(this);
}

core::errors::Result<SessionLease> Session::try_acquire() {
    std::lock_guard<std::mutex> lock(lease_mutex_);
    if (leased_) {
        return FlowError{ErrorCategory::Input,
                         "Session " + id_ + " is already leased.", "session_busy",
                         "Drain, cancel or destroy the active stream first."};
    }
    leased_ = true;
    CHATFLOW_LOG_DEBUG("Session " + id_ + ": lease acquired");
    return SessionLease(this);
}

bool Session::is_leased() const {
    std::lock_guard<std::mutex> lock(lease_mutex_);
    return leased_;
}

void Session::release_lease() {
    {
        std::lock_guard<std::mutex> lock(lease_mutex_);
        leased_ = false;
    }
    lease_released_.notify_one();
    CHATFLOW_LOG_DEBUG("Session " + id_ + ": lease released");
}

std::vector<protocol::Message> Session::transcript() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transcript_;
}

std::size_t Session::message_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transcript_.size();
}

protocol::UsageTotals Session::usage() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return usage_;
}

double Session::cost() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cost_;
}

std::optional<std::string> Session::cursor() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cursor_;
}

std::vector<protocol::ToolCall> Session::pending_tool_calls() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::unordered_set<std::string> answered;
    for (const auto& message : transcript_) {
        if (message.role == protocol::Role::Tool && message.tool_call_id.has_value()) {
            answered.insert(message.tool_call_id.value());
        }
    }

    std::vector<protocol::ToolCall> pending;
    for (const auto& message : transcript_) {
        for (const auto& call : message.tool_calls) {
            if (answered.count(call.id) == 0) {
                pending.push_back(call);
            }
        }
    }
    return pending;
}

SessionLease::SessionLease(SessionLease&& other) noexcept : session_(other.session_) {
    other.session_ = nullptr;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        session_ = other.session_;
        other.session_ = nullptr;
    }
    return *this;
}

SessionLease::~SessionLease() {
    release();
}

void SessionLease::release() {
    if (session_ != nullptr) {
        Session* session = session_;
        session_ = nullptr;
        session->release_lease();
    }
}

core::errors::Status SessionLease::check_valid() const {
    if (session_ == nullptr) {
        return FlowError{ErrorCategory::Input, "Session lease was released.",
                         "lease_released"};
    }
    return core::errors::ok();
}

core::errors::Result<const Session*> SessionLease::session() const {
    auto valid = check_valid();
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    return static_cast<const Session*>(session_);
}

core::errors::Status SessionLease::append(protocol::Message message) {
    auto valid = check_valid();
    if (core::errors::is_error(valid)) {
        return valid;
    }
    if (message.id.empty()) {
        message.id = core::config::generate_message_id();
    }
    std::lock_guard<std::mutex> lock(session_->state_mutex_);
    session_->transcript_.push_back(std::move(message));
    return core::errors::ok();
}

core::errors::Result<protocol::UsageChangedUpdate> SessionLease::add_usage(
    const protocol::UsageDelta& delta,
    const std::optional<core::config::ModelPricing>& pricing) {
    auto valid = check_valid();
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    const std::uint64_t cached =
        delta.cached_input_tokens < delta.input_tokens ? delta.cached_input_tokens
                                                       : delta.input_tokens;
    const std::uint64_t billable_input = delta.input_tokens - cached;

    std::lock_guard<std::mutex> lock(session_->state_mutex_);
    session_->usage_.input_tokens += billable_input;
    session_->usage_.cached_input_tokens += cached;
    session_->usage_.output_tokens += delta.output_tokens;
    if (pricing.has_value()) {
        constexpr double kPerMillion = 1'000'000.0;
        session_->cost_ += (pricing->input * static_cast<double>(billable_input) +
                            pricing->cached_input * static_cast<double>(cached) +
                            pricing->output * static_cast<double>(delta.output_tokens)) /
                           kPerMillion;
    }
    return protocol::UsageChangedUpdate{session_->usage_, session_->cost_};
}

core::errors::Status SessionLease::set_cursor(std::string cursor) {
    auto valid = check_valid();
    if (core::errors::is_error(valid)) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(session_->state_mutex_);
    session_->cursor_ = std::move(cursor);
    return core::errors::ok();
}

core::errors::Status SessionLease::submit_tool_result(const protocol::ToolResult& result) {
    auto valid = check_valid();
    if (core::errors::is_error(valid)) {
        return valid;
    }

    bool pending = false;
    for (const auto& call : session_->pending_tool_calls()) {
        if (call.id == result.tool_call_id) {
            pending = true;
            break;
        }
    }
    if (!pending) {
        return FlowError{ErrorCategory::Input,
                         "No pending tool call with id: " + result.tool_call_id,
                         "unknown_pending_call"};
    }

    CHATFLOW_LOG_INFO("Session " + session_->id_ + ": client result for call " +
                      result.tool_call_id);
    return append(protocol::make_tool_result_message(result));
}

}  // namespace chatflow::session
