#include "provider/replay_transport.hpp"

#include <deque>
#include <fstream>
#include <sstream>
#include "core/logging/logger.hpp"
#include "provider/chunk_translator.hpp"
#include "provider/sse_parser.hpp"

namespace chatflow::provider {

using core::errors::ErrorCategory;
using core::errors::FlowError;

namespace {

class ReplaySource : public EventSource {
public:
    explicit ReplaySource(std::vector<std::string> payloads)
        : payloads_(payloads.begin(), payloads.end()) {}

    core::errors::Result<std::optional<protocol::StreamEvent>> next() override {
        while (ready_.empty()) {
            if (cancelled_ || payloads_.empty()) {
                return std::optional<protocol::StreamEvent>{};
            }
            std::string data = std::move(payloads_.front());
            payloads_.pop_front();
            auto events = translator_.translate(data);
            if (core::errors::is_error(events)) {
                return core::errors::get_error(events);
            }
            for (auto& event : core::errors::take_value(events)) {
                ready_.push_back(std::move(event));
            }
        }
        protocol::StreamEvent event = std::move(ready_.front());
        ready_.pop_front();
        return std::optional<protocol::StreamEvent>{std::move(event)};
    }

    void cancel() override {
        cancelled_ = true;
        ready_.clear();
        payloads_.clear();
    }

private:
    std::deque<std::string> payloads_;
    std::deque<protocol::StreamEvent> ready_;
    ChunkTranslator translator_;
    bool cancelled_ = false;
};

}  // namespace

ReplayTransport::ReplayTransport(std::vector<std::vector<std::string>> turns)
    : turns_(std::move(turns)) {}

core::errors::Result<std::unique_ptr<ReplayTransport>> ReplayTransport::from_sse(
    const std::string& body) {
    std::vector<std::vector<std::string>> turns;
    std::vector<std::string> current;
    auto collect = [&](const SseEvent& event) {
        current.push_back(event.data);
        if (event.data == "[DONE]") {
            turns.push_back(std::move(current));
            current.clear();
        }
        return true;
    };

    SseParser parser;
    parser.feed(body, collect);
    parser.finish(collect);

    if (!current.empty()) {
        CHATFLOW_LOG_WARN("Recorded stream has data after its last [DONE]; "
                          "replaying it as a truncated response");
        turns.push_back(std::move(current));
    }
    if (turns.empty()) {
        return FlowError{ErrorCategory::Input, "Recorded stream contains no events.",
                         "empty_replay"};
    }
    return std::make_unique<ReplayTransport>(std::move(turns));
}

core::errors::Result<std::unique_ptr<ReplayTransport>> ReplayTransport::from_file(
    const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return FlowError{ErrorCategory::Input, "Cannot open recorded stream: " + path,
                         "replay_open_failed"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_sse(buffer.str());
}

core::errors::Result<std::unique_ptr<EventSource>> ReplayTransport::open(
    const ProviderRequest& request) {
    if (next_turn_ >= turns_.size()) {
        return FlowError{ErrorCategory::Provider,
                         "Recorded stream has no response left for request " +
                             std::to_string(next_turn_ + 1) + ".",
                         "replay_exhausted"};
    }
    requests_.push_back(request);
    CHATFLOW_LOG_DEBUG("Replaying recorded response " + std::to_string(next_turn_ + 1) + "/" +
                       std::to_string(turns_.size()));
    return std::unique_ptr<EventSource>(
        std::make_unique<ReplaySource>(turns_[next_turn_++]));
}

}  // namespace chatflow::provider
