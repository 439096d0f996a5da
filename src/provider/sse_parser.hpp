#pragma once

#include <functional>
#include <string>

namespace chatflow::provider {

struct SseEvent {
    std::string event;  // "event:" field, empty for the default type
    std::string data;   // "data:" lines joined with '\n'
};

// Return false to stop parsing.
using SseCallback = std::function<bool(const SseEvent& event)>;

// Incremental server-sent events framing. Chunks may split lines and
// events anywhere; an event is dispatched on its terminating blank line.
class SseParser {
public:
    // Returns false when the callback asked to stop.
    bool feed(const std::string& chunk, const SseCallback& callback);

    // Dispatches a trailing event that had no terminating blank line.
    bool finish(const SseCallback& callback);

    void reset();

private:
    bool process_line(std::string line, const SseCallback& callback);
    bool dispatch(const SseCallback& callback);

    std::string buffer_;
    SseEvent pending_;
    bool has_data_ = false;
};

}  // namespace chatflow::provider
