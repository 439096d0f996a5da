#include "provider/sse_parser.hpp"

namespace chatflow::provider {

bool SseParser::feed(const std::string& chunk, const SseCallback& callback) {
    buffer_ += chunk;

    std::size_t start = 0;
    std::size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!process_line(std::move(line), callback)) {
            buffer_.erase(0, start);
            return false;
        }
    }
    buffer_.erase(0, start);
    return true;
}

bool SseParser::finish(const SseCallback& callback) {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!process_line(std::move(line), callback)) {
            return false;
        }
    }
    return dispatch(callback);
}

void SseParser::reset() {
    buffer_.clear();
    pending_ = SseEvent{};
    has_data_ = false;
}

bool SseParser::process_line(std::string line, const SseCallback& callback) {
    if (line.empty()) {
        return dispatch(callback);
    }
    if (line[0] == ':') {
        return true;  // comment / keep-alive
    }

    std::string field;
    std::string value;
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        field = std::move(line);
    } else {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            pending_.data += '\n';
        }
        pending_.data += value;
        has_data_ = true;
    } else if (field == "event") {
        pending_.event = value;
    }
    // id and retry are not used by the chat-completions stream.
    return true;
}

bool SseParser::dispatch(const SseCallback& callback) {
    if (!has_data_) {
        pending_.event.clear();
        return true;
    }
    SseEvent event = std::move(pending_);
    pending_ = SseEvent{};
    has_data_ = false;
    return callback(event);
}

}  // namespace chatflow::provider
