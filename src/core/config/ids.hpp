#pragma once
#include <random>
#include <sstream>
#include <string>

namespace chatflow::core::config {

    // Generates "<prefix>-" followed by 12 random hex digits,
    // e.g. "sess-3f09a1c2b7de" or "msg-00ab93f1c4e2".
    inline std::string generate_id(const std::string& prefix) {
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_session_id() { return generate_id("sess"); }
    inline std::string generate_message_id() { return generate_id("msg"); }
    inline std::string generate_call_id() { return generate_id("call"); }

} // namespace chatflow::core::config
