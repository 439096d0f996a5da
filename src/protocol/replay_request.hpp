#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chatflow::protocol {

    // Validated input of the replay command
    struct ReplayRequest {
        std::filesystem::path sse_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> model;
        std::optional<std::uint32_t> max_tool_rounds;
        std::string prompt = "Add 2 and 3, then greet the user.";
        bool verbose = false;
    };

} // namespace chatflow::protocol
