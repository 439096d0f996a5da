#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace chatflow::app::cli {

    using namespace chatflow::core::errors;
    using chatflow::protocol::ReplayRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> sse;
        std::optional<std::string> config;
        std::optional<std::string> model;
        std::optional<std::string> max_rounds;
        std::optional<std::string> prompt;
        bool verbose = false;
    };

    namespace {

        Result<std::filesystem::path> existing_file(const std::string& value, const std::string& flag) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return FlowError{ErrorCategory::Input, flag + " does not name a readable file: " + value, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<ReplayRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return FlowError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: chatflow_cli replay --sse <file>"};
        }

        std::string command = argv[1];
        if (command != "replay") {
            return FlowError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'replay' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'replay' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--sse") {
                if (i + 1 < args.size()) raw.sse = args[++i];
                else return FlowError{ErrorCategory::Input, "Missing value for --sse", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return FlowError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--model") {
                if (i + 1 < args.size()) raw.model = args[++i];
                else return FlowError{ErrorCategory::Input, "Missing value for --model", "missing_value"};
            } else if (args[i] == "--max-rounds") {
                if (i + 1 < args.size()) raw.max_rounds = args[++i];
                else return FlowError{ErrorCategory::Input, "Missing value for --max-rounds", "missing_value"};
            } else if (args[i] == "--prompt") {
                if (i + 1 < args.size()) raw.prompt = args[++i];
                else return FlowError{ErrorCategory::Input, "Missing value for --prompt", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return FlowError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ReplayRequest req;
        req.verbose = raw.verbose;

        if (!raw.sse.has_value()) {
            return FlowError{ErrorCategory::Input, "Must provide --sse", "missing_required_flag", "Point --sse at a recorded chat-completions stream."};
        }
        auto sse = existing_file(raw.sse.value(), "--sse");
        if (is_error(sse)) {
            return get_error(sse);
        }
        req.sse_file = get_value(sse);

        if (raw.config) {
            auto config = existing_file(raw.config.value(), "--config");
            if (is_error(config)) {
                return get_error(config);
            }
            req.config_file = get_value(config);
        }

        if (raw.model) {
            if (raw.model->empty()) {
                return FlowError{ErrorCategory::Input, "--model must not be empty", "invalid_value"};
            }
            req.model = raw.model.value();
        }

        if (raw.prompt) {
            if (raw.prompt->empty()) {
                return FlowError{ErrorCategory::Input, "--prompt must not be empty", "invalid_value"};
            }
            req.prompt = raw.prompt.value();
        }

        // Exception-free integer parsing
        if (raw.max_rounds) {
            uint32_t rounds = 0;
            const char* begin = raw.max_rounds->data();
            const char* end = raw.max_rounds->data() + raw.max_rounds->size();
            auto [ptr, ec] = std::from_chars(begin, end, rounds);
            if (ec != std::errc() || ptr != end) {
                return FlowError{ErrorCategory::Input, "Invalid number for --max-rounds", "invalid_integer", "Provide a positive integer."};
            }
            if (rounds == 0 || rounds > 64) {
                return FlowError{ErrorCategory::Input, "--max-rounds out of bounds", "bounds_error", "Must be between 1 and 64."};
            }
            req.max_tool_rounds = rounds;
        }

        return req;
    }

} // namespace chatflow::app::cli
