#include "core/config/generate_config.hpp"

#include <fstream>
#include <unordered_map>

namespace chatflow::core::config {

using errors::ErrorCategory;
using errors::FlowError;
using nlohmann::json;

namespace {

FlowError config_error(const std::string& message, const std::string& hint = "") {
    return FlowError{ErrorCategory::Input, message, "invalid_config", hint};
}

}  // namespace

std::string to_string(const ToolChoice choice) {
    switch (choice) {
        case ToolChoice::Auto:
            return "auto";
        case ToolChoice::Required:
            return "required";
        case ToolChoice::None:
            return "none";
        default:
            return "auto";
    }
}

std::optional<ModelPricing> pricing_for(const std::string& model) {
    static const std::unordered_map<std::string, ModelPricing> kPricing = {
        {"gpt-4.1", {2.0, 0.5, 8.0}},
        {"gpt-4.1-mini", {0.4, 0.1, 1.6}},
        {"gpt-4.1-nano", {0.1, 0.025, 0.4}},
        {"o3", {10.0, 2.5, 40.0}},
        {"o4-mini", {1.1, 0.275, 4.4}},
    };
    auto it = kPricing.find(model);
    if (it == kPricing.end()) {
        return std::nullopt;
    }
    return it->second;
}

errors::Result<GenerateConfig> parse_generate_config(const json& document) {
    if (!document.is_object()) {
        return config_error("Generation config must be a JSON object.");
    }

    GenerateConfig config;
    for (auto it = document.begin(); it != document.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "model") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                return config_error("'model' must be a non-empty string.");
            }
            config.model = value.get<std::string>();
        } else if (key == "tool_choice") {
            const std::string choice = value.is_string() ? value.get<std::string>() : "";
            if (choice == "auto") {
                config.tool_choice = ToolChoice::Auto;
            } else if (choice == "required") {
                config.tool_choice = ToolChoice::Required;
            } else if (choice == "none") {
                config.tool_choice = ToolChoice::None;
            } else {
                return config_error("'tool_choice' is invalid.",
                                    "Use one of: auto, required, none.");
            }
        } else if (key == "temperature") {
            if (!value.is_number()) {
                return config_error("'temperature' must be a number.");
            }
            const double temperature = value.get<double>();
            if (temperature < 0.0 || temperature > 2.0) {
                return config_error("'temperature' out of bounds.",
                                    "Must be between 0 and 2.");
            }
            config.temperature = temperature;
        } else if (key == "max_output_tokens") {
            if (!value.is_number_integer() || value.get<std::int64_t>() <= 0 ||
                value.get<std::int64_t>() > UINT32_MAX) {
                return config_error("'max_output_tokens' must be a positive integer.");
            }
            config.max_output_tokens = static_cast<std::uint32_t>(value.get<std::int64_t>());
        } else if (key == "parallel_tool_calls") {
            if (!value.is_boolean()) {
                return config_error("'parallel_tool_calls' must be a boolean.");
            }
            config.parallel_tool_calls = value.get<bool>();
        } else if (key == "max_tool_rounds") {
            if (!value.is_number_integer()) {
                return config_error("'max_tool_rounds' must be a positive integer.");
            }
            const auto rounds = value.get<std::int64_t>();
            if (rounds < 1 || rounds > 64) {
                return config_error("'max_tool_rounds' out of bounds.",
                                    "Must be between 1 and 64.");
            }
            config.max_tool_rounds = static_cast<std::uint32_t>(rounds);
        } else if (key == "extra") {
            if (!value.is_object()) {
                return config_error("'extra' must be a JSON object.");
            }
            config.extra = value;
        } else {
            return config_error("Unknown config key: " + key);
        }
    }
    return config;
}

errors::Result<GenerateConfig> load_generate_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return FlowError{ErrorCategory::Input,
                         "Unable to open config file: " + path.string(),
                         "config_open_failed"};
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return FlowError{ErrorCategory::Input,
                         "Config file is not valid JSON: " + path.string(),
                         "config_parse_failed"};
    }
    return parse_generate_config(document);
}

}  // namespace chatflow::core::config
