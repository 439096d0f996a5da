#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"

namespace chatflow::core::config {

enum class ToolChoice {
    Auto,
    Required,
    None
};

// USD per one million tokens.
struct ModelPricing {
    double input = 0.0;
    double cached_input = 0.0;
    double output = 0.0;
};

// Knobs forwarded to the provider. Everything except max_tool_rounds is
// passthrough; the engine does not interpret sampling parameters.
struct GenerateConfig {
    std::string model = "gpt-4.1";
    ToolChoice tool_choice = ToolChoice::Auto;
    std::optional<double> temperature;
    std::optional<std::uint32_t> max_output_tokens;
    bool parallel_tool_calls = false;
    std::uint32_t max_tool_rounds = 8;
    nlohmann::json extra = nlohmann::json::object();
};

std::string to_string(ToolChoice choice);

std::optional<ModelPricing> pricing_for(const std::string& model);

errors::Result<GenerateConfig> parse_generate_config(const nlohmann::json& document);

errors::Result<GenerateConfig> load_generate_config(const std::filesystem::path& path);

}  // namespace chatflow::core::config
