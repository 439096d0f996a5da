#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/generate_config.hpp"
#include "core/config/ids.hpp"

namespace {

using chatflow::core::config::GenerateConfig;
using chatflow::core::config::ToolChoice;
using chatflow::core::config::load_generate_config;
using chatflow::core::config::parse_generate_config;
using chatflow::core::config::pricing_for;
using chatflow::core::errors::ErrorCategory;
using chatflow::core::errors::get_error;
using chatflow::core::errors::get_value;
using chatflow::core::errors::is_error;
using nlohmann::json;

TEST(GenerateConfigTest, EmptyDocumentGivesDefaults) {
    auto result = parse_generate_config(json::object());
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.model, "gpt-4.1");
    EXPECT_EQ(config.tool_choice, ToolChoice::Auto);
    EXPECT_FALSE(config.temperature.has_value());
    EXPECT_FALSE(config.max_output_tokens.has_value());
    EXPECT_FALSE(config.parallel_tool_calls);
    EXPECT_EQ(config.max_tool_rounds, 8u);
    EXPECT_TRUE(config.extra.empty());
}

TEST(GenerateConfigTest, ParsesEveryField) {
    auto result = parse_generate_config(json{
        {"model", "o4-mini"},
        {"tool_choice", "required"},
        {"temperature", 0.2},
        {"max_output_tokens", 512},
        {"parallel_tool_calls", true},
        {"max_tool_rounds", 3},
        {"extra", {{"user", "tester"}}}});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.model, "o4-mini");
    EXPECT_EQ(config.tool_choice, ToolChoice::Required);
    ASSERT_TRUE(config.temperature.has_value());
    EXPECT_DOUBLE_EQ(config.temperature.value(), 0.2);
    EXPECT_EQ(config.max_output_tokens.value(), 512u);
    EXPECT_TRUE(config.parallel_tool_calls);
    EXPECT_EQ(config.max_tool_rounds, 3u);
    EXPECT_EQ(config.extra["user"], "tester");
}

TEST(GenerateConfigTest, RejectsTemperatureOutOfBounds) {
    auto result = parse_generate_config(json{{"temperature", 2.5}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(GenerateConfigTest, RejectsUnknownToolChoice) {
    auto result = parse_generate_config(json{{"tool_choice", "sometimes"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(GenerateConfigTest, RejectsZeroRoundsAndZeroTokens) {
    EXPECT_TRUE(is_error(parse_generate_config(json{{"max_tool_rounds", 0}})));
    EXPECT_TRUE(is_error(parse_generate_config(json{{"max_tool_rounds", 65}})));
    EXPECT_TRUE(is_error(parse_generate_config(json{{"max_output_tokens", 0}})));
    EXPECT_TRUE(is_error(parse_generate_config(json{{"max_output_tokens", -4}})));
}

TEST(GenerateConfigTest, RejectsUnknownKeys) {
    auto result = parse_generate_config(json{{"modle", "gpt-4.1"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("modle"), std::string::npos);
}

TEST(GenerateConfigTest, LoadFailsForMissingFile) {
    auto result = load_generate_config(std::filesystem::temp_directory_path() /
                                       "__chatflow_missing_config__.json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_open_failed");
}

TEST(GenerateConfigTest, LoadFailsForInvalidJson) {
    const auto path = std::filesystem::temp_directory_path() /
                      (chatflow::core::config::generate_id("cfg") + ".json");
    {
        std::ofstream out(path);
        out << "{\"model\": ";
    }
    auto result = load_generate_config(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST(GenerateConfigTest, LoadsValidFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      (chatflow::core::config::generate_id("cfg") + ".json");
    {
        std::ofstream out(path);
        out << R"({"model": "gpt-4.1-mini", "max_tool_rounds": 2})";
    }
    auto result = load_generate_config(path);
    std::filesystem::remove(path);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).model, "gpt-4.1-mini");
    EXPECT_EQ(get_value(result).max_tool_rounds, 2u);
}

TEST(GenerateConfigTest, PricingKnowsListedModelsOnly) {
    auto pricing = pricing_for("gpt-4.1");
    ASSERT_TRUE(pricing.has_value());
    EXPECT_DOUBLE_EQ(pricing->input, 2.0);
    EXPECT_DOUBLE_EQ(pricing->cached_input, 0.5);
    EXPECT_DOUBLE_EQ(pricing->output, 8.0);

    EXPECT_FALSE(pricing_for("my-local-model").has_value());
}

TEST(IdsTest, GeneratesPrefixedUniqueIds) {
    const auto first = chatflow::core::config::generate_call_id();
    const auto second = chatflow::core::config::generate_call_id();
    EXPECT_EQ(first.rfind("call-", 0), 0u);
    EXPECT_EQ(first.size(), std::string("call-").size() + 12);
    EXPECT_NE(first, second);
}

}  // namespace
