#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "tools/tool_registry.hpp"

namespace {

struct Weather {
    std::string city;
};

void from_json(const nlohmann::json& j, Weather& w) {
    j.at("city").get_to(w.city);
}

struct Other {
    int n = 0;
};

void from_json(const nlohmann::json& j, Other& o) {
    j.at("n").get_to(o.n);
}

struct Exploding {};
struct NotAnObject {};

}  // namespace

template <>
struct chatflow::tools::ParameterSchema<Weather> {
    static nlohmann::json schema() {
        return {{"$schema", "http://json-schema.org/draft-07/schema#"},
                {"title", "Weather"},
                {"type", "object"},
                {"properties",
                 {{"city", {{"type", "string"}, {"title", "City"}}},
                  {"when", {{"type", "string"}, {"format", "date-time"}}}}},
                {"required", {"city"}}};
    }
};

template <>
struct chatflow::tools::ParameterSchema<Other> {
    static nlohmann::json schema() {
        return {{"type", "object"}, {"properties", {{"n", {{"type", "integer"}}}}}};
    }
};

template <>
struct chatflow::tools::ParameterSchema<Exploding> {
    static nlohmann::json schema() { throw std::runtime_error("no schema for you"); }
};

template <>
struct chatflow::tools::ParameterSchema<NotAnObject> {
    static nlohmann::json schema() { return {{"type", "string"}}; }
};

namespace {

using chatflow::core::errors::ErrorCategory;
using chatflow::core::errors::get_error;
using chatflow::core::errors::get_value;
using chatflow::core::errors::is_error;
using chatflow::tools::Args;
using chatflow::tools::Id;
using chatflow::tools::ToolBuilder;
using chatflow::tools::ToolRegistry;
using nlohmann::json;

ToolBuilder weather_tool(const std::string& name = "weather") {
    ToolBuilder builder(name);
    builder.description("Looks up the weather.")
        .parameters<Weather>()
        .executor([](Args<Weather> args) { return "sunny in " + args.value.city; });
    return builder;
}

TEST(ToolRegistryTest, AddsAndFindsTool) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add(weather_tool())));

    EXPECT_TRUE(registry.contains("weather"));
    EXPECT_EQ(registry.size(), 1u);
    auto found = registry.get("weather");
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found)->description(), "Looks up the weather.");
    EXPECT_FALSE(get_value(found)->is_client_tool());
}

TEST(ToolRegistryTest, RejectsDuplicateName) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add(weather_tool())));

    auto second = registry.add(weather_tool());
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::Registration);
    EXPECT_EQ(get_error(second).code, "duplicate_tool");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, ConcurrentAddsNeverExceedSuccesses) {
    ToolRegistry registry;
    std::vector<std::thread> threads;
    std::vector<int> successes(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &successes, t] {
            for (int i = 0; i < 10; ++i) {
                if (!is_error(registry.add(weather_tool("tool_" + std::to_string(i))))) {
                    ++successes[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    int total = 0;
    for (const int count : successes) {
        total += count;
    }
    EXPECT_EQ(total, 10);
    EXPECT_EQ(registry.size(), 10u);
}

TEST(ToolRegistryTest, UnknownToolIsExtractionError) {
    ToolRegistry registry;
    auto found = registry.get("missing");
    ASSERT_TRUE(is_error(found));
    EXPECT_EQ(get_error(found).category, ErrorCategory::Extraction);
    EXPECT_EQ(get_error(found).code, "unknown_tool");
    EXPECT_EQ(get_error(found).message, "No such tool: missing");
}

TEST(ToolRegistryTest, DefinitionsAreSortedAndNormalized) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add(weather_tool("zeta"))));
    ASSERT_FALSE(is_error(registry.add(weather_tool("alpha"))));
    ASSERT_FALSE(is_error(registry.add(
        ToolBuilder("ask").client().strict(false))));

    const json definitions = registry.definitions();
    ASSERT_EQ(definitions.size(), 3u);
    EXPECT_EQ(definitions[0]["function"]["name"], "alpha");
    EXPECT_EQ(definitions[1]["function"]["name"], "ask");
    EXPECT_EQ(definitions[2]["function"]["name"], "zeta");
    EXPECT_EQ(definitions[0]["type"], "function");
    EXPECT_EQ(definitions[0]["function"]["strict"], true);
    EXPECT_EQ(definitions[1]["function"]["strict"], false);

    const json& parameters = definitions[0]["function"]["parameters"];
    EXPECT_FALSE(parameters.contains("$schema"));
    EXPECT_FALSE(parameters.contains("title"));
    EXPECT_FALSE(parameters["properties"]["city"].contains("title"));
    EXPECT_FALSE(parameters["properties"]["when"].contains("format"));
    EXPECT_EQ(parameters["required"], json::array({"city"}));

    const json& empty = definitions[1]["function"]["parameters"];
    EXPECT_EQ(empty["type"], "object");
    EXPECT_TRUE(empty["properties"].empty());
}

TEST(ToolBuilderTest, FailsWithoutName) {
    auto built = ToolBuilder("").executor([](Id) { return 1; }).build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "invalid_tool_name");
}

TEST(ToolBuilderTest, FailsWithoutExecutor) {
    auto built = ToolBuilder("lonely").build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).category, ErrorCategory::Registration);
    EXPECT_EQ(get_error(built).code, "missing_executor");
    EXPECT_FALSE(get_error(built).hint.empty());
}

TEST(ToolBuilderTest, ClientToolNeedsNoExecutor) {
    auto built = ToolBuilder("ask_user").parameters<Weather>().client().build();
    ASSERT_FALSE(is_error(built));
    EXPECT_TRUE(std::get<chatflow::tools::ToolSpec>(built).is_client_tool());
}

TEST(ToolBuilderTest, ClientToolWithExecutorConflicts) {
    auto built = ToolBuilder("ask_user").client().executor([](Id) { return 1; }).build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "conflicting_executor");
}

TEST(ToolBuilderTest, ThrowingSchemaFailsBuild) {
    auto built = ToolBuilder("boom")
                     .parameters<Exploding>()
                     .executor([](Id) { return 1; })
                     .build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "invalid_parameter_schema");
    EXPECT_NE(get_error(built).message.find("no schema for you"), std::string::npos);
}

TEST(ToolBuilderTest, NonObjectSchemaFailsBuild) {
    auto built = ToolBuilder("scalar")
                     .parameters<NotAnObject>()
                     .executor([](Id) { return 1; })
                     .build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "invalid_parameter_schema");
}

TEST(ToolBuilderTest, ArgsTypeMustMatchDeclaredParameters) {
    auto built = ToolBuilder("mismatch")
                     .parameters<Weather>()
                     .executor([](Args<Other> other) { return other.value.n; })
                     .build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "parameter_type_mismatch");

    auto undeclared = ToolBuilder("undeclared")
                          .executor([](Args<Other> other) { return other.value.n; })
                          .build();
    ASSERT_TRUE(is_error(undeclared));
    EXPECT_EQ(get_error(undeclared).code, "parameter_type_mismatch");
}

}  // namespace
