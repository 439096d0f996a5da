#include "demo_tools.hpp"
#include "tools/tool_spec.hpp"

namespace chatflow::tools {

    template <>
    struct ParameterSchema<app::AddArgs> {
        static nlohmann::json schema() {
            return {{"type", "object"},
                    {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                    {"required", {"a", "b"}},
                    {"additionalProperties", false}};
        }
    };

    template <>
    struct ParameterSchema<app::HelloArgs> {
        static nlohmann::json schema() {
            return {{"type", "object"},
                    {"properties", {{"name", {{"type", "string"}}}}},
                    {"required", {"name"}},
                    {"additionalProperties", false}};
        }
    };

    template <>
    struct ParameterSchema<app::AskUserArgs> {
        static nlohmann::json schema() {
            return {{"type", "object"},
                    {"properties", {{"question", {{"type", "string"}}}}},
                    {"required", {"question"}},
                    {"additionalProperties", false}};
        }
    };

} // namespace chatflow::tools

namespace chatflow::app {

    using namespace chatflow::core::errors;
    using chatflow::tools::Args;
    using chatflow::tools::Context;
    using chatflow::tools::Id;
    using chatflow::tools::ToolBuilder;

    void from_json(const nlohmann::json& j, AddArgs& args) {
        j.at("a").get_to(args.a);
        j.at("b").get_to(args.b);
    }

    void from_json(const nlohmann::json& j, HelloArgs& args) {
        j.at("name").get_to(args.name);
    }

    void from_json(const nlohmann::json& j, AskUserArgs& args) {
        j.at("question").get_to(args.question);
    }

    Status register_demo_tools(chatflow::tools::ToolRegistry& registry) {
        auto added = registry.add(
            ToolBuilder("add")
                .description("Adds two numbers.")
                .parameters<AddArgs>()
                .executor([](Args<AddArgs> args) { return args.value.a + args.value.b; }));
        if (is_error(added)) {
            return added;
        }

        added = registry.add(
            ToolBuilder("say_hello")
                .description("Greets someone by name.")
                .parameters<HelloArgs>()
                .context(Greeter{})
                .executor([](Id id, Args<HelloArgs> args, Context<Greeter> greeter) -> Result<std::string> {
                    if (args.value.name.empty()) {
                        return FlowError{ErrorCategory::Execution, "name must not be empty (call " + id.value + ")", "empty_name"};
                    }
                    return greeter.value->greeting + ", " + args.value.name + "!";
                }));
        if (is_error(added)) {
            return added;
        }

        return registry.add(
            ToolBuilder("ask_user")
                .description("Asks the user a question and waits for the answer.")
                .parameters<AskUserArgs>()
                .client());
    }

} // namespace chatflow::app
