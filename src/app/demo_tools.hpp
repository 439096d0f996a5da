#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"
#include "tools/tool_registry.hpp"

namespace chatflow::app {

    struct AddArgs {
        double a = 0.0;
        double b = 0.0;
    };

    struct HelloArgs {
        std::string name;
    };

    struct AskUserArgs {
        std::string question;
    };

    // Shared by every say_hello call
    struct Greeter {
        std::string greeting = "Hello";
    };

    void from_json(const nlohmann::json& j, AddArgs& args);
    void from_json(const nlohmann::json& j, HelloArgs& args);
    void from_json(const nlohmann::json& j, AskUserArgs& args);

    // add, say_hello and the client tool ask_user
    chatflow::core::errors::Status register_demo_tools(chatflow::tools::ToolRegistry& registry);

} // namespace chatflow::app
