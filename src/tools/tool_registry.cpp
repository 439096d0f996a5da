#include "tools/tool_registry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"

namespace chatflow::tools {

using core::errors::ErrorCategory;
using core::errors::FlowError;

core::errors::Status ToolRegistry::add(ToolSpec spec) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::string name = spec.name();
    if (tools_.find(name) != tools_.end()) {
        return FlowError{ErrorCategory::Registration,
                         "Tool already registered: " + name, "duplicate_tool"};
    }
    tools_.emplace(name, std::make_shared<const ToolSpec>(std::move(spec)));
    CHATFLOW_LOG_DEBUG("ToolRegistry: registered '" + name + "'");
    return core::errors::ok();
}

core::errors::Status ToolRegistry::add(const ToolBuilder& builder) {
    auto built = builder.build();
    if (core::errors::is_error(built)) {
        return core::errors::get_error(built);
    }
    return add(core::errors::take_value(built));
}

core::errors::Result<std::shared_ptr<const ToolSpec>> ToolRegistry::get(
    const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return FlowError{ErrorCategory::Extraction, "No such tool: " + name,
                         "unknown_tool"};
    }
    return it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

std::vector<std::string> ToolRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& entry : tools_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json ToolRegistry::definitions() const {
    nlohmann::json definitions = nlohmann::json::array();
    for (const auto& name : names()) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        definitions.push_back(tools_.at(name)->definition());
    }
    return definitions;
}

}  // namespace chatflow::tools
