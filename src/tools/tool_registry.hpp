#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"
#include "tools/tool_spec.hpp"

namespace chatflow::tools {

// Named tools available to one conversation. Populated at setup and only
// read while streams run.
class ToolRegistry {
public:
    core::errors::Status add(ToolSpec spec);

    // Builds and adds in one step.
    core::errors::Status add(const ToolBuilder& builder);

    core::errors::Result<std::shared_ptr<const ToolSpec>> get(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::size_t size() const;
    std::vector<std::string> names() const;

    // Function definitions for the provider request, ordered by name.
    nlohmann::json definitions() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const ToolSpec>> tools_;
};

}  // namespace chatflow::tools
