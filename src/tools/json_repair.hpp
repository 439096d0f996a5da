#pragma once

#include <functional>
#include <string_view>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"

namespace chatflow::tools {

// Best-effort completion of a truncated JSON document: closes open
// strings, arrays and objects, drops dangling commas, fills a missing
// value with null and finishes cut-off literals. An empty buffer is
// an empty object. Fails with "unrepairable_json" when the input is not
// a prefix of some valid document.
core::errors::Result<nlohmann::json> repair_json(std::string_view input);

using JsonRepairFn =
    std::function<core::errors::Result<nlohmann::json>(std::string_view)>;

}  // namespace chatflow::tools
