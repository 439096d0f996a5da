#pragma once
#include <string>
#include <utility>
#include <variant>

namespace chatflow::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., invalid config value or a busy session
        Registration,  // E.g., duplicate tool name, missing executor
        Protocol,      // E.g., provider sent deltas for an unknown call
        Provider,      // E.g., transport reported a failed request
        Extraction,    // E.g., tool arguments do not match the declared type
        Execution,     // E.g., a tool executor returned an error
        Internal       // E.g., engine invariant broken
    };

    // The standardized error payload
    struct FlowError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a FlowError.
    template <typename T>
    using Result = std::variant<T, FlowError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<FlowError>(result);
    }

    template <typename T>
    const FlowError& get_error(const Result<T>& result) {
        return std::get<FlowError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Moves the value out; used for move-only payloads such as leases.
    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Registration: return "registration";
            case ErrorCategory::Protocol:     return "protocol";
            case ErrorCategory::Provider:     return "provider";
            case ErrorCategory::Extraction:   return "extraction";
            case ErrorCategory::Execution:    return "execution";
            case ErrorCategory::Internal:     return "internal";
            default: return "unknown";
        }
    }

} // namespace chatflow::core::errors
