#pragma once

#include <any>
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/flow_errors.hpp"

namespace chatflow::tools {

// Everything an executor may ask for about one call.
struct ToolInvocation {
    std::string call_id;
    std::string tool_name;
    const nlohmann::json* arguments = nullptr;
    std::optional<std::type_index> parameter_type;
    std::any context;  // std::shared_ptr<T> captured at registration
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// ---- Extractable parameter kinds ----

// The call identifier.
struct Id {
    std::string value;
};

// The repaired arguments decoded into T with nlohmann's from_json.
// Args<nlohmann::json> hands over the raw document for any tool.
template <typename T>
struct Args {
    T value;
};

// The value registered with ToolBuilder::context, shared by every call.
template <typename T>
struct Context {
    std::shared_ptr<T> value;
};

// Set when the stream that started the call is cancelled or dropped.
// Long-running executors poll requested() and return early; the stream
// still waits for every execution to return before releasing the session.
struct Cancellation {
    std::shared_ptr<std::atomic_bool> token;

    bool requested() const { return token && token->load(); }
};

template <typename E>
struct Extractor;

template <>
struct Extractor<Id> {
    static const char* kind() { return "Id"; }
    static std::optional<std::type_index> args_type() { return std::nullopt; }

    static core::errors::Result<Id> extract(const ToolInvocation& invocation) {
        return Id{invocation.call_id};
    }
};

template <>
struct Extractor<Cancellation> {
    static const char* kind() { return "Cancellation"; }
    static std::optional<std::type_index> args_type() { return std::nullopt; }

    static core::errors::Result<Cancellation> extract(const ToolInvocation& invocation) {
        return Cancellation{invocation.cancel_token};
    }
};

template <typename T>
struct Extractor<Args<T>> {
    static const char* kind() { return "Args"; }

    static std::optional<std::type_index> args_type() {
        if (std::is_same<T, nlohmann::json>::value) {
            return std::nullopt;
        }
        return std::type_index(typeid(T));
    }

    static core::errors::Result<Args<T>> extract(const ToolInvocation& invocation) {
        using core::errors::ErrorCategory;
        using core::errors::FlowError;

        if (invocation.arguments == nullptr) {
            return FlowError{ErrorCategory::Extraction,
                             "no decoded arguments for call " + invocation.call_id,
                             "missing_arguments"};
        }
        if (!std::is_same<T, nlohmann::json>::value &&
            (!invocation.parameter_type.has_value() ||
             invocation.parameter_type.value() != std::type_index(typeid(T)))) {
            return FlowError{ErrorCategory::Extraction,
                             "tool '" + invocation.tool_name +
                                 "' was not registered with this parameter type",
                             "parameter_type_mismatch"};
        }
        try {
            return Args<T>{invocation.arguments->get<T>()};
        } catch (const nlohmann::json::exception& e) {
            return FlowError{ErrorCategory::Extraction,
                             std::string("arguments do not match: ") + e.what(),
                             "argument_decode_failed"};
        }
    }
};

template <typename T>
struct Extractor<Context<T>> {
    static const char* kind() { return "Context"; }
    static std::optional<std::type_index> args_type() { return std::nullopt; }

    static core::errors::Result<Context<T>> extract(const ToolInvocation& invocation) {
        using core::errors::ErrorCategory;
        using core::errors::FlowError;

        if (!invocation.context.has_value()) {
            return FlowError{ErrorCategory::Extraction,
                             "tool '" + invocation.tool_name + "' has no context",
                             "missing_context"};
        }
        const auto* held = std::any_cast<std::shared_ptr<T>>(&invocation.context);
        if (held == nullptr) {
            return FlowError{ErrorCategory::Extraction,
                             "tool '" + invocation.tool_name +
                                 "' context has a different type",
                             "context_type_mismatch"};
        }
        return Context<T>{*held};
    }
};

namespace detail {

// Parameter list and return type of a callable with a fixed signature.
// Executors run concurrently, so only const call operators are accepted.
template <typename F>
struct callable_traits : callable_traits<decltype(&F::operator())> {};

template <typename R, typename... A>
struct callable_traits<R (*)(A...)> {
    using result_type = R;
    using extractors = std::tuple<std::decay_t<A>...>;
};

template <typename R, typename... A>
struct callable_traits<R(A...)> : callable_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const> : callable_traits<R (*)(A...)> {};

template <typename T>
struct is_result : std::false_type {};

template <typename V>
struct is_result<std::variant<V, core::errors::FlowError>> : std::true_type {};

template <std::size_t I, typename E>
bool resolve_one(const ToolInvocation& invocation, std::optional<E>& slot,
                 std::optional<core::errors::FlowError>& failure) {
    auto result = Extractor<E>::extract(invocation);
    if (core::errors::is_error(result)) {
        core::errors::FlowError error = core::errors::get_error(result);
        error.message = "parameter " + std::to_string(I) + " (" +
                        Extractor<E>::kind() + "): " + error.message;
        failure = std::move(error);
        return false;
    }
    slot.emplace(core::errors::take_value(result));
    return true;
}

// Resolves each slot left to right; stops at the first failure.
template <typename Slots, std::size_t... I>
std::optional<core::errors::FlowError> resolve_all(const ToolInvocation& invocation,
                                                   Slots& slots,
                                                   std::index_sequence<I...>) {
    std::optional<core::errors::FlowError> failure;
    static_cast<void>(
        (resolve_one<I>(invocation, std::get<I>(slots), failure) && ...));
    return failure;
}

template <typename Extractors>
struct slot_of;

template <typename... E>
struct slot_of<std::tuple<E...>> {
    using type = std::tuple<std::optional<E>...>;
};

template <typename E>
void collect_args_type(std::vector<std::type_index>& out) {
    const auto type = Extractor<E>::args_type();
    if (type.has_value()) {
        out.push_back(type.value());
    }
}

// Parameter types named by the Args<T> extractors of a signature.
template <typename... E>
std::vector<std::type_index> args_types_of(std::tuple<E...>*) {
    std::vector<std::type_index> out;
    (collect_args_type<E>(out), ...);
    return out;
}

}  // namespace detail

}  // namespace chatflow::tools
