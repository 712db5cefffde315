/**
 * @file rules/errors/DispatchError.hpp
 * @brief Error codes raised by the rule registry and dispatcher.
 *
 * Setup-time codes are thrown as std::system_error; dispatch-time codes are
 * carried inside Outcome::Failed values.
 */
#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace RuleGate::Rules {

/**
 * @brief Dispatch error conditions.
 *
 * A business-rule rejection is never one of these; it is ordinary RuleResult data.
 */
enum class DispatchErrc {
    // Setup-time (registry building)
    DuplicateRegistration = 1,  ///< Tag already has a handler
    RegistryAlreadySealed,      ///< register_rule() after seal()
    MissingRegistration,        ///< A required tag has no handler at seal()
    InvalidRegistration,        ///< Null handler or handler/descriptor tag disagreement

    // Dispatch-time
    HandlerNotFound,            ///< No handler registered for the parameter tag
    HandlerTagMismatch,         ///< Handler received parameters of another tag
    HandlerException,           ///< Handler threw
    DeadlineExceeded,           ///< Handler ran past its deadline
    InvalidParameters           ///< Null parameter object in a batch
};

/// @brief The "rulegate.dispatch" error category singleton.
const std::error_category& dispatch_category() noexcept;

inline std::error_code make_error_code(DispatchErrc e) noexcept {
    return {static_cast<int>(e), dispatch_category()};
}

/// @brief True for codes that can only arise while building the registry.
[[nodiscard]] bool is_setup_error(const std::error_code& ec) noexcept;

/// @brief Throw a std::system_error for @p e with a context message.
[[noreturn]] void throw_dispatch_error(DispatchErrc e, const std::string& what);

} // namespace RuleGate::Rules

namespace std {
template<>
struct is_error_code_enum<RuleGate::Rules::DispatchErrc> : true_type {};
} // namespace std
