/**
 * @file rules/outcome/RuleResult.hpp
 * @brief Immutable result produced by a rule handler.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace RuleGate::Rules {

/// @brief Why a rule did not succeed.
enum class FailureReason {
    None,          ///< Rule passed
    BusinessRule,  ///< Deliberate domain veto; stops a batch
    Validation,    ///< Malformed input detected by the handler
    Other          ///< Any other handler-reported failure
};

inline std::string_view to_string(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::None:         return "none";
        case FailureReason::BusinessRule: return "business_rule";
        case FailureReason::Validation:   return "validation";
        case FailureReason::Other:        return "other";
    }
    return "unknown";
}

/**
 * @brief Outcome data of running one rule.
 *
 * Created by a handler and never mutated afterwards.
 */
class RuleResult {
public:
    /// @brief Successful evaluation.
    [[nodiscard]] static RuleResult pass(std::string message = {}) {
        return RuleResult(true, std::move(message), 0, FailureReason::None);
    }

    /// @brief Deliberate business-rule rejection.
    [[nodiscard]] static RuleResult reject(std::string message, int error_code = 0) {
        return RuleResult(false, std::move(message), error_code, FailureReason::BusinessRule);
    }

    /// @brief Non-business failure (validation or other).
    [[nodiscard]] static RuleResult fail(
        std::string message,
        int error_code,
        FailureReason reason = FailureReason::Other
    ) {
        return RuleResult(false, std::move(message), error_code, reason);
    }

    [[nodiscard]] bool success() const noexcept { return success_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int error_code() const noexcept { return error_code_; }
    [[nodiscard]] FailureReason failure_reason() const noexcept { return failure_reason_; }

    /// @brief True for the designated early-exit condition of a batch.
    [[nodiscard]] bool is_business_rejection() const noexcept {
        return !success_ && failure_reason_ == FailureReason::BusinessRule;
    }

    bool operator==(const RuleResult&) const = default;

private:
    RuleResult(bool success, std::string message, int error_code, FailureReason reason)
        : success_(success)
        , message_(std::move(message))
        , error_code_(error_code)
        , failure_reason_(reason) {}

    bool success_;
    std::string message_;
    int error_code_;
    FailureReason failure_reason_;
};

} // namespace RuleGate::Rules
