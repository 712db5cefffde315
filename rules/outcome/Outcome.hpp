/**
 * @file rules/outcome/Outcome.hpp
 * @brief Tri-state result of a single dispatch: Produced, Empty or Failed.
 */
#pragma once

#include "RuleResult.hpp"
#include "rules/errors/DispatchError.hpp"
#include "rules/params/RuleTags.hpp"

#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace RuleGate::Rules {

/// @brief Rule ran and had nothing to report (treated as a pass).
struct EmptyOutcome {
    bool operator==(const EmptyOutcome&) const = default;
};

/// @brief Infrastructure or registry failure, distinct from a business rejection.
struct DispatchFailure {
    std::error_code error;   ///< Code in dispatch_category()
    RuleTag tag{0};          ///< Tag of the parameters being dispatched
    std::string detail;      ///< Context for operators

    [[nodiscard]] std::string describe() const {
        std::string text = error.message() + " (tag=" + std::to_string(tag) + ")";
        if (!detail.empty()) {
            text += ": " + detail;
        }
        return text;
    }
};

/**
 * @brief Closed tagged variant returned by handlers and the dispatcher.
 *
 * Consumers pattern-match with visit() or the typed accessors instead of
 * downcasting.
 */
class Outcome {
public:
    using Value = std::variant<RuleResult, EmptyOutcome, DispatchFailure>;

    [[nodiscard]] static Outcome produced(RuleResult result) {
        return Outcome(Value(std::in_place_type<RuleResult>, std::move(result)));
    }

    [[nodiscard]] static Outcome empty() {
        return Outcome(Value(std::in_place_type<EmptyOutcome>));
    }

    [[nodiscard]] static Outcome failed(DispatchFailure failure) {
        return Outcome(Value(std::in_place_type<DispatchFailure>, std::move(failure)));
    }

    [[nodiscard]] static Outcome failed(DispatchErrc code, RuleTag tag, std::string detail = {}) {
        return failed(DispatchFailure{make_error_code(code), tag, std::move(detail)});
    }

    [[nodiscard]] bool is_produced() const noexcept { return std::holds_alternative<RuleResult>(value_); }
    [[nodiscard]] bool is_empty() const noexcept { return std::holds_alternative<EmptyOutcome>(value_); }
    [[nodiscard]] bool is_failed() const noexcept { return std::holds_alternative<DispatchFailure>(value_); }

    /// @brief Produced result, or nullptr for other shapes.
    [[nodiscard]] const RuleResult* result() const noexcept { return std::get_if<RuleResult>(&value_); }

    /// @brief Failure details, or nullptr for other shapes.
    [[nodiscard]] const DispatchFailure* failure() const noexcept { return std::get_if<DispatchFailure>(&value_); }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), value_);
    }

private:
    explicit Outcome(Value value) : value_(std::move(value)) {}

    Value value_;
};

} // namespace RuleGate::Rules
