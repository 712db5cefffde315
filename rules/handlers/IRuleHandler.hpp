/**
 * @file rules/handlers/IRuleHandler.hpp
 * @brief Interface for rule handlers.
 *
 * Each handler evaluates exactly one parameter tag and returns an Outcome.
 */
#pragma once

#include "rules/outcome/Outcome.hpp"
#include "rules/params/RuleParameters.hpp"

namespace RuleGate::Rules {

/**
 * @brief Interface for rule handlers.
 *
 * Implement this interface (or use TypedRuleHandler) to evaluate a specific
 * parameter type. Handlers are invoked synchronously and must not assume any
 * retry by the caller.
 */
class IRuleHandler {
public:
    virtual ~IRuleHandler() = default;

    /**
     * @brief Get the parameter tag this handler evaluates.
     * @return The tag value this handler is registered for.
     */
    [[nodiscard]] virtual RuleTag rule_tag() const noexcept = 0;

    /**
     * @brief Get a human-readable name for this rule.
     * @return Rule name for logging and configuration lookups.
     */
    [[nodiscard]] virtual const char* rule_name() const noexcept = 0;

    /**
     * @brief Evaluate the rule.
     *
     * @param params Parameters whose rule_tag() equals this handler's tag.
     * @return Produced result, Empty when the rule opts out, or Failed.
     */
    [[nodiscard]] virtual Outcome evaluate(const RuleParameters& params) = 0;
};

} // namespace RuleGate::Rules
