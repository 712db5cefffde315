/**
 * @file rules/builtins/BuiltinRules.hpp
 * @brief Domain-neutral validation rules shipped with the library.
 *
 * Each rule returns Empty when its configuration source marks it as not
 * enforced, and a business-rule rejection when the input violates it.
 */
#pragma once

#include "rules/config/IRuleConfigSource.hpp"
#include "rules/handlers/IRuleHandler.hpp"
#include "rules/params/RuleTags.hpp"

#include <array>
#include <memory>

namespace RuleGate::Rules {

class RuleRegistry;

/// @brief Result error codes reported by the built-in rules.
namespace BuiltinErrors {
    constexpr int BelowMinimum = 101;
    constexpr int AboveMaximum = 102;
    constexpr int InvalidBounds = 103;

    constexpr int EndBeforeStart = 201;
    constexpr int WindowTooLong = 202;
    constexpr int InvalidDate = 203;

    constexpr int BlankText = 301;
    constexpr int TextTooLong = 302;
}

/// @brief Tags of every built-in rule, for seal() validation.
inline constexpr std::array<RuleTag, RuleTags::BuiltinCount> kBuiltinRuleTags{
    RuleTags::RangeCheck,
    RuleTags::DateWindow,
    RuleTags::RequiredText,
};

[[nodiscard]] std::unique_ptr<IRuleHandler> make_range_check_handler(
    std::shared_ptr<const IRuleConfigSource> config);

[[nodiscard]] std::unique_ptr<IRuleHandler> make_date_window_handler(
    std::shared_ptr<const IRuleConfigSource> config);

[[nodiscard]] std::unique_ptr<IRuleHandler> make_required_text_handler(
    std::shared_ptr<const IRuleConfigSource> config);

/**
 * @brief Register every built-in rule.
 *
 * @param registry Registry in the Building state.
 * @param config Configuration consulted by the handlers (may not be null).
 * @throws std::invalid_argument if config is null.
 * @throws std::system_error on registration errors.
 */
void register_builtin_rules(RuleRegistry& registry, std::shared_ptr<const IRuleConfigSource> config);

} // namespace RuleGate::Rules
