/**
 * @file rules/builtins/BuiltinRules.cpp
 * @brief Explicit registration of the built-in rules.
 */
#include "BuiltinRules.hpp"
#include "rules/registry/RuleRegistry.hpp"

#include <stdexcept>

namespace RuleGate::Rules {

void register_builtin_rules(RuleRegistry& registry, std::shared_ptr<const IRuleConfigSource> config) {
    if (!config) {
        throw std::invalid_argument("register_builtin_rules: config source cannot be null");
    }

    registry.register_rule(make_range_check_handler(config),
                           "Numeric value within [min, max]");
    registry.register_rule(make_date_window_handler(config),
                           "Start date not after end date, optional max_days");
    registry.register_rule(make_required_text_handler(config),
                           "Non-blank text, optional max_length");
}

} // namespace RuleGate::Rules
