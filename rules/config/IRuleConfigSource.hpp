/**
 * @file rules/config/IRuleConfigSource.hpp
 * @brief Per-rule enablement and settings consulted by handlers.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace RuleGate::Rules {

/**
 * @brief Supplies per-rule configuration to handler implementations.
 *
 * The dispatch core never calls this; only handlers do.
 */
class IRuleConfigSource {
public:
    virtual ~IRuleConfigSource() = default;

    /// @brief Whether the named rule is enforced in this context.
    [[nodiscard]] virtual bool is_enforced(std::string_view rule_name) const = 0;

    /// @brief A rule-specific setting, or nullopt if unset.
    [[nodiscard]] virtual std::optional<nlohmann::json> setting(
        std::string_view rule_name,
        std::string_view key
    ) const = 0;
};

} // namespace RuleGate::Rules
