/**
 * @file rules/builtins/ParameterFactory.hpp
 * @brief Builds built-in parameter objects from JSON entries.
 *
 * Each rule name maps to an explicit builder; nothing is constructed by
 * reflection or default construction.
 */
#pragma once

#include "rules/params/RuleParameters.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace RuleGate::Rules {

class ParameterFactory {
public:
    using Builder = std::function<std::unique_ptr<const RuleParameters>(const nlohmann::json&)>;

    /// @brief Factory preloaded with builders for every built-in rule.
    ParameterFactory();

    /**
     * @brief Add a builder for an application-defined rule.
     * @throws std::invalid_argument if the name is taken or the builder is empty.
     */
    void add_builder(const std::string& rule_name, Builder builder);

    /**
     * @brief Build one parameter object.
     *
     * @param entry Object with a "rule" name plus that rule's fields.
     * @throws std::invalid_argument for unknown rules and missing or mistyped fields.
     */
    [[nodiscard]] std::unique_ptr<const RuleParameters> build(const nlohmann::json& entry) const;

    /**
     * @brief Build a whole batch from a JSON array.
     * @throws std::invalid_argument naming the offending index.
     */
    [[nodiscard]] ParameterList build_all(const nlohmann::json& entries) const;

    /// @brief Known rule names in sorted order.
    [[nodiscard]] std::vector<std::string> rule_names() const;

private:
    std::map<std::string, Builder> builders_;
};

} // namespace RuleGate::Rules
