/**
 * @file rules/builtins/RequiredTextParams.hpp
 * @brief Parameters for the RequiredText rule.
 */
#pragma once

#include "rules/params/RuleParameters.hpp"
#include "rules/params/RuleTags.hpp"

#include <string>
#include <utility>

namespace RuleGate::Rules {

/// @brief Text field that must contain at least one non-whitespace character.
class RequiredTextParams : public TaggedParameters<RuleTags::RequiredText> {
public:
    RequiredTextParams(std::string field, std::string text)
        : field_(std::move(field)), text_(std::move(text)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string field_;
    std::string text_;
};

} // namespace RuleGate::Rules
