/**
 * @file rules/builtins/RangeCheckParams.hpp
 * @brief Parameters for the RangeCheck rule.
 */
#pragma once

#include "rules/params/RuleParameters.hpp"
#include "rules/params/RuleTags.hpp"

#include <string>
#include <utility>

namespace RuleGate::Rules {

/// @brief Numeric value that must lie within [min, max].
class RangeCheckParams : public TaggedParameters<RuleTags::RangeCheck> {
public:
    RangeCheckParams(std::string field, double value, double min, double max)
        : field_(std::move(field)), value_(value), min_(min), max_(max) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] double value() const noexcept { return value_; }
    [[nodiscard]] double min() const noexcept { return min_; }
    [[nodiscard]] double max() const noexcept { return max_; }

private:
    std::string field_;
    double value_;
    double min_;
    double max_;
};

} // namespace RuleGate::Rules
