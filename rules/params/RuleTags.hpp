/**
 * @file rules/params/RuleTags.hpp
 * @brief Parameter type tags.
 *
 * Central location for built-in tags so parameter types and handlers agree.
 */
#pragma once

#include <cstdint>

namespace RuleGate::Rules {

/// @brief Discriminator identifying a concrete kind of rule parameters.
using RuleTag = uint32_t;

/**
 * @brief Compile-time tags for the built-in rules.
 *
 * Keep IDs unique. Tags from 1000 upwards are left to embedding applications.
 */
namespace RuleTags {
    /// Numeric value within bounds (RangeCheckHandler)
    constexpr RuleTag RangeCheck = 1;

    /// Ordered date window (DateWindowHandler)
    constexpr RuleTag DateWindow = 2;

    /// Non-blank text (RequiredTextHandler)
    constexpr RuleTag RequiredText = 3;

    /// Maximum built-in tag
    constexpr RuleTag MaxBuiltinTag = 3;

    /// Total number of built-in rules
    constexpr uint32_t BuiltinCount = 3;

    /// First tag available to application-defined rules
    constexpr RuleTag FirstUserTag = 1000;
}

} // namespace RuleGate::Rules
