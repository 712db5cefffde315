/**
 * @file rules/params/RuleParameters.hpp
 * @brief Base classes for typed rule parameters.
 *
 * Every concrete parameter type carries a compile-time tag. The dispatcher
 * reads the tag through rule_tag() and never inspects the dynamic type.
 */
#pragma once

#include "RuleTags.hpp"

#include <memory>
#include <vector>

namespace RuleGate::Rules {

/**
 * @brief Opaque value object passed to exactly one rule handler.
 *
 * Concrete variants are immutable and built through explicit constructors
 * supplied by the caller.
 */
class RuleParameters {
public:
    virtual ~RuleParameters() = default;

    /// @brief Tag identifying the concrete parameter type.
    [[nodiscard]] virtual RuleTag rule_tag() const noexcept = 0;

protected:
    RuleParameters() = default;
    RuleParameters(const RuleParameters&) = default;
    RuleParameters& operator=(const RuleParameters&) = default;
};

/**
 * @brief Convenience base binding a parameter type to its tag.
 *
 * @tparam Tag Unique tag for the derived type.
 *
 * @code
 * struct MyParams : TaggedParameters<1001> {
 *     explicit MyParams(int v) : value(v) {}
 *     int value;
 * };
 * @endcode
 */
template<RuleTag Tag>
class TaggedParameters : public RuleParameters {
public:
    static constexpr RuleTag kTag = Tag;

    [[nodiscard]] RuleTag rule_tag() const noexcept final { return kTag; }
};

/// @brief Ordered, owning sequence of heterogeneous parameters for a batch.
using ParameterList = std::vector<std::unique_ptr<const RuleParameters>>;

} // namespace RuleGate::Rules
