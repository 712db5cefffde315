/**
 * @file rules/handlers/TypedRuleHandler.hpp
 * @brief Adapter turning a typed callable into an IRuleHandler.
 */
#pragma once

#include "IRuleHandler.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace RuleGate::Rules {

/**
 * @brief Handler bound to one concrete parameter type.
 *
 * @tparam Params Concrete parameter type exposing a static kTag.
 *
 * The tag comparison in evaluate() is what makes the static_cast safe; no
 * runtime type information is consulted.
 */
template<typename Params>
class TypedRuleHandler : public IRuleHandler {
    static_assert(std::is_base_of_v<RuleParameters, Params>,
                  "Params must derive from RuleParameters");

public:
    using Function = std::function<Outcome(const Params&)>;

    TypedRuleHandler(std::string name, Function fn)
        : name_(std::move(name))
        , fn_(std::move(fn)) {}

    [[nodiscard]] RuleTag rule_tag() const noexcept override { return Params::kTag; }

    [[nodiscard]] const char* rule_name() const noexcept override { return name_.c_str(); }

    [[nodiscard]] Outcome evaluate(const RuleParameters& params) override {
        if (params.rule_tag() != Params::kTag) {
            return Outcome::failed(DispatchErrc::HandlerTagMismatch, params.rule_tag(),
                                   "handler '" + name_ + "' expects tag " +
                                   std::to_string(Params::kTag));
        }
        return fn_(static_cast<const Params&>(params));
    }

private:
    std::string name_;
    Function fn_;
};

/**
 * @brief Build a typed handler from a callable.
 *
 * @code
 * auto handler = make_rule_handler<RangeCheckParams>("RangeCheck",
 *     [](const RangeCheckParams& p) { return Outcome::empty(); });
 * @endcode
 */
template<typename Params, typename Fn>
[[nodiscard]] std::unique_ptr<IRuleHandler> make_rule_handler(std::string name, Fn&& fn) {
    return std::make_unique<TypedRuleHandler<Params>>(
        std::move(name), typename TypedRuleHandler<Params>::Function(std::forward<Fn>(fn)));
}

} // namespace RuleGate::Rules
