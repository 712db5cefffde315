/**
 * @file rules/builtins/RangeCheckRule.cpp
 * @brief Numeric bounds rule.
 */
#include "BuiltinRules.hpp"
#include "RangeCheckParams.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace RuleGate::Rules {
namespace {

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

/**
 * @brief Handler for numeric range checks.
 *
 * Settings: "inclusive" (bool, default true). When false the bounds
 * themselves are rejected.
 */
class RangeCheckHandler : public IRuleHandler {
public:
    explicit RangeCheckHandler(std::shared_ptr<const IRuleConfigSource> config)
        : config_(std::move(config)) {}

    [[nodiscard]] RuleTag rule_tag() const noexcept override {
        return RuleTags::RangeCheck;
    }

    [[nodiscard]] const char* rule_name() const noexcept override {
        return "RangeCheck";
    }

    [[nodiscard]] Outcome evaluate(const RuleParameters& params) override {
        if (params.rule_tag() != RangeCheckParams::kTag) {
            return Outcome::failed(DispatchErrc::HandlerTagMismatch, params.rule_tag());
        }
        const auto& p = static_cast<const RangeCheckParams&>(params);

        if (!config_->is_enforced(rule_name())) {
            return Outcome::empty();
        }

        if (std::isnan(p.value()) || std::isnan(p.min()) || std::isnan(p.max()) || p.min() > p.max()) {
            return Outcome::produced(RuleResult::fail(
                p.field() + ": invalid bounds [" + format_number(p.min()) + ", " +
                format_number(p.max()) + "]",
                BuiltinErrors::InvalidBounds, FailureReason::Validation));
        }

        bool inclusive = true;
        if (auto s = config_->setting(rule_name(), "inclusive"); s && s->is_boolean()) {
            inclusive = s->get<bool>();
        }

        const bool below = inclusive ? p.value() < p.min() : p.value() <= p.min();
        const bool above = inclusive ? p.value() > p.max() : p.value() >= p.max();

        if (below) {
            return Outcome::produced(RuleResult::reject(
                p.field() + " = " + format_number(p.value()) + " is below minimum " +
                format_number(p.min()),
                BuiltinErrors::BelowMinimum));
        }
        if (above) {
            return Outcome::produced(RuleResult::reject(
                p.field() + " = " + format_number(p.value()) + " is above maximum " +
                format_number(p.max()),
                BuiltinErrors::AboveMaximum));
        }
        return Outcome::produced(RuleResult::pass(p.field() + " within range"));
    }

private:
    std::shared_ptr<const IRuleConfigSource> config_;
};

} // anonymous namespace

std::unique_ptr<IRuleHandler> make_range_check_handler(std::shared_ptr<const IRuleConfigSource> config) {
    if (!config) {
        throw std::invalid_argument("RangeCheck: config source cannot be null");
    }
    return std::make_unique<RangeCheckHandler>(std::move(config));
}

} // namespace RuleGate::Rules
