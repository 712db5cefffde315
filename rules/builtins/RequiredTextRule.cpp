/**
 * @file rules/builtins/RequiredTextRule.cpp
 * @brief Non-blank text rule.
 */
#include "BuiltinRules.hpp"
#include "RequiredTextParams.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace RuleGate::Rules {
namespace {

/**
 * @brief Handler for required text fields.
 *
 * Settings: "max_length" (integer, bytes).
 */
class RequiredTextHandler : public IRuleHandler {
public:
    explicit RequiredTextHandler(std::shared_ptr<const IRuleConfigSource> config)
        : config_(std::move(config)) {}

    [[nodiscard]] RuleTag rule_tag() const noexcept override {
        return RuleTags::RequiredText;
    }

    [[nodiscard]] const char* rule_name() const noexcept override {
        return "RequiredText";
    }

    [[nodiscard]] Outcome evaluate(const RuleParameters& params) override {
        if (params.rule_tag() != RequiredTextParams::kTag) {
            return Outcome::failed(DispatchErrc::HandlerTagMismatch, params.rule_tag());
        }
        const auto& p = static_cast<const RequiredTextParams&>(params);

        if (!config_->is_enforced(rule_name())) {
            return Outcome::empty();
        }

        const bool blank = std::all_of(p.text().begin(), p.text().end(), [](unsigned char c) {
            return std::isspace(c) != 0;
        });
        if (blank) {
            return Outcome::produced(RuleResult::reject(p.field() + " is required", BuiltinErrors::BlankText));
        }

        if (auto s = config_->setting(rule_name(), "max_length");
            s && s->is_number_integer() && s->get<long long>() >= 0) {
            const auto max_length = s->get<size_t>();
            if (p.text().size() > max_length) {
                return Outcome::produced(RuleResult::reject(
                    p.field() + " exceeds " + std::to_string(max_length) + " characters",
                    BuiltinErrors::TextTooLong));
            }
        }

        return Outcome::produced(RuleResult::pass(p.field() + " present"));
    }

private:
    std::shared_ptr<const IRuleConfigSource> config_;
};

} // anonymous namespace

std::unique_ptr<IRuleHandler> make_required_text_handler(std::shared_ptr<const IRuleConfigSource> config) {
    if (!config) {
        throw std::invalid_argument("RequiredText: config source cannot be null");
    }
    return std::make_unique<RequiredTextHandler>(std::move(config));
}

} // namespace RuleGate::Rules
