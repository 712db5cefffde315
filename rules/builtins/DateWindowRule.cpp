/**
 * @file rules/builtins/DateWindowRule.cpp
 * @brief Ordered date window rule and ISO date helpers.
 */
#include "BuiltinRules.hpp"
#include "DateWindowParams.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace RuleGate::Rules {

std::optional<std::chrono::year_month_day> parse_iso_date(std::string_view text) {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    auto parse_field = [](std::string_view s, int& out) {
        // from_chars alone would accept a leading '-'
        for (char c : s) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
        const char* end = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(s.data(), end, out);
        return ec == std::errc{} && ptr == end;
    };

    int y = 0, m = 0, d = 0;
    if (!parse_field(text.substr(0, 4), y) ||
        !parse_field(text.substr(5, 2), m) ||
        !parse_field(text.substr(8, 2), d)) {
        return std::nullopt;
    }

    std::chrono::year_month_day date{
        std::chrono::year{y},
        std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}
    };
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string format_iso_date(std::chrono::year_month_day date) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.day());
    return oss.str();
}

namespace {

/**
 * @brief Handler for date windows.
 *
 * Settings: "max_days" (integer). When set, windows spanning more days
 * than this are rejected.
 */
class DateWindowHandler : public IRuleHandler {
public:
    explicit DateWindowHandler(std::shared_ptr<const IRuleConfigSource> config)
        : config_(std::move(config)) {}

    [[nodiscard]] RuleTag rule_tag() const noexcept override {
        return RuleTags::DateWindow;
    }

    [[nodiscard]] const char* rule_name() const noexcept override {
        return "DateWindow";
    }

    [[nodiscard]] Outcome evaluate(const RuleParameters& params) override {
        if (params.rule_tag() != DateWindowParams::kTag) {
            return Outcome::failed(DispatchErrc::HandlerTagMismatch, params.rule_tag());
        }
        const auto& p = static_cast<const DateWindowParams&>(params);

        if (!config_->is_enforced(rule_name())) {
            return Outcome::empty();
        }

        if (!p.start().ok() || !p.end().ok()) {
            return Outcome::produced(RuleResult::fail(
                p.field() + ": invalid calendar date", BuiltinErrors::InvalidDate,
                FailureReason::Validation));
        }

        const auto start = std::chrono::sys_days{p.start()};
        const auto end = std::chrono::sys_days{p.end()};

        if (end < start) {
            return Outcome::produced(RuleResult::reject(
                p.field() + ": end " + format_iso_date(p.end()) + " is before start " +
                format_iso_date(p.start()),
                BuiltinErrors::EndBeforeStart));
        }

        const auto span_days = (end - start).count();
        if (auto s = config_->setting(rule_name(), "max_days"); s && s->is_number_integer()) {
            const auto max_days = s->get<long long>();
            if (span_days > max_days) {
                return Outcome::produced(RuleResult::reject(
                    p.field() + ": window of " + std::to_string(span_days) +
                    " days exceeds " + std::to_string(max_days),
                    BuiltinErrors::WindowTooLong));
            }
        }

        return Outcome::produced(RuleResult::pass(
            p.field() + ": " + std::to_string(span_days) + " day window"));
    }

private:
    std::shared_ptr<const IRuleConfigSource> config_;
};

} // anonymous namespace

std::unique_ptr<IRuleHandler> make_date_window_handler(std::shared_ptr<const IRuleConfigSource> config) {
    if (!config) {
        throw std::invalid_argument("DateWindow: config source cannot be null");
    }
    return std::make_unique<DateWindowHandler>(std::move(config));
}

} // namespace RuleGate::Rules
