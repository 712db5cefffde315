/**
 * @file rules/builtins/DateWindowParams.hpp
 * @brief Parameters for the DateWindow rule.
 */
#pragma once

#include "rules/params/RuleParameters.hpp"
#include "rules/params/RuleTags.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace RuleGate::Rules {

/// @brief Date range whose start must not be after its end.
class DateWindowParams : public TaggedParameters<RuleTags::DateWindow> {
public:
    DateWindowParams(std::string field, std::chrono::year_month_day start, std::chrono::year_month_day end)
        : field_(std::move(field)), start_(start), end_(end) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] std::chrono::year_month_day start() const noexcept { return start_; }
    [[nodiscard]] std::chrono::year_month_day end() const noexcept { return end_; }

private:
    std::string field_;
    std::chrono::year_month_day start_;
    std::chrono::year_month_day end_;
};

/**
 * @brief Parse a strict ISO "YYYY-MM-DD" date.
 * @return The date, or nullopt if malformed or not a valid calendar day.
 */
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_iso_date(std::string_view text);

/// @brief Format a date as "YYYY-MM-DD".
[[nodiscard]] std::string format_iso_date(std::chrono::year_month_day date);

} // namespace RuleGate::Rules
