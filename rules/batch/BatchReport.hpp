/**
 * @file rules/batch/BatchReport.hpp
 * @brief Aggregated result of running a batch of rules.
 */
#pragma once

#include "rules/outcome/Outcome.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace RuleGate::Rules {

/// @brief Why a batch stopped.
enum class StopReason {
    Completed,          ///< Every entry was evaluated
    BusinessRejection,  ///< Last result is a business-rule rejection
    DispatchFailure     ///< error holds the infrastructure failure
};

inline std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::Completed:         return "completed";
        case StopReason::BusinessRejection: return "business_rejection";
        case StopReason::DispatchFailure:   return "dispatch_failure";
    }
    return "unknown";
}

/**
 * @brief Ordered results plus the optional dispatch error.
 *
 * results holds Produced entries only, in input order, up to and including
 * the point of early exit.
 */
struct BatchReport {
    std::vector<RuleResult> results;
    std::optional<DispatchFailure> error;
    StopReason stop_reason{StopReason::Completed};
    size_t evaluated{0};   ///< Entries handed to the dispatcher, including the one that stopped the batch

    [[nodiscard]] bool completed() const noexcept { return stop_reason == StopReason::Completed; }

    /// @brief The rejection that stopped the batch, or nullptr.
    [[nodiscard]] const RuleResult* rejection() const noexcept {
        if (stop_reason != StopReason::BusinessRejection || results.empty()) {
            return nullptr;
        }
        return &results.back();
    }
};

} // namespace RuleGate::Rules
