/**
 * @file rules/batch/BatchExecutor.hpp
 * @brief Runs an ordered sequence of rule parameters with short-circuiting.
 */
#pragma once

#include "BatchReport.hpp"
#include "rules/dispatch/Dispatcher.hpp"
#include "rules/params/RuleParameters.hpp"

#include <memory>
#include <string>

class Logger;

namespace RuleGate::Rules {

/**
 * @brief Sequential fold over a parameter list with two early-exit conditions.
 *
 * - Failed outcome: stop, report the error, the failing entry adds no result.
 * - Business-rule rejection: append it and stop.
 * - Any other Produced result: append and continue.
 * - Empty: skip and continue.
 *
 * Entries after an exit point are never dispatched.
 */
class BatchExecutor {
public:
    /**
     * @param dispatcher Dispatcher to evaluate entries with; must outlive the executor.
     * @param logger Logger for batch summaries (may be nullptr).
     */
    explicit BatchExecutor(const Dispatcher& dispatcher, std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Evaluate every entry in order until completion or early exit.
     * @param params Ordered parameters; a null entry fails with InvalidParameters.
     */
    [[nodiscard]] BatchReport run_all(const ParameterList& params) const;

    /// @brief Single-entry batch.
    [[nodiscard]] BatchReport run_one(const RuleParameters& params) const;

private:
    enum class Step { Continue, Stop };

    Step apply(const RuleParameters* params, BatchReport& report) const;
    void log_summary(const BatchReport& report, size_t total) const;

    const Dispatcher& dispatcher_;
    std::shared_ptr<Logger> logger_;
};

} // namespace RuleGate::Rules
