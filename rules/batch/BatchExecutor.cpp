/**
 * @file rules/batch/BatchExecutor.cpp
 * @brief Implementation of the BatchExecutor class.
 */
#include "BatchExecutor.hpp"
#include "logger.hpp"

#include <type_traits>

namespace RuleGate::Rules {

BatchExecutor::BatchExecutor(const Dispatcher& dispatcher, std::shared_ptr<Logger> logger)
    : dispatcher_(dispatcher)
    , logger_(std::move(logger))
{
}

BatchReport BatchExecutor::run_all(const ParameterList& params) const {
    BatchReport report;
    report.results.reserve(params.size());

    for (const auto& entry : params) {
        if (apply(entry.get(), report) == Step::Stop) {
            break;
        }
    }

    log_summary(report, params.size());
    return report;
}

BatchReport BatchExecutor::run_one(const RuleParameters& params) const {
    BatchReport report;
    apply(&params, report);
    log_summary(report, 1);
    return report;
}

BatchExecutor::Step BatchExecutor::apply(const RuleParameters* params, BatchReport& report) const {
    ++report.evaluated;

    if (!params) {
        report.error = DispatchFailure{make_error_code(DispatchErrc::InvalidParameters), 0,
                                       "null entry at position " + std::to_string(report.evaluated - 1)};
        report.stop_reason = StopReason::DispatchFailure;
        return Step::Stop;
    }

    Outcome outcome = dispatcher_.dispatch(*params);

    return outcome.visit([&report](const auto& value) -> Step {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, DispatchFailure>) {
            report.error = value;
            report.stop_reason = StopReason::DispatchFailure;
            return Step::Stop;
        } else if constexpr (std::is_same_v<T, RuleResult>) {
            report.results.push_back(value);
            if (value.is_business_rejection()) {
                report.stop_reason = StopReason::BusinessRejection;
                return Step::Stop;
            }
            return Step::Continue;
        } else {
            return Step::Continue;
        }
    });
}

void BatchExecutor::log_summary(const BatchReport& report, size_t total) const {
    if (!logger_) {
        return;
    }
    std::string line = "[BatchExecutor] evaluated " + std::to_string(report.evaluated) + "/" +
                       std::to_string(total) + ", results=" + std::to_string(report.results.size()) +
                       ", stop=" + std::string(to_string(report.stop_reason));
    switch (report.stop_reason) {
        case StopReason::Completed:
            logger_->debug(line);
            break;
        case StopReason::BusinessRejection:
            logger_->info(line + ": " + report.results.back().message());
            break;
        case StopReason::DispatchFailure:
            logger_->error(line + ": " + report.error->describe());
            break;
    }
}

} // namespace RuleGate::Rules
