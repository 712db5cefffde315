/**
 * @file rules/dispatch/Dispatcher.hpp
 * @brief Resolves and invokes the handler for a parameter object.
 */
#pragma once

#include "rules/outcome/Outcome.hpp"
#include "rules/params/RuleParameters.hpp"
#include "rules/registry/RuleRegistry.hpp"

#include <chrono>
#include <memory>
#include <string>

class Logger;

namespace RuleGate::Rules {

/**
 * @brief Converts a RuleParameters value into its Outcome.
 *
 * Dispatch is synchronous with no retries. A missing handler is always
 * reported as Failed(HandlerNotFound) and logged; it is never turned into a
 * default result.
 *
 * Deadlines are checked after the handler returns: a handler that overran
 * its effective deadline has its outcome replaced by Failed(DeadlineExceeded).
 */
class Dispatcher {
public:
    /**
     * @brief Construct a dispatcher over a sealed registry.
     *
     * @param registry Sealed registry; must outlive the dispatcher.
     * @param logger Logger for dispatch diagnostics (may be nullptr).
     * @param default_deadline Deadline for descriptors without their own (0 = none).
     * @throws std::invalid_argument if the registry is not sealed.
     */
    explicit Dispatcher(
        const RuleRegistry& registry,
        std::shared_ptr<Logger> logger = nullptr,
        std::chrono::milliseconds default_deadline = std::chrono::milliseconds{0}
    );

    /**
     * @brief Dispatch parameters to their handler.
     * @param params Parameters to evaluate.
     * @return The handler's outcome verbatim, or Failed on dispatch errors.
     */
    [[nodiscard]] Outcome dispatch(const RuleParameters& params) const;

private:
    void log_debug(const std::string& message) const;
    void log_warning(const std::string& message) const;
    void log_error(const std::string& message) const;

    const RuleRegistry& registry_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds default_deadline_;
};

} // namespace RuleGate::Rules
