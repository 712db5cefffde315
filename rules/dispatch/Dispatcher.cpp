/**
 * @file rules/dispatch/Dispatcher.cpp
 * @brief Implementation of the Dispatcher class.
 */
#include "Dispatcher.hpp"
#include "logger.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

namespace RuleGate::Rules {

Dispatcher::Dispatcher(
    const RuleRegistry& registry,
    std::shared_ptr<Logger> logger,
    std::chrono::milliseconds default_deadline
)
    : registry_(registry)
    , logger_(std::move(logger))
    , default_deadline_(default_deadline)
{
    if (!registry_.is_sealed()) {
        throw std::invalid_argument("Dispatcher: registry must be sealed before dispatching");
    }
    if (default_deadline_.count() < 0) {
        throw std::invalid_argument("Dispatcher: default deadline cannot be negative");
    }
}

Outcome Dispatcher::dispatch(const RuleParameters& params) const {
    const RuleTag tag = params.rule_tag();

    const RuleDescriptor* desc = registry_.find(tag);
    if (!desc) {
        log_error("No handler registered for tag=" + std::to_string(tag));
        return Outcome::failed(DispatchErrc::HandlerNotFound, tag);
    }

    const auto deadline = desc->deadline.count() > 0 ? desc->deadline : default_deadline_;
    const auto started = std::chrono::steady_clock::now();

    // Only std::exception is translated; anything else propagates to the caller
    std::optional<Outcome> outcome;
    try {
        outcome.emplace(desc->handler->evaluate(params));
    } catch (const std::exception& e) {
        log_error("Rule=" + desc->name + " tag=" + std::to_string(tag) + " threw: " + e.what());
        return Outcome::failed(DispatchErrc::HandlerException, tag, e.what());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (deadline.count() > 0 && elapsed > deadline) {
        log_warning("Rule=" + desc->name + " tag=" + std::to_string(tag) + " took " +
                    std::to_string(elapsed.count()) + "ms, deadline " +
                    std::to_string(deadline.count()) + "ms");
        return Outcome::failed(DispatchErrc::DeadlineExceeded, tag,
                               "took " + std::to_string(elapsed.count()) + "ms");
    }

    if (const auto* failure = outcome->failure()) {
        log_error("Rule=" + desc->name + " failed: " + failure->describe());
    } else {
        log_debug("Processed rule=" + desc->name + " tag=" + std::to_string(tag) +
                  (outcome->is_empty() ? " (empty)" : ""));
    }
    return std::move(*outcome);
}

void Dispatcher::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[Dispatcher] " + message);
    }
}

void Dispatcher::log_warning(const std::string& message) const {
    if (logger_) {
        logger_->warning("[Dispatcher] " + message);
    }
}

void Dispatcher::log_error(const std::string& message) const {
    if (logger_) {
        logger_->error("[Dispatcher] " + message);
    }
}

} // namespace RuleGate::Rules
