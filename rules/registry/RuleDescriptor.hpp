/**
 * @file rules/registry/RuleDescriptor.hpp
 * @brief Complete rule registration: metadata + handler + deadline.
 */
#pragma once

#include "rules/handlers/IRuleHandler.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace RuleGate::Rules {

/**
 * @brief Pairing of a parameter tag with its handler.
 *
 * Established once while the registry is building and owned by the registry
 * afterwards. A zero deadline means "use the dispatcher default".
 */
struct RuleDescriptor {
    RuleTag tag{0};                           ///< Parameter tag this rule evaluates
    std::string name;                         ///< Human-readable name
    std::string description;                  ///< What the rule checks
    std::unique_ptr<IRuleHandler> handler;    ///< Rule implementation
    std::chrono::milliseconds deadline{0};    ///< Per-handler deadline (0 = default)

    RuleDescriptor() = default;
    RuleDescriptor(RuleDescriptor&&) = default;
    RuleDescriptor& operator=(RuleDescriptor&&) = default;

    // Non-copyable due to unique_ptr
    RuleDescriptor(const RuleDescriptor&) = delete;
    RuleDescriptor& operator=(const RuleDescriptor&) = delete;

    /**
     * @brief Build a descriptor whose tag and name come from the handler.
     *
     * @param handler The rule implementation (ownership transferred, may not be null).
     * @param description What the rule checks.
     * @param deadline Optional per-handler deadline.
     */
    static RuleDescriptor create(
        std::unique_ptr<IRuleHandler> handler,
        std::string description = {},
        std::chrono::milliseconds deadline = std::chrono::milliseconds{0}
    ) {
        RuleDescriptor desc;
        if (handler) {
            desc.tag = handler->rule_tag();
            desc.name = handler->rule_name();
        }
        desc.description = std::move(description);
        desc.handler = std::move(handler);
        desc.deadline = deadline;
        return desc;
    }
};

} // namespace RuleGate::Rules
