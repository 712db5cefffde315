/**
 * @file rules/registry/RuleRegistry.hpp
 * @brief Tag to handler registry with a one-way building/sealed lifecycle.
 */
#pragma once

#include "RuleDescriptor.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;

namespace RuleGate::Rules {

/**
 * @brief Registry mapping each parameter tag to exactly one handler.
 *
 * Handlers are registered explicitly during setup; there is no static
 * self-registration. After seal() the map is never written again, so lookups
 * from any number of threads take no lock.
 *
 * Setup errors are thrown as std::system_error carrying a DispatchErrc.
 */
class RuleRegistry {
public:
    enum class State { Building, Sealed };

    /**
     * @brief Construct an empty registry in the Building state.
     * @param logger Logger for setup diagnostics (may be nullptr).
     */
    explicit RuleRegistry(std::shared_ptr<Logger> logger = nullptr);

    // Non-copyable, non-movable
    RuleRegistry(const RuleRegistry&) = delete;
    RuleRegistry& operator=(const RuleRegistry&) = delete;
    RuleRegistry(RuleRegistry&&) = delete;
    RuleRegistry& operator=(RuleRegistry&&) = delete;

    // =========================================================================
    // Registration (Building state only)
    // =========================================================================

    /**
     * @brief Register a rule with its handler.
     * @param descriptor Complete rule definition (takes ownership of handler).
     * @throws std::system_error DuplicateRegistration, RegistryAlreadySealed
     *         or InvalidRegistration.
     */
    void register_rule(RuleDescriptor descriptor);

    /**
     * @brief Convenience overload taking the handler directly.
     */
    void register_rule(std::unique_ptr<IRuleHandler> handler, std::string description = {});

    /**
     * @brief Transition to the Sealed state.
     *
     * @param required_tags Tags that must have a handler. If any is missing
     *        the registry stays in Building and MissingRegistration is thrown.
     * @throws std::system_error RegistryAlreadySealed or MissingRegistration.
     */
    void seal(std::span<const RuleTag> required_tags = {});

    [[nodiscard]] State state() const noexcept;
    [[nodiscard]] bool is_sealed() const noexcept { return state() == State::Sealed; }

    // =========================================================================
    // Lookup
    // =========================================================================

    /**
     * @brief Resolve the descriptor registered for a tag.
     * @throws std::system_error HandlerNotFound if nothing is registered.
     */
    [[nodiscard]] const RuleDescriptor& resolve(RuleTag tag) const;

    /**
     * @brief Non-throwing lookup.
     * @return Descriptor pointer, or nullptr if the tag is not registered.
     */
    [[nodiscard]] const RuleDescriptor* find(RuleTag tag) const;

    [[nodiscard]] bool has_rule(RuleTag tag) const { return find(tag) != nullptr; }

    /**
     * @brief Get rule name by tag.
     * @return Rule name or empty string if not found.
     */
    [[nodiscard]] std::string rule_name(RuleTag tag) const;

    /// @brief All registered tags in ascending order.
    [[nodiscard]] std::vector<RuleTag> tags() const;

    [[nodiscard]] size_t rule_count() const;

private:
    void log_debug(const std::string& message) const;
    void log_error(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;   ///< Guards rules_ while building
    std::atomic<bool> sealed_{false};
    std::unordered_map<RuleTag, RuleDescriptor> rules_;
};

} // namespace RuleGate::Rules
