/**
 * @file rules/registry/RuleRegistry.cpp
 * @brief Implementation of the sealed rule registry.
 */
#include "RuleRegistry.hpp"
#include "logger.hpp"

#include <algorithm>

namespace RuleGate::Rules {

RuleRegistry::RuleRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

void RuleRegistry::register_rule(RuleDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sealed_.load(std::memory_order_relaxed)) {
        log_error("Rejected registration of '" + descriptor.name + "' tag=" +
                  std::to_string(descriptor.tag) + ": registry sealed");
        throw_dispatch_error(DispatchErrc::RegistryAlreadySealed,
                             "register_rule: tag " + std::to_string(descriptor.tag));
    }
    if (!descriptor.handler) {
        log_error("Rejected registration of tag=" + std::to_string(descriptor.tag) +
                  ": null handler");
        throw_dispatch_error(DispatchErrc::InvalidRegistration,
                             "register_rule: null handler for tag " + std::to_string(descriptor.tag));
    }
    if (descriptor.handler->rule_tag() != descriptor.tag) {
        log_error("Rejected registration of '" + descriptor.name + "': descriptor tag=" +
                  std::to_string(descriptor.tag) + " handler tag=" +
                  std::to_string(descriptor.handler->rule_tag()));
        throw_dispatch_error(DispatchErrc::InvalidRegistration,
                             "register_rule: handler tag does not match descriptor tag " +
                             std::to_string(descriptor.tag));
    }

    auto it = rules_.find(descriptor.tag);
    if (it != rules_.end()) {
        log_error("Duplicate registration for tag=" + std::to_string(descriptor.tag) +
                  " ('" + it->second.name + "' already registered, rejected '" +
                  descriptor.name + "')");
        throw_dispatch_error(DispatchErrc::DuplicateRegistration,
                             "register_rule: tag " + std::to_string(descriptor.tag) +
                             " already handled by '" + it->second.name + "'");
    }

    log_debug("Registered rule=" + descriptor.name + " tag=" + std::to_string(descriptor.tag));
    RuleTag tag = descriptor.tag;
    rules_.emplace(tag, std::move(descriptor));
}

void RuleRegistry::register_rule(std::unique_ptr<IRuleHandler> handler, std::string description) {
    register_rule(RuleDescriptor::create(std::move(handler), std::move(description)));
}

void RuleRegistry::seal(std::span<const RuleTag> required_tags) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sealed_.load(std::memory_order_relaxed)) {
        throw_dispatch_error(DispatchErrc::RegistryAlreadySealed, "seal: registry already sealed");
    }

    std::vector<RuleTag> missing;
    for (RuleTag tag : required_tags) {
        if (rules_.find(tag) == rules_.end()) {
            missing.push_back(tag);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (RuleTag tag : missing) {
            if (!list.empty()) list += ", ";
            list += std::to_string(tag);
        }
        log_error("Cannot seal: no handler for tag(s) " + list);
        throw_dispatch_error(DispatchErrc::MissingRegistration, "seal: no handler for tag(s) " + list);
    }

    sealed_.store(true, std::memory_order_release);
    log_debug("Sealed with " + std::to_string(rules_.size()) + " rule(s)");
}

RuleRegistry::State RuleRegistry::state() const noexcept {
    return sealed_.load(std::memory_order_acquire) ? State::Sealed : State::Building;
}

const RuleDescriptor& RuleRegistry::resolve(RuleTag tag) const {
    const RuleDescriptor* desc = find(tag);
    if (!desc) {
        throw_dispatch_error(DispatchErrc::HandlerNotFound, "resolve: tag " + std::to_string(tag));
    }
    return *desc;
}

const RuleDescriptor* RuleRegistry::find(RuleTag tag) const {
    // Sealed: the map is immutable, read without locking
    if (sealed_.load(std::memory_order_acquire)) {
        auto it = rules_.find(tag);
        return it != rules_.end() ? &it->second : nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(tag);
    return it != rules_.end() ? &it->second : nullptr;
}

std::string RuleRegistry::rule_name(RuleTag tag) const {
    const RuleDescriptor* desc = find(tag);
    return desc ? desc->name : std::string{};
}

std::vector<RuleTag> RuleRegistry::tags() const {
    std::vector<RuleTag> result;
    {
        std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
        if (!is_sealed()) lock.lock();
        result.reserve(rules_.size());
        for (const auto& [tag, desc] : rules_) {
            result.push_back(tag);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t RuleRegistry::rule_count() const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!is_sealed()) lock.lock();
    return rules_.size();
}

void RuleRegistry::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[RuleRegistry] " + message);
    }
}

void RuleRegistry::log_error(const std::string& message) const {
    if (logger_) {
        logger_->error("[RuleRegistry] " + message);
    }
}

} // namespace RuleGate::Rules
