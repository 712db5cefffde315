/**
 * @file rules/config/JsonRuleConfig.cpp
 * @brief Implementation of the JSON-backed rule configuration.
 */
#include "JsonRuleConfig.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>

namespace RuleGate::Rules {

JsonRuleConfig::JsonRuleConfig(nlohmann::json document) {
    if (document.is_null()) {
        return;
    }
    if (!document.is_object()) {
        throw std::invalid_argument("rule config: document must be an object");
    }
    if (!document.contains("rules")) {
        return;
    }

    auto& rules = document["rules"];
    if (!rules.is_object()) {
        throw std::invalid_argument("rule config: \"rules\" must be an object");
    }
    for (const auto& item : rules.items()) {
        const std::string& name = item.key();
        const nlohmann::json& entry = item.value();
        if (!entry.is_object()) {
            throw std::invalid_argument("rule config: entry for '" + name + "' must be an object");
        }
        if (entry.contains("enforced") && !entry["enforced"].is_boolean()) {
            throw std::invalid_argument("rule config: '" + name + "'.enforced must be a boolean");
        }
        if (entry.contains("settings") && !entry["settings"].is_object()) {
            throw std::invalid_argument("rule config: '" + name + "'.settings must be an object");
        }
    }
    rules_ = std::move(rules);
}

JsonRuleConfig::JsonRuleConfig(JsonRuleConfig&& other) noexcept
    : rules_(std::move(other.rules_)) {}

JsonRuleConfig JsonRuleConfig::from_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("rule config: cannot open " + path.string());
    }
    nlohmann::json document;
    try {
        ifs >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("rule config: malformed JSON in " + path.string() + ": " + e.what());
    }
    return JsonRuleConfig(std::move(document));
}

const nlohmann::json* JsonRuleConfig::entry(std::string_view rule_name) const {
    auto it = rules_.find(std::string(rule_name));
    return it != rules_.end() ? &*it : nullptr;
}

bool JsonRuleConfig::is_enforced(std::string_view rule_name) const {
    std::shared_lock lock(mutex_);
    const auto* e = entry(rule_name);
    if (!e || !e->contains("enforced")) {
        return true;
    }
    return (*e)["enforced"].get<bool>();
}

std::optional<nlohmann::json> JsonRuleConfig::setting(
    std::string_view rule_name,
    std::string_view key
) const {
    std::shared_lock lock(mutex_);
    const auto* e = entry(rule_name);
    if (!e || !e->contains("settings")) {
        return std::nullopt;
    }
    const auto& settings = (*e)["settings"];
    auto it = settings.find(std::string(key));
    if (it == settings.end()) {
        return std::nullopt;
    }
    return *it;
}

void JsonRuleConfig::set_enforced(const std::string& rule_name, bool enforced) {
    std::unique_lock lock(mutex_);
    rules_[rule_name]["enforced"] = enforced;
}

void JsonRuleConfig::set_setting(const std::string& rule_name, const std::string& key, nlohmann::json value) {
    std::unique_lock lock(mutex_);
    rules_[rule_name]["settings"][key] = std::move(value);
}

} // namespace RuleGate::Rules
