/**
 * @file rules/config/JsonRuleConfig.hpp
 * @brief Rule configuration backed by a JSON document.
 *
 * Expected layout:
 * @code
 * {
 *   "rules": {
 *     "RangeCheck":   { "enforced": true },
 *     "RequiredText": { "enforced": true, "settings": { "max_length": 80 } }
 *   }
 * }
 * @endcode
 * Rules missing from the document are enforced with no settings.
 *
 * Reads and overrides may run concurrently; handlers observe an override on
 * their next evaluation.
 */
#pragma once

#include "IRuleConfigSource.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <shared_mutex>
#include <string>

namespace RuleGate::Rules {

class JsonRuleConfig : public IRuleConfigSource {
public:
    /// @brief Empty configuration: every rule enforced, no settings.
    JsonRuleConfig() = default;

    /**
     * @brief Build from a parsed document.
     * @throws std::invalid_argument if "rules" or an entry has the wrong shape.
     */
    explicit JsonRuleConfig(nlohmann::json document);

    JsonRuleConfig(JsonRuleConfig&& other) noexcept;

    /**
     * @brief Load from a JSON file.
     * @throws std::runtime_error if the file cannot be read or parsed.
     * @throws std::invalid_argument on shape errors.
     */
    static JsonRuleConfig from_file(const std::filesystem::path& path);

    [[nodiscard]] bool is_enforced(std::string_view rule_name) const override;

    [[nodiscard]] std::optional<nlohmann::json> setting(
        std::string_view rule_name,
        std::string_view key
    ) const override;

    /// @brief Override enforcement for one rule.
    void set_enforced(const std::string& rule_name, bool enforced);

    /// @brief Override one setting for one rule.
    void set_setting(const std::string& rule_name, const std::string& key, nlohmann::json value);

private:
    [[nodiscard]] const nlohmann::json* entry(std::string_view rule_name) const;

    mutable std::shared_mutex mutex_;
    nlohmann::json rules_ = nlohmann::json::object();
};

} // namespace RuleGate::Rules
