/**
 * @file rules/builtins/ParameterFactory.cpp
 * @brief Implementation of the JSON parameter factory.
 */
#include "ParameterFactory.hpp"
#include "DateWindowParams.hpp"
#include "RangeCheckParams.hpp"
#include "RequiredTextParams.hpp"

#include <stdexcept>

namespace RuleGate::Rules {
namespace {

const nlohmann::json& require_field(const nlohmann::json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end()) {
        throw std::invalid_argument(std::string("missing field \"") + key + "\"");
    }
    return *it;
}

std::string require_string(const nlohmann::json& entry, const char* key) {
    const auto& v = require_field(entry, key);
    if (!v.is_string()) {
        throw std::invalid_argument(std::string("field \"") + key + "\" must be a string");
    }
    return v.get<std::string>();
}

double require_number(const nlohmann::json& entry, const char* key) {
    const auto& v = require_field(entry, key);
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("field \"") + key + "\" must be a number");
    }
    return v.get<double>();
}

std::chrono::year_month_day require_date(const nlohmann::json& entry, const char* key) {
    auto text = require_string(entry, key);
    auto date = parse_iso_date(text);
    if (!date) {
        throw std::invalid_argument(std::string("field \"") + key + "\" is not a YYYY-MM-DD date: " + text);
    }
    return *date;
}

std::string optional_field_name(const nlohmann::json& entry, const char* fallback) {
    auto it = entry.find("field");
    if (it != entry.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

} // anonymous namespace

ParameterFactory::ParameterFactory() {
    builders_["RangeCheck"] = [](const nlohmann::json& e) -> std::unique_ptr<const RuleParameters> {
        return std::make_unique<RangeCheckParams>(
            optional_field_name(e, "value"),
            require_number(e, "value"),
            require_number(e, "min"),
            require_number(e, "max"));
    };
    builders_["DateWindow"] = [](const nlohmann::json& e) -> std::unique_ptr<const RuleParameters> {
        return std::make_unique<DateWindowParams>(
            optional_field_name(e, "window"),
            require_date(e, "start"),
            require_date(e, "end"));
    };
    builders_["RequiredText"] = [](const nlohmann::json& e) -> std::unique_ptr<const RuleParameters> {
        return std::make_unique<RequiredTextParams>(
            optional_field_name(e, "text"),
            require_string(e, "text"));
    };
}

void ParameterFactory::add_builder(const std::string& rule_name, Builder builder) {
    if (!builder) {
        throw std::invalid_argument("ParameterFactory: empty builder for '" + rule_name + "'");
    }
    if (!builders_.emplace(rule_name, std::move(builder)).second) {
        throw std::invalid_argument("ParameterFactory: builder already defined for '" + rule_name + "'");
    }
}

std::unique_ptr<const RuleParameters> ParameterFactory::build(const nlohmann::json& entry) const {
    if (!entry.is_object()) {
        throw std::invalid_argument("entry must be an object");
    }
    auto name = require_string(entry, "rule");
    auto it = builders_.find(name);
    if (it == builders_.end()) {
        throw std::invalid_argument("unknown rule \"" + name + "\"");
    }
    try {
        return it->second(entry);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(name + ": " + e.what());
    }
}

ParameterList ParameterFactory::build_all(const nlohmann::json& entries) const {
    if (!entries.is_array()) {
        throw std::invalid_argument("batch must be a JSON array");
    }
    ParameterList params;
    params.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        try {
            params.push_back(build(entries[i]));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("entry " + std::to_string(i) + ": " + e.what());
        }
    }
    return params;
}

std::vector<std::string> ParameterFactory::rule_names() const {
    std::vector<std::string> names;
    names.reserve(builders_.size());
    for (const auto& [name, builder] : builders_) {
        names.push_back(name);
    }
    return names;
}

} // namespace RuleGate::Rules
