/**
 * @file test_builtin_rules.cpp
 * @brief Built-in rules, JSON rule configuration and the parameter factory.
 */

#include "rules/batch/BatchExecutor.hpp"
#include "rules/builtins/BuiltinRules.hpp"
#include "rules/builtins/DateWindowParams.hpp"
#include "rules/builtins/ParameterFactory.hpp"
#include "rules/builtins/RangeCheckParams.hpp"
#include "rules/builtins/RequiredTextParams.hpp"
#include "rules/config/JsonRuleConfig.hpp"
#include "rules/dispatch/Dispatcher.hpp"
#include "rules/registry/RuleRegistry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace RuleGate::Rules;
using namespace std::chrono;

namespace {

/// Registry + dispatcher wired to the given configuration.
struct Harness {
    std::shared_ptr<JsonRuleConfig> config;
    RuleRegistry registry;
    std::unique_ptr<Dispatcher> dispatcher;

    explicit Harness(nlohmann::json document = nullptr)
        : config(std::make_shared<JsonRuleConfig>(std::move(document)))
    {
        register_builtin_rules(registry, config);
        registry.seal(kBuiltinRuleTags);
        dispatcher = std::make_unique<Dispatcher>(registry);
    }
};

year_month_day ymd(int y, unsigned m, unsigned d) {
    return year{y} / month{m} / day{d};
}

void test_iso_dates() {
    auto d = parse_iso_date("2024-02-29");
    assert(d && *d == ymd(2024, 2, 29));
    assert(format_iso_date(*d) == "2024-02-29");

    assert(!parse_iso_date("2023-02-29"));
    assert(!parse_iso_date("2024-13-01"));
    assert(!parse_iso_date("2024-1-01"));
    assert(!parse_iso_date("2024/01/01"));
    assert(!parse_iso_date(""));
    assert(!parse_iso_date("-001-01-01"));
    assert(!parse_iso_date("2024-+1-01"));
    assert(!parse_iso_date("2024-01- 1"));

    std::cout << "  ISO date parsing: OK\n";
}

void test_range_check() {
    Harness h;

    auto inside = h.dispatcher->dispatch(RangeCheckParams("age", 30, 18, 65));
    assert(inside.result() && inside.result()->success());

    auto below = h.dispatcher->dispatch(RangeCheckParams("age", 12, 18, 65));
    assert(below.result()->is_business_rejection());
    assert(below.result()->error_code() == BuiltinErrors::BelowMinimum);

    auto above = h.dispatcher->dispatch(RangeCheckParams("age", 70, 18, 65));
    assert(above.result()->error_code() == BuiltinErrors::AboveMaximum);

    auto bounds = h.dispatcher->dispatch(RangeCheckParams("age", 30, 65, 18));
    assert(!bounds.result()->success());
    assert(bounds.result()->failure_reason() == FailureReason::Validation);
    assert(!bounds.result()->is_business_rejection());

    // Exclusive bounds via settings
    Harness strict(nlohmann::json{{"rules", {{"RangeCheck", {{"settings", {{"inclusive", false}}}}}}}});
    assert(h.dispatcher->dispatch(RangeCheckParams("age", 18, 18, 65)).result()->success());
    assert(strict.dispatcher->dispatch(RangeCheckParams("age", 18, 18, 65)).result()->is_business_rejection());

    std::cout << "  RangeCheck: OK\n";
}

void test_date_window() {
    Harness h(nlohmann::json{{"rules", {{"DateWindow", {{"settings", {{"max_days", 14}}}}}}}});

    auto ok = h.dispatcher->dispatch(DateWindowParams("leave", ymd(2024, 3, 1), ymd(2024, 3, 10)));
    assert(ok.result()->success());

    auto reversed = h.dispatcher->dispatch(DateWindowParams("leave", ymd(2024, 3, 10), ymd(2024, 3, 1)));
    assert(reversed.result()->error_code() == BuiltinErrors::EndBeforeStart);

    auto too_long = h.dispatcher->dispatch(DateWindowParams("leave", ymd(2024, 3, 1), ymd(2024, 4, 1)));
    assert(too_long.result()->error_code() == BuiltinErrors::WindowTooLong);

    auto invalid = h.dispatcher->dispatch(DateWindowParams("leave", ymd(2023, 2, 30), ymd(2023, 3, 1)));
    assert(invalid.result()->failure_reason() == FailureReason::Validation);

    std::cout << "  DateWindow: OK\n";
}

void test_required_text() {
    Harness h(nlohmann::json{{"rules", {{"RequiredText", {{"settings", {{"max_length", 5}}}}}}}});

    assert(h.dispatcher->dispatch(RequiredTextParams("name", "Ada")).result()->success());

    auto blank = h.dispatcher->dispatch(RequiredTextParams("name", "  \t"));
    assert(blank.result()->error_code() == BuiltinErrors::BlankText);

    auto long_text = h.dispatcher->dispatch(RequiredTextParams("name", "Augusta"));
    assert(long_text.result()->error_code() == BuiltinErrors::TextTooLong);

    std::cout << "  RequiredText: OK\n";
}

void test_not_enforced_is_empty() {
    Harness h(nlohmann::json{{"rules", {{"RangeCheck", {{"enforced", false}}}}}});

    auto outcome = h.dispatcher->dispatch(RangeCheckParams("age", 500, 0, 10));
    assert(outcome.is_empty());

    // Toggling the shared config is seen by the registered handler
    h.config->set_enforced("RangeCheck", true);
    assert(h.dispatcher->dispatch(RangeCheckParams("age", 500, 0, 10)).result()->is_business_rejection());

    std::cout << "  not enforced yields Empty: OK\n";
}

void test_config_override_while_dispatching() {
    Harness h;

    std::atomic<bool> stop{false};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load(std::memory_order_acquire)) {
                auto outcome = h.dispatcher->dispatch(RequiredTextParams("name", std::string(40, 'x')));
                // Enforced with or without a length cap, or not enforced at all
                if (outcome.is_failed()) {
                    unexpected.fetch_add(1);
                }
            }
        });
    }

    for (int i = 0; i < 500; ++i) {
        h.config->set_enforced("RequiredText", i % 2 == 0);
        h.config->set_setting("RequiredText", "max_length", 10 + i % 50);
    }
    stop.store(true, std::memory_order_release);
    for (auto& th : readers) th.join();

    assert(unexpected.load() == 0);
    assert(!h.config->is_enforced("RequiredText"));
    assert(h.config->setting("RequiredText", "max_length")->get<int>() == 10 + 499 % 50);

    std::cout << "  config overrides during dispatch: OK\n";
}

void test_config_shape_errors() {
    auto expect_invalid = [](nlohmann::json doc) {
        bool threw = false;
        try {
            JsonRuleConfig cfg(std::move(doc));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    };
    expect_invalid(nlohmann::json::array());
    expect_invalid(nlohmann::json{{"rules", 3}});
    expect_invalid(nlohmann::json{{"rules", {{"RangeCheck", {{"enforced", "yes"}}}}}});
    expect_invalid(nlohmann::json{{"rules", {{"RangeCheck", {{"settings", 1}}}}}});

    JsonRuleConfig empty;
    assert(empty.is_enforced("Anything"));
    assert(!empty.setting("Anything", "key"));

    std::cout << "  config shape validation: OK\n";
}

void test_config_from_file() {
    const auto dir = std::filesystem::temp_directory_path();
    const auto good = dir / "rulegate_test_config.json";
    const auto bad = dir / "rulegate_test_config_bad.json";
    {
        std::ofstream(good) << R"({"rules": {"DateWindow": {"enforced": false}}})";
        std::ofstream(bad) << R"({"rules": )";
    }

    auto cfg = JsonRuleConfig::from_file(good);
    assert(!cfg.is_enforced("DateWindow"));
    assert(cfg.is_enforced("RangeCheck"));

    auto expect_runtime_error = [](const std::filesystem::path& path) {
        bool threw = false;
        try {
            (void)JsonRuleConfig::from_file(path);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    };
    expect_runtime_error(bad);
    expect_runtime_error(dir / "rulegate_test_config_missing.json");

    std::filesystem::remove(good);
    std::filesystem::remove(bad);

    std::cout << "  config from file: OK\n";
}

void test_parameter_factory() {
    ParameterFactory factory;
    auto batch = nlohmann::json::parse(R"([
        {"rule": "RequiredText", "field": "name", "text": "Ada"},
        {"rule": "RangeCheck", "field": "age", "value": 30, "min": 18, "max": 65},
        {"rule": "DateWindow", "start": "2024-01-01", "end": "2024-01-05"}
    ])");

    auto params = factory.build_all(batch);
    assert(params.size() == 3);
    assert(params[0]->rule_tag() == RuleTags::RequiredText);
    assert(params[1]->rule_tag() == RuleTags::RangeCheck);
    assert(params[2]->rule_tag() == RuleTags::DateWindow);

    auto expect_invalid = [&factory](const char* text) {
        bool threw = false;
        try {
            (void)factory.build_all(nlohmann::json::parse(text));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    };
    expect_invalid(R"({"rule": "RangeCheck"})");
    expect_invalid(R"([{"rule": "Unknown"}])");
    expect_invalid(R"([{"rule": "RangeCheck", "value": "x", "min": 0, "max": 1}])");
    expect_invalid(R"([{"rule": "DateWindow", "start": "2024-02-30", "end": "2024-03-01"}])");
    expect_invalid(R"([{"text": "no rule name"}])");

    assert((factory.rule_names() == std::vector<std::string>{"DateWindow", "RangeCheck", "RequiredText"}));

    // Application rules get explicit builders too
    factory.add_builder("Headcount", [](const nlohmann::json& e) -> std::unique_ptr<const RuleParameters> {
        return std::make_unique<RangeCheckParams>("headcount", e.at("value").get<double>(), 1, 10);
    });
    auto custom = factory.build(nlohmann::json{{"rule", "Headcount"}, {"value", 4}});
    assert(custom->rule_tag() == RuleTags::RangeCheck);

    bool duplicate_threw = false;
    try {
        factory.add_builder("RangeCheck", [](const nlohmann::json&) -> std::unique_ptr<const RuleParameters> {
            return nullptr;
        });
    } catch (const std::invalid_argument&) {
        duplicate_threw = true;
    }
    assert(duplicate_threw);

    std::cout << "  parameter factory: OK\n";
}

void test_builtin_batch() {
    Harness h;
    BatchExecutor executor(*h.dispatcher);
    ParameterFactory factory;

    auto params = factory.build_all(nlohmann::json::parse(R"([
        {"rule": "RequiredText", "field": "name", "text": "Ada"},
        {"rule": "RangeCheck", "field": "age", "value": 12, "min": 18, "max": 65},
        {"rule": "DateWindow", "start": "2024-01-01", "end": "2024-01-05"}
    ])"));

    auto report = executor.run_all(params);
    assert(report.stop_reason == StopReason::BusinessRejection);
    assert(report.results.size() == 2);
    assert(report.rejection()->error_code() == BuiltinErrors::BelowMinimum);

    std::cout << "  built-in batch short-circuits: OK\n";
}

void test_registration_twice_fails() {
    auto config = std::make_shared<JsonRuleConfig>();
    RuleRegistry registry;
    register_builtin_rules(registry, config);

    bool threw = false;
    try {
        register_builtin_rules(registry, config);
    } catch (const std::system_error& e) {
        threw = e.code() == DispatchErrc::DuplicateRegistration;
    }
    assert(threw);

    std::cout << "  builtin double registration rejected: OK\n";
}

} // anonymous namespace

int main() {
    std::cout << "Built-in rule tests\n";
    test_iso_dates();
    test_range_check();
    test_date_window();
    test_required_text();
    test_not_enforced_is_empty();
    test_config_override_while_dispatching();
    test_config_shape_errors();
    test_config_from_file();
    test_parameter_factory();
    test_builtin_batch();
    test_registration_twice_fails();
    std::cout << "All built-in rule tests passed\n";
    return 0;
}
