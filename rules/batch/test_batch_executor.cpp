/**
 * @file test_batch_executor.cpp
 * @brief Short-circuit semantics of BatchExecutor::run_all.
 *
 * Call-counting handlers verify that entries after an exit point are never
 * dispatched.
 */

#include "rules/batch/BatchExecutor.hpp"
#include "rules/dispatch/Dispatcher.hpp"
#include "rules/handlers/TypedRuleHandler.hpp"
#include "rules/registry/RuleRegistry.hpp"
#include "logger.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <utility>

using namespace RuleGate::Rules;

namespace {

/// Expected behaviour of the handler, chosen per parameter object.
enum class Script { Pass, Reject, ValidationFail, Empty, Fail };

struct ScriptedParams : TaggedParameters<RuleTags::FirstUserTag + 20> {
    ScriptedParams(std::string n, Script s) : name(std::move(n)), script(s) {}
    std::string name;
    Script script;
};

struct OrphanParams : TaggedParameters<RuleTags::FirstUserTag + 21> {
    explicit OrphanParams(std::string n) : name(std::move(n)) {}
    std::string name;
};

struct Fixture {
    std::shared_ptr<VectorSink> sink = std::make_shared<VectorSink>();
    std::shared_ptr<Logger> logger = std::make_shared<Logger>("test");
    RuleRegistry registry{logger};
    std::map<std::string, int> calls;

    Fixture() {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);

        registry.register_rule(make_rule_handler<ScriptedParams>("Scripted", [this](const ScriptedParams& p) {
            ++calls[p.name];
            switch (p.script) {
                case Script::Pass:
                    return Outcome::produced(RuleResult::pass(p.name));
                case Script::Reject:
                    return Outcome::produced(RuleResult::reject(p.name, 1));
                case Script::ValidationFail:
                    return Outcome::produced(RuleResult::fail(p.name, 2, FailureReason::Validation));
                case Script::Empty:
                    return Outcome::empty();
                case Script::Fail:
                    break;
            }
            return Outcome::failed(DispatchErrc::HandlerException, ScriptedParams::kTag, p.name);
        }));
        registry.seal();
    }

    int count(const std::string& name) const {
        auto it = calls.find(name);
        return it == calls.end() ? 0 : it->second;
    }
};

ParameterList make_list(std::initializer_list<std::pair<const char*, Script>> entries) {
    ParameterList list;
    for (const auto& [name, script] : entries) {
        list.push_back(std::make_unique<ScriptedParams>(name, script));
    }
    return list;
}

void test_empty_batch() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    auto report = executor.run_all(ParameterList{});
    assert(report.results.empty());
    assert(!report.error);
    assert(report.completed());
    assert(report.evaluated == 0);

    std::cout << "  empty batch: OK\n";
}

void test_stops_on_business_rejection() {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.logger);
    BatchExecutor executor(dispatcher, f.logger);

    auto report = executor.run_all(make_list({
        {"p1", Script::Pass},
        {"p2", Script::Reject},
        {"p3", Script::Pass},
    }));

    assert(report.results.size() == 2);
    assert(report.results[0].message() == "p1");
    assert(report.results[1].message() == "p2");
    assert(report.results[1].is_business_rejection());
    assert(!report.error);
    assert(report.stop_reason == StopReason::BusinessRejection);
    assert(report.rejection() == &report.results[1]);
    assert(report.evaluated == 2);
    assert(f.count("p1") == 1);
    assert(f.count("p2") == 1);
    assert(f.count("p3") == 0);

    std::cout << "  stops on business rejection: OK\n";
}

void test_stops_on_missing_handler() {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.logger);
    BatchExecutor executor(dispatcher, f.logger);

    ParameterList list;
    list.push_back(std::make_unique<ScriptedParams>("p1", Script::Pass));
    list.push_back(std::make_unique<OrphanParams>("p2"));
    list.push_back(std::make_unique<ScriptedParams>("p3", Script::Pass));

    auto report = executor.run_all(list);

    assert(report.results.size() == 1);
    assert(report.results[0].message() == "p1");
    assert(report.error.has_value());
    assert(report.error->error == DispatchErrc::HandlerNotFound);
    assert(report.error->tag == OrphanParams::kTag);
    assert(report.stop_reason == StopReason::DispatchFailure);
    assert(report.rejection() == nullptr);
    assert(f.count("p3") == 0);
    assert(f.sink->count_matching("No handler registered", LogLevel::Error) == 1);

    std::cout << "  stops on missing handler: OK\n";
}

void test_stops_on_handler_failure() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    auto report = executor.run_all(make_list({
        {"p1", Script::Fail},
        {"p2", Script::Pass},
    }));

    assert(report.results.empty());
    assert(report.error->error == DispatchErrc::HandlerException);
    assert(report.error->detail == "p1");
    assert(f.count("p2") == 0);

    std::cout << "  stops on failed outcome: OK\n";
}

void test_passes_and_empties_continue() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    auto report = executor.run_all(make_list({
        {"p1", Script::Empty},
        {"p2", Script::Pass},
        {"p3", Script::Empty},
        {"p4", Script::Pass},
    }));

    assert(report.completed());
    assert(!report.error);
    assert(report.evaluated == 4);
    assert(report.results.size() == 2);
    assert(report.results[0].message() == "p2");
    assert(report.results[1].message() == "p4");

    std::cout << "  passes and empties continue in order: OK\n";
}

void test_non_business_failure_continues() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    auto report = executor.run_all(make_list({
        {"p1", Script::ValidationFail},
        {"p2", Script::Pass},
    }));

    assert(report.completed());
    assert(report.results.size() == 2);
    assert(!report.results[0].success());
    assert(report.results[0].failure_reason() == FailureReason::Validation);
    assert(f.count("p2") == 1);

    std::cout << "  non-business failure does not stop: OK\n";
}

void test_null_entry() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    ParameterList list;
    list.push_back(std::make_unique<ScriptedParams>("p1", Script::Pass));
    list.push_back(nullptr);
    list.push_back(std::make_unique<ScriptedParams>("p3", Script::Pass));

    auto report = executor.run_all(list);
    assert(report.results.size() == 1);
    assert(report.error->error == DispatchErrc::InvalidParameters);
    assert(report.evaluated == 2);
    assert(f.count("p3") == 0);

    std::cout << "  null entry stops batch: OK\n";
}

void test_run_one() {
    Fixture f;
    Dispatcher dispatcher(f.registry);
    BatchExecutor executor(dispatcher);

    auto report = executor.run_one(ScriptedParams{"solo", Script::Reject});
    assert(report.stop_reason == StopReason::BusinessRejection);
    assert(report.results.size() == 1);

    auto empty = executor.run_one(ScriptedParams{"quiet", Script::Empty});
    assert(empty.completed());
    assert(empty.results.empty());

    std::cout << "  run_one: OK\n";
}

} // anonymous namespace

int main() {
    std::cout << "BatchExecutor tests\n";
    test_empty_batch();
    test_stops_on_business_rejection();
    test_stops_on_missing_handler();
    test_stops_on_handler_failure();
    test_passes_and_empties_continue();
    test_non_business_failure_continues();
    test_null_entry();
    test_run_one();
    std::cout << "All BatchExecutor tests passed\n";
    return 0;
}
