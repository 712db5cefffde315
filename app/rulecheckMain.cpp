/**
 * \file app/rulecheckMain.cpp
 * \brief Entrypoint for rulecheck: evaluates a JSON batch against the built-in rules.
 *
 * Exit codes: 0 all passed, 1 unexpected error, 2 option or input error,
 * 3 business-rule rejection, 4 dispatch failure.
 */

#include "RulecheckOptions.hpp"
#include "rules/batch/BatchExecutor.hpp"
#include "rules/builtins/BuiltinRules.hpp"
#include "rules/builtins/ParameterFactory.hpp"
#include "rules/config/JsonRuleConfig.hpp"
#include "rules/dispatch/Dispatcher.hpp"
#include "rules/registry/RuleRegistry.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitRejected = 3;
constexpr int kExitDispatchFailure = 4;

nlohmann::json load_batch(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::invalid_argument("cannot open batch file: " + path);
    }
    try {
        nlohmann::json j;
        ifs >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("malformed batch file " + path + ": " + e.what());
    }
}

void print_report(const RuleGate::Rules::BatchReport& report, size_t total) {
    for (size_t i = 0; i < report.results.size(); ++i) {
        const auto& r = report.results[i];
        std::cout << (r.success() ? "PASS  " : "FAIL  ");
        if (!r.success()) {
            std::cout << "[" << to_string(r.failure_reason()) << " " << r.error_code() << "] ";
        }
        std::cout << r.message() << "\n";
    }
    std::cout << "evaluated " << report.evaluated << " of " << total
              << ", stop: " << to_string(report.stop_reason) << "\n";
    if (report.error) {
        std::cout << "error: " << report.error->describe() << "\n";
    }
}

} // anonymous namespace

/** \brief Entrypoint for the rulecheck binary. */
int main(int argc, char* argv[]) {
    using namespace RuleGate::Rules;
    try {
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return kExitOk;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "rulecheck option parse error: " << opt_err << std::endl;
            return kExitUsage;
        }

        namespace ro = rulegate::rulecheck_opts;
        RulecheckOptions opts;
        opts.batch_file = ro::get_batch_file().value_or("");
        opts.deadline = std::chrono::milliseconds{ro::get_deadline_ms().value_or(0)};
        opts.log_level = ro::get_log_level().value_or("warning");

        auto logger = std::make_shared<Logger>("rulecheck");
        auto sink = std::make_shared<StderrSink>();
        sink->set_level(parse_log_level(opts.log_level).value_or(LogLevel::Warning));
        logger->add_sink(sink);

        std::shared_ptr<const IRuleConfigSource> rule_config;
        ParameterList params;
        try {
            rule_config = std::make_shared<JsonRuleConfig>(shared_opts::Options::get_config_json());
            params = ParameterFactory{}.build_all(load_batch(opts.batch_file));
        } catch (const std::invalid_argument& e) {
            std::cerr << "rulecheck input error: " << e.what() << std::endl;
            return kExitUsage;
        }

        // Setup phase: any registry error aborts initialization
        RuleRegistry registry(logger);
        try {
            register_builtin_rules(registry, rule_config);
            registry.seal(kBuiltinRuleTags);
        } catch (const std::system_error& e) {
            logger->critical(std::string{"Rule registry setup failed: "} + e.what());
            return kExitError;
        }
        logger->info("Registered rules: " + std::to_string(registry.rule_count()));

        Dispatcher dispatcher(registry, logger, opts.deadline);
        BatchExecutor executor(dispatcher, logger);

        auto report = executor.run_all(params);
        print_report(report, params.size());

        switch (report.stop_reason) {
            case StopReason::Completed:         return kExitOk;
            case StopReason::BusinessRejection: return kExitRejected;
            case StopReason::DispatchFailure:   return kExitDispatchFailure;
        }
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "rulecheck error: " << e.what() << std::endl;
        return kExitError;
    }
}
