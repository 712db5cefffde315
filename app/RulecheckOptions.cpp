/**
 * \file app/RulecheckOptions.cpp
 * \brief Implementation of rulecheck CLI and configuration option helpers.
 */

#include "RulecheckOptions.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace rulegate { namespace rulecheck_opts {

/// Cached batch file path from CLI or config.
static std::optional<std::string> g_batch_file;
/// Cached default handler deadline.
static std::optional<int> g_deadline_ms;
/// Cached log level name.
static std::optional<std::string> g_log_level;

std::optional<std::string> get_batch_file() { return g_batch_file; }
std::optional<int> get_deadline_ms() { return g_deadline_ms; }
std::optional<std::string> get_log_level() { return g_log_level; }

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string level_default = "warning";
        int deadline_default = 0;
        if (j.contains("rulecheck") && j["rulecheck"].is_object()) {
            const auto& r = j["rulecheck"];
            if (r.contains("batch") && r["batch"].is_string()) {
                std::string batch = r["batch"].get<std::string>();
                // Relative paths in the config are relative to the config file
                auto dir = shared_opts::Options::get_config_dir();
                if (dir && std::filesystem::path(batch).is_relative()) {
                    batch = (*dir / batch).string();
                }
                g_batch_file = batch;
            }
            // CLI11 checks only run on command-line values, so config values are checked here
            if (r.contains("deadline_ms")) {
                const auto& v = r["deadline_ms"];
                if (!v.is_number_integer() || v.get<std::int64_t>() < 0 ||
                    v.get<std::int64_t>() > std::numeric_limits<int>::max()) {
                    throw std::invalid_argument("rulecheck.deadline_ms must be an integer in [0, " +
                                                std::to_string(std::numeric_limits<int>::max()) + "]");
                }
                deadline_default = v.get<int>();
            }
            if (r.contains("log_level")) {
                const auto& v = r["log_level"];
                if (!v.is_string() || !parse_log_level(v.get<std::string>())) {
                    throw std::invalid_argument("rulecheck.log_level must be one of debug|info|warning|error|critical");
                }
                level_default = v.get<std::string>();
            }
        }
        g_deadline_ms = deadline_default;
        g_log_level = level_default;

        auto* batch_opt = app.add_option("-b,--batch", g_batch_file, "JSON file with the rule entries to evaluate")
            ->group("Rulecheck");
        if (!g_batch_file) {
            batch_opt->required();
        }
        app.add_option("--deadline-ms", g_deadline_ms, "Default per-rule deadline in milliseconds (0 = none)")
            ->check(CLI::NonNegativeNumber)
            ->group("Rulecheck");
        app.add_option("--log-level", g_log_level, "Log threshold: debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug","info","warning","error","critical"}))
            ->group("Rulecheck");
    });
}

} } // namespace rulegate::rulecheck_opts

namespace {
    struct RulecheckOptsAutoReg {
        RulecheckOptsAutoReg() { rulegate::rulecheck_opts::register_options(); }
    } rulecheck_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
