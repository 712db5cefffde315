/**
 * \file app/RulecheckOptions.hpp
 * \brief Option accessors for the rulecheck tool.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

/** \brief Aggregated rulecheck run configuration. */
struct RulecheckOptions {
    std::string batch_file;                        ///< JSON array of rule entries.
    std::chrono::milliseconds deadline{0};         ///< Default per-handler deadline (0 = none).
    std::string log_level{"warning"};              ///< Logger threshold.
};

/** \brief Helper API for accessing rulecheck CLI and config options. */
namespace rulegate { namespace rulecheck_opts {
    std::optional<std::string> get_batch_file();
    std::optional<int> get_deadline_ms();
    std::optional<std::string> get_log_level();
    void register_options();
} }
