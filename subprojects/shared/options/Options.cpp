#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <iostream>

namespace shared_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

static nlohmann::json& loaded_config_json_storage() {
    static nlohmann::json j; return j;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"rulegate"};
    app.set_version_flag("-V,--version", std::string{"rulegate 0.1"});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Minimal pre-parser to discover -c/--config early, so providers can take
    // their defaults from the config before the strict parse.
    CLI::App config_probe{"config_probe"};
    config_probe.set_help_flag();
    config_probe.add_option("-c,--config", config_file);
    config_probe.allow_extras(true);
    try {
        config_probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // Reported by the strict parse below.
    }

    nlohmann::json cfg_json;
    loaded_config_file_storage().reset();
    if (!config_file.empty()) {
        std::ifstream ifs(config_file);
        if (!ifs) {
            err = "cannot open config file: " + config_file;
            return ParseResult::Error;
        }
        try {
            ifs >> cfg_json;
        } catch (const nlohmann::json::parse_error& e) {
            err = "malformed config file " + config_file + ": " + e.what();
            return ParseResult::Error;
        }
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_file, ec);
        loaded_config_file_storage() = ec ? std::filesystem::path(config_file) : abs;
    }
    loaded_config_json_storage() = cfg_json;

    try {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto &ph : providers()) {
            if (ph.cb) ph.cb(app, cfg_json);
        }
    } catch (const std::invalid_argument &e) {
        // Providers reject config values that their CLI checks would not accept
        err = std::string{"invalid config file "} + config_file + ": " + e.what();
        return ParseResult::Error;
    }

    app.allow_extras(false);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

const nlohmann::json& Options::get_config_json() {
    return loaded_config_json_storage();
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

}
