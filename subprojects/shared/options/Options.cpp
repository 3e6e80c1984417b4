#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>

namespace shared_opts {

namespace {

struct Registry {
    std::vector<Options::Provider> providers;
    // Absolute path of the config file loaded by the last parse, if any
    std::optional<std::filesystem::path> config_file;
};

Registry& registry() {
    static Registry r;
    return r;
}

// Value of -c/--config, if given. Everything else is left for the real parse.
std::string peek_config_path(int argc, char** argv) {
    std::string path;
    CLI::App peek{"config_peek"};
    peek.add_option("-c,--config", path);
    peek.allow_extras(true);
    peek.set_help_flag();
    try {
        peek.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // Reported again, with full context, by the strict parse.
    }
    return path;
}

bool load_config(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream ifs(path);
    if (!ifs) {
        err = "cannot open config file '" + path + "'";
        return false;
    }
    try {
        ifs >> out;
    } catch (const nlohmann::json::parse_error& e) {
        err = "malformed config file '" + path + "': " + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "config file '" + path + "' must contain a JSON object";
        return false;
    }
    return true;
}

} // namespace

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    registry().providers.push_back(std::move(p));
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    auto& reg = registry();
    reg.config_file.reset();

    // The JSON config supplies option defaults, so it is read before any
    // provider registers its options.
    const std::string config_path = peek_config_path(argc, argv);
    nlohmann::json cfg_json = nlohmann::json::object();
    if (!config_path.empty()) {
        if (!load_config(config_path, cfg_json, err)) return ParseResult::Error;
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_path, ec);
        reg.config_file = ec ? std::filesystem::path(config_path) : abs;
    }

    CLI::App app{"hare - run handler scripts for queue messages"};
    app.set_version_flag("-V,--version", std::string{"hare 0.1.0"});
    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");
    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto& provider : reg.providers) {
            if (provider) provider(app, cfg_json);
        }
    }

    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion& v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const CLI::ParseError& e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    const auto& file = registry().config_file;
    if (file && file->has_parent_path()) return file->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return registry().config_file;
}

}
