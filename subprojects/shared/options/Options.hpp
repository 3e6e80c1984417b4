#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <type_traits>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Directory of the loaded config file (if any). Useful for resolving relative paths in providers.
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

/**
 * \brief Read `j[section][key]` as T, falling back when the section, key, or type is missing.
 *
 * Used by option providers to turn the JSON config into CLI defaults.
 */
template <typename T>
T config_value(const nlohmann::json& j, const char* section, const char* key, T fallback) {
    if (!j.is_object() || !j.contains(section) || !j[section].is_object()) return fallback;
    const auto& s = j[section];
    if (!s.contains(key)) return fallback;
    const auto& v = s[key];
    if constexpr (std::is_same_v<T, bool>) {
        if (v.is_boolean()) return v.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        if (v.is_number_integer()) return v.get<T>();
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (v.is_string()) return v.get<std::string>();
    }
    return fallback;
}

/** \brief Optional variant of config_value for settings without a built-in default. */
inline std::optional<std::string> config_string(const nlohmann::json& j, const char* section, const char* key) {
    if (!j.is_object() || !j.contains(section) || !j[section].is_object()) return std::nullopt;
    const auto& s = j[section];
    if (s.contains(key) && s[key].is_string()) return s[key].get<std::string>();
    return std::nullopt;
}
}
