/**
 * \file dispatcher/DispatcherOptions.cpp
 * \brief CLI, environment and JSON config options of the dispatcher.
 */

#include "DispatcherOptions.hpp"
#include "transport/amqp/AmqpOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <string>

namespace Hare { namespace dispatcher_opts {

/// Directory holding handler scripts.
static std::string g_script_root;
/// Header whose value names the handler.
static std::string g_handler_key;
/// Log file; empty means stdout.
static std::string g_log_destination;
static std::string g_log_level;
static int g_max_concurrent{1};
static int g_poll_interval_ms{1000};

std::string get_script_root() { return g_script_root; }
std::string get_handler_key() { return g_handler_key; }
std::optional<std::string> get_log_destination() {
    if (g_log_destination.empty()) return std::nullopt;
    return g_log_destination;
}
std::string get_log_level() { return g_log_level; }
int get_max_concurrent() { return g_max_concurrent; }
int get_poll_interval_ms() { return g_poll_interval_ms; }

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        const Dispatch::DispatchConfig defaults;

        g_script_root = defaults.script_root.string();
        if (auto from_json = shared_opts::config_string(j, "dispatcher", "script_root")) {
            // Relative to the config file, not the working directory
            std::filesystem::path root{*from_json};
            auto dir = shared_opts::Options::get_config_dir();
            g_script_root = (root.is_relative() && dir) ? (*dir / root).string() : root.string();
        }
        app.add_option("--script-root", g_script_root, "Directory containing handler scripts")
            ->envname("HARE_SCRIPT_ROOT")
            ->capture_default_str()
            ->group("Dispatcher");

        g_handler_key = shared_opts::config_value(j, "dispatcher", "handler_key", defaults.handler_key);
        app.add_option("--handler-key", g_handler_key, "Message header naming the handler")
            ->envname("HARE_HANDLER_KEY")
            ->capture_default_str()
            ->group("Dispatcher");

        g_log_destination = shared_opts::config_string(j, "dispatcher", "log_destination").value_or("");
        app.add_option("--log-destination", g_log_destination, "Append logs to this file instead of stdout")
            ->envname("HARE_LOG_DESTINATION")
            ->group("Dispatcher");

        g_log_level = shared_opts::config_value(j, "dispatcher", "log_level", std::string{"debug"});
        app.add_option("--log-level", g_log_level, "Minimum log level: debug|info|warning|error|critical")
            ->envname("HARE_LOG_LEVEL")
            ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}))
            ->capture_default_str()
            ->group("Dispatcher");

        g_max_concurrent = shared_opts::config_value(j, "dispatcher", "max_concurrent",
                                                     static_cast<int>(defaults.max_concurrent_invocations));
        app.add_option("--max-concurrent", g_max_concurrent, "Handlers allowed to run at the same time")
            ->envname("HARE_MAX_CONCURRENT")
            ->check(CLI::Range(1, 256))
            ->capture_default_str()
            ->group("Dispatcher");

        g_poll_interval_ms = shared_opts::config_value(j, "dispatcher", "poll_interval_ms",
                                                       static_cast<int>(defaults.poll_interval.count()));
        app.add_option("--poll-interval-ms", g_poll_interval_ms, "Receive timeout between shutdown checks")
            ->check(CLI::Range(1, 60000))
            ->capture_default_str()
            ->group("Dispatcher");
    });
}

DispatcherConfig collect() {
    DispatcherConfig cfg;

    const auto handler_key = get_handler_key();
    if (handler_key.empty()) {
        throw std::invalid_argument("handler key must not be empty");
    }
    const auto script_root = get_script_root();
    if (script_root.empty()) {
        throw std::invalid_argument("script root must not be empty");
    }
    // JSON values bypass the CLI11 validators
    const int max_concurrent = get_max_concurrent();
    if (max_concurrent < 1 || max_concurrent > 256) {
        throw std::invalid_argument("max concurrent invocations must be within [1, 256], got " +
                                    std::to_string(max_concurrent));
    }
    const int poll_interval_ms = get_poll_interval_ms();
    if (poll_interval_ms < 1) {
        throw std::invalid_argument("poll interval must be positive, got " + std::to_string(poll_interval_ms));
    }
    const auto level_name = get_log_level();
    auto level = parse_log_level(level_name);
    if (!level) {
        throw std::invalid_argument("unknown log level '" + level_name + "'");
    }

    cfg.dispatch.script_root = script_root;
    cfg.dispatch.handler_key = handler_key;
    cfg.dispatch.max_concurrent_invocations = static_cast<std::size_t>(max_concurrent);
    cfg.dispatch.poll_interval = std::chrono::milliseconds(poll_interval_ms);

    cfg.amqp = Transport::amqp_opts::settings();
    cfg.amqp.prefetch = static_cast<std::uint16_t>(max_concurrent);

    cfg.log_destination = get_log_destination();
    cfg.log_level = *level;
    return cfg;
}

} } // namespace Hare::dispatcher_opts

namespace {
    struct DispatcherOptsAutoReg {
        DispatcherOptsAutoReg() { Hare::dispatcher_opts::register_options(); }
    } dispatcher_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
