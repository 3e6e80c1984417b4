/**
 * \file dispatcher/DispatcherOptions.hpp
 * \brief Option accessors and the assembled configuration of the dispatcher process.
 */
#pragma once

#include "dispatch/DispatchConfig.hpp"
#include "transport/amqp/AmqpConsumer.hpp"
#include "logger.hpp"

#include <optional>
#include <string>

namespace Hare {

/** \brief Everything the dispatcher process needs, with no CLI11 types. */
struct DispatcherConfig {
    Dispatch::DispatchConfig dispatch;        ///< Loop settings.
    Transport::Amqp::AmqpSettings amqp;       ///< Broker connection; prefetch follows max concurrency.
    std::optional<std::string> log_destination; ///< Log file; stdout when unset.
    LogLevel log_level{LogLevel::Debug};
};

namespace dispatcher_opts {
    std::string get_script_root();
    std::string get_handler_key();
    std::optional<std::string> get_log_destination();
    std::string get_log_level();
    int get_max_concurrent();
    int get_poll_interval_ms();
    void register_options();

    /**
     * \brief Assemble the configuration after Options::load_and_parse() succeeded.
     * \throws std::invalid_argument for values the option checks cannot catch.
     */
    DispatcherConfig collect();
}

} // namespace Hare
