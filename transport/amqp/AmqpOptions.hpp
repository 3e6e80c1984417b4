/**
 * \file transport/amqp/AmqpOptions.hpp
 * \brief CLI/config options for the AMQP connection.
 * \ingroup amqp_backend
 * \details Values come from `--amqp-url`/`--queue`/`--consumer-tag`, the
 * `HARE_AMQP_URL`/`HARE_AMQP_QUEUE` environment variables, or the `amqp`
 * section of the JSON config, in that order of precedence.
 */
#pragma once

#include "AmqpConsumer.hpp"

#include <string>

namespace Hare::Transport::amqp_opts {
/** \brief Register CLI/config options for the AMQP connection (idempotent). */
void register_options();
std::string get_url();
std::string get_queue();
std::string get_consumer_tag();
/** \brief Settings assembled from the parsed options; prefetch is left at its default. */
AmqpSettings settings();
} // namespace Hare::Transport::amqp_opts
