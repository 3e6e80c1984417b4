/**
 * \file transport/amqp/AmqpHeaders.hpp
 * \brief Conversion of AMQP header tables into dispatcher header lists.
 * \ingroup amqp_backend
 */
#pragma once

#include "message/Message.hpp"

#include <optional>
#include <string>

#include <rabbitmq-c/amqp.h>

namespace Hare::Transport::Amqp {

/**
 * \brief Text form of a scalar AMQP field value.
 *
 * Booleans become `true`/`false`; integers of every width and sign, floats,
 * doubles and timestamps use their decimal form; decimals contribute their
 * unscaled value; short and long strings are copied. Nested tables, arrays,
 * byte arrays and void yield std::nullopt.
 */
[[nodiscard]] std::optional<std::string> field_value_to_string(const amqp_field_value_t& value);

/** \brief Convert a header table, keeping entry order and dropping non-scalar values. */
[[nodiscard]] Headers headers_from_table(const amqp_table_t& table);

} // namespace Hare::Transport::Amqp
