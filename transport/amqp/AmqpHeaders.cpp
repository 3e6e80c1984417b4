/**
 * \file transport/amqp/AmqpHeaders.cpp
 * \brief AMQP field-table to header-list conversion.
 * \ingroup amqp_backend
 */
#include "AmqpHeaders.hpp"

#include <charconv>
#include <system_error>

namespace Hare::Transport::Amqp {

namespace {

template <typename T>
std::string format_number(T value) {
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf, end);
}

std::string to_string(const amqp_bytes_t& bytes) {
    if (bytes.len == 0 || bytes.bytes == nullptr) return {};
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

} // namespace

std::optional<std::string> field_value_to_string(const amqp_field_value_t& value) {
    switch (value.kind) {
        case AMQP_FIELD_KIND_BOOLEAN:   return value.value.boolean ? "true" : "false";
        case AMQP_FIELD_KIND_I8:        return format_number(static_cast<int>(value.value.i8));
        case AMQP_FIELD_KIND_U8:        return format_number(static_cast<unsigned>(value.value.u8));
        case AMQP_FIELD_KIND_I16:       return format_number(value.value.i16);
        case AMQP_FIELD_KIND_U16:       return format_number(value.value.u16);
        case AMQP_FIELD_KIND_I32:       return format_number(value.value.i32);
        case AMQP_FIELD_KIND_U32:       return format_number(value.value.u32);
        case AMQP_FIELD_KIND_I64:       return format_number(value.value.i64);
        case AMQP_FIELD_KIND_U64:       return format_number(value.value.u64);
        case AMQP_FIELD_KIND_F32:       return format_number(value.value.f32);
        case AMQP_FIELD_KIND_F64:       return format_number(value.value.f64);
        case AMQP_FIELD_KIND_DECIMAL:   return format_number(value.value.decimal.value);
        case AMQP_FIELD_KIND_TIMESTAMP: return format_number(value.value.u64);
        case AMQP_FIELD_KIND_UTF8:      return to_string(value.value.bytes);
        case AMQP_FIELD_KIND_ARRAY:
        case AMQP_FIELD_KIND_TABLE:
        case AMQP_FIELD_KIND_BYTES:
        case AMQP_FIELD_KIND_VOID:
        default:
            return std::nullopt;
    }
}

Headers headers_from_table(const amqp_table_t& table) {
    Headers headers;
    if (table.num_entries <= 0 || table.entries == nullptr) return headers;
    headers.reserve(static_cast<std::size_t>(table.num_entries));
    for (int i = 0; i < table.num_entries; ++i) {
        const amqp_table_entry_t& entry = table.entries[i];
        if (auto text = field_value_to_string(entry.value)) {
            headers.emplace_back(to_string(entry.key), std::move(*text));
        }
    }
    return headers;
}

} // namespace Hare::Transport::Amqp
