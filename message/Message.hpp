// Message.hpp - Queue delivery as seen by the dispatcher
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \defgroup message_module Message Module
 * \brief Transport-neutral representation of queue deliveries.
 */

/**
 * \file message/Message.hpp
 * \brief Header list and delivery record shared by transports and the dispatch core.
 * \ingroup message_module
 */

namespace Hare {

/**
 * \brief Message headers in the order the transport delivered them.
 *
 * Keys are case-sensitive. A key may appear more than once; lookups
 * resolve to the last occurrence.
 */
using Headers = std::vector<std::pair<std::string, std::string>>;

/** \brief Opaque handle used to acknowledge a delivery. */
using DeliveryTag = std::uint64_t;

/** \brief Single delivery received from the queue. Body is carried but never interpreted. */
struct Message {
    Headers headers;          ///< Metadata converted to text by the transport
    std::string body;         ///< Raw payload bytes
    DeliveryTag delivery_tag{0};
};

/** \brief Last value stored under \p key, if any. */
inline std::optional<std::string_view> find_header(const Headers& headers, std::string_view key) {
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (it->first == key) return std::string_view{it->second};
    }
    return std::nullopt;
}

} // namespace Hare
