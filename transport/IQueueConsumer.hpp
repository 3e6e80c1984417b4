/**
 * \file transport/IQueueConsumer.hpp
 * \brief Queue consumer role interface used by the dispatch loop.
 * \details A consumer is driven from a single thread: connect once, then
 * alternate receive() and acknowledge() calls, then close().
 */
#pragma once

#include "message/Message.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace Hare::Transport {

/** \brief Connection-level failure; the consumer is unusable afterwards. */
class QueueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief Source of messages with explicit acknowledgment. */
class IQueueConsumer {
public:
    virtual ~IQueueConsumer() = default;

    /** \brief Open the connection and start consuming. Throws QueueError. */
    virtual void connect() = 0;

    /**
     * \brief Wait up to \p timeout for the next delivery.
     * \return The message, or std::nullopt when the timeout expired first.
     * \throws QueueError when the connection is lost.
     */
    virtual std::optional<Message> receive(std::chrono::milliseconds timeout) = 0;

    /** \brief Acknowledge a delivery received on this connection. Throws QueueError. */
    virtual void acknowledge(DeliveryTag tag) = 0;

    /** \brief Close the connection; safe to call when not connected. */
    virtual void close() = 0;

    /** \brief Printable description of the remote endpoint (no credentials). */
    virtual std::string endpoint() const = 0;
};

} // namespace Hare::Transport
