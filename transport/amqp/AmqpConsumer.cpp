/**
 * \file transport/amqp/AmqpConsumer.cpp
 * \brief rabbitmq-c implementation of the queue consumer.
 * \ingroup amqp_backend
 */
#include "AmqpConsumer.hpp"
#include "AmqpHeaders.hpp"
#include "logger.hpp"

#include <rabbitmq-c/tcp_socket.h>

#include <stdexcept>
#include <string>
#include <sys/time.h>
#include <utility>
#include <vector>

namespace Hare::Transport::Amqp {

namespace {

constexpr amqp_channel_t kChannel = 1;

std::string bytes_to_string(const amqp_bytes_t& bytes) {
    if (bytes.len == 0 || bytes.bytes == nullptr) return {};
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

std::string describe_close(std::uint16_t code, const amqp_bytes_t& text) {
    return std::to_string(code) + " " + bytes_to_string(text);
}

std::string describe_reply(const amqp_rpc_reply_t& reply) {
    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return "ok";
        case AMQP_RESPONSE_NONE:
            return "missing RPC reply";
        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return amqp_error_string2(reply.library_error);
        case AMQP_RESPONSE_SERVER_EXCEPTION:
            if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
                const auto* m = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
                return "server connection error " + describe_close(m->reply_code, m->reply_text);
            }
            if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
                const auto* m = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
                return "server channel error " + describe_close(m->reply_code, m->reply_text);
            }
            return "unknown server error, method id " + std::to_string(reply.reply.id);
    }
    return "unknown reply type";
}

} // namespace

AmqpConsumer::AmqpConsumer(AmqpSettings settings, std::shared_ptr<Logger> logger)
    : settings_(std::move(settings))
    , logger_(std::move(logger))
{
    if (settings_.queue.empty()) {
        throw std::invalid_argument("AMQP queue name must not be empty");
    }
    if (settings_.prefetch == 0) {
        throw std::invalid_argument("AMQP prefetch must be at least 1");
    }

    // amqp_parse_url rewrites the buffer in place and points into it
    std::vector<char> buf(settings_.url.begin(), settings_.url.end());
    buf.push_back('\0');
    amqp_connection_info info;
    amqp_default_connection_info(&info);
    if (amqp_parse_url(buf.data(), &info) != AMQP_STATUS_OK) {
        throw std::invalid_argument("invalid AMQP URL '" + settings_.url + "'");
    }
    if (info.ssl) {
        throw std::invalid_argument("amqps:// is not supported; use a plain amqp:// URL");
    }
    host_ = info.host;
    port_ = info.port;
    user_ = info.user;
    password_ = info.password;
    vhost_ = info.vhost;
}

AmqpConsumer::~AmqpConsumer() {
    close();
}

void AmqpConsumer::check_reply(const amqp_rpc_reply_t& reply, const char* context) {
    if (reply.reply_type == AMQP_RESPONSE_NORMAL) return;
    throw QueueError(std::string{context} + " failed on " + endpoint() + ": " + describe_reply(reply));
}

void AmqpConsumer::connect() {
    if (conn_) return;

    conn_ = amqp_new_connection();
    if (!conn_) throw QueueError("cannot allocate AMQP connection");

    try {
        amqp_socket_t* socket = amqp_tcp_socket_new(conn_);
        if (!socket) throw QueueError("cannot create TCP socket for " + endpoint());

        int rc = amqp_socket_open(socket, host_.c_str(), port_);
        if (rc != AMQP_STATUS_OK) {
            throw QueueError("cannot connect to " + endpoint() + ": " + amqp_error_string2(rc));
        }

        check_reply(amqp_login(conn_, vhost_.c_str(), 0, AMQP_DEFAULT_FRAME_SIZE, 0,
                               AMQP_SASL_METHOD_PLAIN, user_.c_str(), password_.c_str()),
                    "login");
        logged_in_ = true;

        amqp_channel_open(conn_, kChannel);
        check_reply(amqp_get_rpc_reply(conn_), "channel.open");
        channel_open_ = true;

        amqp_basic_qos(conn_, kChannel, 0, settings_.prefetch, 0);
        check_reply(amqp_get_rpc_reply(conn_), "basic.qos");

        amqp_basic_consume(conn_, kChannel,
                           amqp_cstring_bytes(settings_.queue.c_str()),
                           amqp_cstring_bytes(settings_.consumer_tag.c_str()),
                           0 /* no_local */, 0 /* no_ack */, 0 /* exclusive */,
                           amqp_empty_table);
        check_reply(amqp_get_rpc_reply(conn_), "basic.consume");
    } catch (const QueueError&) {
        close();
        throw;
    }

    if (logger_) {
        logger_->debug("Consuming from queue '" + settings_.queue + "' as '" + settings_.consumer_tag +
                       "' with prefetch " + std::to_string(settings_.prefetch));
    }
}

std::optional<Message> AmqpConsumer::receive(std::chrono::milliseconds timeout) {
    if (!conn_) throw QueueError("receive on closed AMQP connection");

    amqp_maybe_release_buffers(conn_);

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    amqp_envelope_t envelope;
    amqp_rpc_reply_t res = amqp_consume_message(conn_, &envelope, &tv, 0);

    if (res.reply_type == AMQP_RESPONSE_NORMAL) {
        Message message;
        try {
            message = to_message(envelope);
        } catch (...) {
            amqp_destroy_envelope(&envelope);
            throw;
        }
        amqp_destroy_envelope(&envelope);
        return message;
    }

    if (res.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
        if (res.library_error == AMQP_STATUS_TIMEOUT) return std::nullopt;
        if (res.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
            // A method frame other than basic.deliver arrived
            handle_unexpected_frame();
            return std::nullopt;
        }
    }
    throw QueueError("consume failed on " + endpoint() + ": " + describe_reply(res));
}

Message AmqpConsumer::to_message(const amqp_envelope_t& envelope) {
    Message message;
    message.delivery_tag = envelope.delivery_tag;
    message.body = bytes_to_string(envelope.message.body);
    if (envelope.message.properties._flags & AMQP_BASIC_HEADERS_FLAG) {
        message.headers = headers_from_table(envelope.message.properties.headers);
    } else if (logger_) {
        logger_->info("No headers found");
    }
    return message;
}

void AmqpConsumer::handle_unexpected_frame() {
    amqp_frame_t frame;
    int rc = amqp_simple_wait_frame(conn_, &frame);
    if (rc != AMQP_STATUS_OK) {
        throw QueueError("reading frame from " + endpoint() + ": " + amqp_error_string2(rc));
    }
    if (frame.frame_type != AMQP_FRAME_METHOD) return;

    switch (frame.payload.method.id) {
        case AMQP_CHANNEL_CLOSE_METHOD: {
            const auto* m = static_cast<const amqp_channel_close_t*>(frame.payload.method.decoded);
            channel_open_ = false;
            throw QueueError("channel closed by broker: " + describe_close(m->reply_code, m->reply_text));
        }
        case AMQP_CONNECTION_CLOSE_METHOD: {
            const auto* m = static_cast<const amqp_connection_close_t*>(frame.payload.method.decoded);
            channel_open_ = false;
            logged_in_ = false;
            throw QueueError("connection closed by broker: " + describe_close(m->reply_code, m->reply_text));
        }
        default:
            if (logger_) {
                logger_->warning("Ignoring unexpected AMQP method " + std::to_string(frame.payload.method.id));
            }
            return;
    }
}

void AmqpConsumer::acknowledge(DeliveryTag tag) {
    if (!conn_) throw QueueError("acknowledge on closed AMQP connection");
    int rc = amqp_basic_ack(conn_, kChannel, tag, 0);
    if (rc != AMQP_STATUS_OK) {
        throw QueueError("basic.ack of delivery " + std::to_string(tag) + " failed: " + amqp_error_string2(rc));
    }
}

void AmqpConsumer::close() {
    if (!conn_) return;

    if (channel_open_) {
        amqp_rpc_reply_t r = amqp_channel_close(conn_, kChannel, AMQP_REPLY_SUCCESS);
        if (r.reply_type != AMQP_RESPONSE_NORMAL && logger_) {
            logger_->debug("channel.close: " + describe_reply(r));
        }
        channel_open_ = false;
    }
    if (logged_in_) {
        amqp_rpc_reply_t r = amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
        if (r.reply_type != AMQP_RESPONSE_NORMAL && logger_) {
            logger_->debug("connection.close: " + describe_reply(r));
        }
        logged_in_ = false;
    }
    int rc = amqp_destroy_connection(conn_);
    if (rc != AMQP_STATUS_OK && logger_) {
        logger_->debug(std::string{"destroying AMQP connection: "} + amqp_error_string2(rc));
    }
    conn_ = nullptr;
}

std::string AmqpConsumer::endpoint() const {
    return "amqp://" + host_ + ":" + std::to_string(port_) + " (vhost '" + vhost_ + "', queue '" +
           settings_.queue + "')";
}

} // namespace Hare::Transport::Amqp
