/**
 * \file dispatch/DispatchLoop.cpp
 * \brief Implementation of the message dispatch cycle.
 */
#include "DispatchLoop.hpp"
#include "HeaderMapper.hpp"
#include "process/IProcessInvoker.hpp"
#include "transport/IQueueConsumer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace Hare::Dispatch {

namespace {
// Receive slice while invocations are running, so completions are acked promptly
constexpr std::chrono::milliseconds kCompletionPoll{100};
}

DispatchLoop::DispatchLoop(DispatchConfig config,
                           Transport::IQueueConsumer& consumer,
                           Process::IProcessInvoker& invoker,
                           std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , resolver_(config_.handler_key, config_.script_root)
    , consumer_(consumer)
    , invoker_(invoker)
    , logger_(std::move(logger))
{
    if (config_.max_concurrent_invocations == 0) {
        throw std::invalid_argument("DispatchLoop: max_concurrent_invocations must be at least 1");
    }
    if (config_.poll_interval.count() <= 0) {
        throw std::invalid_argument("DispatchLoop: poll_interval must be positive");
    }
    if (config_.max_concurrent_invocations > 1) {
        pool_ = std::make_unique<InvocationPool>(config_.max_concurrent_invocations, logger_);
    }
}

void DispatchLoop::request_shutdown() noexcept {
    shutdown_requested_.store(true, std::memory_order_relaxed);
}

void DispatchLoop::run() {
    state_.store(State::Connecting, std::memory_order_relaxed);
    if (logger_) logger_->info("Connecting to " + consumer_.endpoint());

    try {
        consumer_.connect();
    } catch (const Transport::QueueError& e) {
        state_.store(State::ShuttingDown, std::memory_order_relaxed);
        if (logger_) logger_->error(std::string{"Queue connection failed: "} + e.what());
        throw;
    }

    state_.store(State::Consuming, std::memory_order_relaxed);
    if (logger_) {
        logger_->info("Consuming: handler key '" + config_.handler_key + "', script root '" +
                      config_.script_root.string() + "', max concurrent invocations " +
                      std::to_string(config_.max_concurrent_invocations));
    }

    try {
        consume();
        state_.store(State::ShuttingDown, std::memory_order_relaxed);
        if (logger_ && in_flight_ > 0) {
            logger_->info("Shutdown requested; waiting for " + std::to_string(in_flight_) + " running handler(s)");
        }
        finish_in_flight(true);
    } catch (const Transport::QueueError& e) {
        state_.store(State::ShuttingDown, std::memory_order_relaxed);
        if (logger_) logger_->error(std::string{"Queue connection lost: "} + e.what());
        // Nothing can be acknowledged any more; the broker redelivers these
        finish_in_flight(false);
        consumer_.close();
        log_summary();
        throw;
    }

    consumer_.close();
    log_summary();
}

void DispatchLoop::consume() {
    while (!shutdown_requested_.load(std::memory_order_relaxed)) {
        drain_completions(in_flight_ >= config_.max_concurrent_invocations);
        if (shutdown_requested_.load(std::memory_order_relaxed)) break;

        auto timeout = in_flight_ > 0 ? (std::min)(config_.poll_interval, kCompletionPoll) : config_.poll_interval;
        auto message = consumer_.receive(timeout);
        if (!message) continue;

        ++stats_.received;
        handle(*message);
    }
}

void DispatchLoop::handle(const Message& message) {
    auto resolved = resolver_.resolve(message.headers);
    if (!resolved) {
        settle(message.delivery_tag, skipped(message.headers));
        return;
    }
    if (!pool_) {
        settle(message.delivery_tag, invoke(*resolved, message.headers));
        return;
    }

    ++in_flight_;
    pool_->enqueue([this, tag = message.delivery_tag, handler = std::move(*resolved), headers = message.headers] {
        completions_.push(Completion{tag, invoke(handler, headers)});
    });
}

DispatchOutcome DispatchLoop::dispatch(const Message& message) {
    auto resolved = resolver_.resolve(message.headers);
    if (!resolved) return skipped(message.headers);
    return invoke(*resolved, message.headers);
}

DispatchOutcome DispatchLoop::skipped(const Headers& headers) const {
    auto value = find_header(headers, config_.handler_key);
    if (!value) return Skipped{SkipReason::MissingHandler, {}};
    return Skipped{SkipReason::InvalidHandler, std::string(*value)};
}

DispatchOutcome DispatchLoop::invoke(const ResolvedHandler& handler, const Headers& headers) {
    std::error_code ec;
    Process::ExitStatus status;
    // Pool jobs must always produce a completion
    try {
        auto overlay = HeaderMapper::build(headers);
        if (logger_) {
            logger_->debug("Running " + handler.script.string() + " for handler '" + handler.name + "' with " +
                           std::to_string(overlay.size()) + " header variable(s)");
        }
        status = invoker_.invoke(handler.script, overlay, ec);
    } catch (const std::system_error& e) {
        ec = e.code();
    } catch (const std::bad_alloc&) {
        ec = std::make_error_code(std::errc::not_enough_memory);
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Invoker failed for " + handler.script.string() + ": " + e.what());
        ec = std::make_error_code(std::errc::io_error);
    }

    if (ec) return InvocationFailed{handler.name, handler.script, ec};
    return Invoked{handler.name, handler.script, status};
}

void DispatchLoop::settle(DeliveryTag tag, const DispatchOutcome& outcome) {
    if (std::holds_alternative<Skipped>(outcome)) {
        ++stats_.skipped;
    } else if (const auto* invoked = std::get_if<Invoked>(&outcome)) {
        ++stats_.invoked;
        if (!invoked->status.success()) ++stats_.failed_exits;
    } else {
        ++stats_.invocation_errors;
    }

    if (logger_) {
        auto event = to_event(outcome, std::chrono::system_clock::now());
        logger_->log(outcome_level(outcome),
                     "dispatch " + event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    if (should_acknowledge(outcome)) {
        consumer_.acknowledge(tag);
        ++stats_.acknowledged;
    }
}

void DispatchLoop::drain_completions(bool wait_for_one) {
    if (wait_for_one && in_flight_ > 0) {
        if (auto done = completions_.pop()) {
            --in_flight_;
            settle(done->tag, done->outcome);
        }
    }
    while (auto done = completions_.try_pop()) {
        --in_flight_;
        settle(done->tag, done->outcome);
    }
}

void DispatchLoop::finish_in_flight(bool acknowledge) {
    while (in_flight_ > 0) {
        auto done = completions_.pop();
        if (!done) break;
        --in_flight_;
        if (acknowledge) {
            settle(done->tag, done->outcome);
        } else if (logger_) {
            logger_->warning(std::string{"Handler finished after connection loss ("} + outcome_name(done->outcome) +
                             "); delivery " + std::to_string(done->tag) + " left unacknowledged");
        }
    }
}

void DispatchLoop::log_summary() {
    if (!logger_) return;
    logger_->info("Dispatch summary: received=" + std::to_string(stats_.received) +
                  " skipped=" + std::to_string(stats_.skipped) +
                  " invoked=" + std::to_string(stats_.invoked) +
                  " failed_exits=" + std::to_string(stats_.failed_exits) +
                  " invocation_errors=" + std::to_string(stats_.invocation_errors) +
                  " acknowledged=" + std::to_string(stats_.acknowledged));
}

} // namespace Hare::Dispatch
