/**
 * \file dispatch/DispatchLoop.hpp
 * \brief Consumes queue messages and runs the matching handler for each.
 */
#pragma once

#include "DispatchConfig.hpp"
#include "DispatchOutcome.hpp"
#include "HandlerResolver.hpp"
#include "InvocationPool.hpp"
#include "message/Message.hpp"
#include "threadSafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

class Logger;

namespace Hare::Transport { class IQueueConsumer; }
namespace Hare::Process { class IProcessInvoker; }

namespace Hare::Dispatch {

/** \brief Counters accumulated over one run(). */
struct DispatchStats {
    std::uint64_t received = 0;          // Messages taken off the queue
    std::uint64_t skipped = 0;           // No or invalid handler
    std::uint64_t invoked = 0;           // Handler ran (any exit status)
    std::uint64_t failed_exits = 0;      // Subset of invoked with non-zero exit or signal
    std::uint64_t invocation_errors = 0; // Handler could not be started
    std::uint64_t acknowledged = 0;
};

/**
 * \brief Drives the consume / resolve / invoke / acknowledge cycle.
 *
 * run() moves through Connecting, Consuming and ShuttingDown. While consuming,
 * each delivery is resolved to a handler script, its headers are mapped into
 * the handler environment, the handler is run, and the delivery is
 * acknowledged according to should_acknowledge().
 *
 * With `max_concurrent_invocations == 1` messages are handled one at a time on
 * the calling thread. With a larger bound, handlers run on an
 * \c InvocationPool and completions flow back through a queue; receive and
 * acknowledge are only ever called from the run() thread, and receiving pauses
 * while the bound is reached.
 *
 * The logger is optional; without one, outcome events are dropped.
 */
class DispatchLoop {
public:
    enum class State { Connecting, Consuming, ShuttingDown };

    DispatchLoop(DispatchConfig config,
                 Transport::IQueueConsumer& consumer,
                 Process::IProcessInvoker& invoker,
                 std::shared_ptr<Logger> logger);

    DispatchLoop(const DispatchLoop&) = delete;
    DispatchLoop& operator=(const DispatchLoop&) = delete;

    /**
     * \brief Connect and consume until shutdown is requested.
     *
     * Returns after a requested shutdown once every in-flight invocation has
     * completed and been acknowledged.
     * \throws Transport::QueueError when the connection fails or is lost.
     */
    void run();

    /** \brief Ask run() to stop after the current receive slice. Async-signal-safe. */
    void request_shutdown() noexcept;

    /**
     * \brief Resolve, map and invoke one message synchronously, without logging or acknowledging.
     */
    [[nodiscard]] DispatchOutcome dispatch(const Message& message);

    [[nodiscard]] State state() const noexcept { return state_.load(std::memory_order_relaxed); }

    /** \brief Counters; stable once run() has returned. */
    [[nodiscard]] const DispatchStats& stats() const noexcept { return stats_; }

private:
    struct Completion {
        DeliveryTag tag;
        DispatchOutcome outcome;
    };

    void consume();
    void handle(const Message& message);
    DispatchOutcome invoke(const ResolvedHandler& handler, const Headers& headers);
    DispatchOutcome skipped(const Headers& headers) const;
    void settle(DeliveryTag tag, const DispatchOutcome& outcome);
    void drain_completions(bool wait_for_one);
    void finish_in_flight(bool acknowledge);
    void log_summary();

    DispatchConfig config_;
    HandlerResolver resolver_;
    Transport::IQueueConsumer& consumer_;
    Process::IProcessInvoker& invoker_;
    std::shared_ptr<Logger> logger_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<State> state_{State::Connecting};
    DispatchStats stats_;

    // Declared before pool_ so it outlives the workers that push into it
    ThreadSafeQueue<Completion> completions_;
    std::size_t in_flight_ = 0;
    std::unique_ptr<InvocationPool> pool_;
};

} // namespace Hare::Dispatch
