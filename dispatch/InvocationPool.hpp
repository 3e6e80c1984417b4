/**
 * \file dispatch/InvocationPool.hpp
 * \brief Fixed-size worker pool running handler invocations off the consumer thread.
 */
#pragma once

#include "threadSafeQueue.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

class Logger;

namespace Hare::Dispatch {

/**
 * \brief Runs submitted jobs on a fixed set of threads.
 *
 * The pool does not bound its backlog; callers cap the number of jobs in
 * flight. Destruction stops accepting work, lets queued jobs finish, and
 * joins every thread.
 */
class InvocationPool {
public:
    InvocationPool(std::size_t threads, std::shared_ptr<Logger> logger);
    ~InvocationPool();

    InvocationPool(const InvocationPool&) = delete;
    InvocationPool& operator=(const InvocationPool&) = delete;

    void enqueue(std::function<void()> job);

private:
    void worker_loop(std::size_t index);

    std::shared_ptr<Logger> logger_;
    ThreadSafeQueue<std::function<void()>> jobs_;
    std::vector<std::thread> workers_;
};

} // namespace Hare::Dispatch
