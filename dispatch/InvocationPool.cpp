/**
 * \file dispatch/InvocationPool.cpp
 * \brief Worker threads draining the invocation job queue.
 */
#include "InvocationPool.hpp"
#include "logger.hpp"
#include <processUtils.hpp>

#include <exception>
#include <string>

namespace Hare::Dispatch {

InvocationPool::InvocationPool(std::size_t threads, std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
}

InvocationPool::~InvocationPool() {
    // Queued jobs are still handed out after close(); workers exit once drained
    jobs_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void InvocationPool::enqueue(std::function<void()> job) {
    jobs_.push(std::move(job));
}

void InvocationPool::worker_loop(std::size_t index) {
    ProcessUtils::set_current_thread_name("hare-invoke");
    if (logger_) {
        logger_->debug("Invocation worker " + std::to_string(index) + " started (tid " +
                       std::to_string(ProcessUtils::get_native_thread_id()) + ")");
    }
    while (auto job = jobs_.pop()) {
        if (!*job) continue;
        try {
            (*job)();
        } catch (const std::exception& e) {
            // Jobs report their own outcome; reaching here means the job itself is broken
            if (logger_) logger_->error("Invocation worker " + std::to_string(index) + ": job threw: " + e.what());
        }
    }
}

} // namespace Hare::Dispatch
