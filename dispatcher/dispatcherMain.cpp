// dispatcherMain.cpp - Consumes queue messages and runs the handler script named by each message.
#include "DispatcherOptions.hpp"
#include "dispatch/DispatchLoop.hpp"
#include "process/PosixProcessInvoker.hpp"
#include "transport/amqp/AmqpConsumer.hpp"
#include "logger.hpp"
#include <options/Options.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// Loop targeted by the signal handlers; null outside run()
static std::atomic<Hare::Dispatch::DispatchLoop*> g_loop{nullptr};

// Signal handler for graceful shutdown
static void signal_handler(int) {
    if (auto* loop = g_loop.load(std::memory_order_relaxed)) {
        loop->request_shutdown();
    }
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Parse CLI/env/JSON options ---

    // All options auto-register via static objects; no manual call needed
    Hare::DispatcherConfig cfg;
    try {
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "hare option parse error: " << opts_err << std::endl;
            return 2;
        }
        cfg = Hare::dispatcher_opts::collect();
    } catch (const std::invalid_argument& e) {
        std::cerr << "hare option parse error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "hare error: " << e.what() << std::endl;
        return 1;
    }

    // --- Stage 2: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("hare");
    try {
        std::shared_ptr<LogSink> sink;
        if (cfg.log_destination) {
            sink = std::make_shared<FileSink>(*cfg.log_destination);
        } else {
            sink = std::make_shared<StdoutSink>();
        }
        sink->set_level(cfg.log_level);
        logger->add_sink(sink);
    } catch (const std::exception& e) {
        std::cerr << "hare error: " << e.what() << std::endl;
        return 1;
    }

    // --- Stage 3: Wire transport, invoker and loop, then consume ---
    try {
        Hare::Transport::Amqp::AmqpConsumer consumer(cfg.amqp, logger);
        Hare::Process::PosixProcessInvoker invoker;
        Hare::Dispatch::DispatchLoop loop(cfg.dispatch, consumer, invoker, logger);

        g_loop.store(&loop, std::memory_order_relaxed);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        try {
            loop.run();
        } catch (...) {
            g_loop.store(nullptr, std::memory_order_relaxed);
            throw;
        }
        g_loop.store(nullptr, std::memory_order_relaxed);

    } catch (const Hare::Transport::QueueError& e) {
        logger->critical(std::string{"Queue failure: "} + e.what());
        return 3;
    } catch (const std::invalid_argument& e) {
        logger->error(std::string{"Invalid configuration: "} + e.what());
        return 2;
    } catch (const std::exception& e) {
        logger->error("Exception in dispatcher main loop: " + std::string(e.what()));
        return 1;
    }

    logger->info("hare shut down");
    return 0;
}
