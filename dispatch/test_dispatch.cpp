//
// Dispatch core tests
//
// Exercises header mapping, handler resolution, the acknowledgment policy and
// the dispatch loop itself. The loop runs against an in-memory queue and a
// recording process invoker, except where a real spawn failure is wanted.
//

#include "dispatch/DispatchLoop.hpp"
#include "dispatch/HandlerResolver.hpp"
#include "dispatch/HeaderMapper.hpp"
#include "process/PosixProcessInvoker.hpp"
#include "transport/IQueueConsumer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace Hare;
using namespace Hare::Dispatch;

namespace {

// Queue double: hands out the preloaded messages, then either requests loop
// shutdown or fails like a dropped connection.
class FakeQueueConsumer : public Transport::IQueueConsumer {
public:
    enum class WhenDrained { Shutdown, Fail };

    explicit FakeQueueConsumer(std::vector<Message> messages, WhenDrained drained = WhenDrained::Shutdown)
        : pending_(messages.begin(), messages.end()), drained_(drained) {}

    void attach(DispatchLoop* loop) { loop_ = loop; }

    void connect() override {
        if (fail_connect) throw Transport::QueueError("connection refused");
        connected = true;
    }

    std::optional<Message> receive(std::chrono::milliseconds) override {
        ++receive_calls;
        if (!pending_.empty()) {
            Message m = std::move(pending_.front());
            pending_.pop_front();
            return m;
        }
        if (drained_ == WhenDrained::Fail) throw Transport::QueueError("connection reset by peer");
        if (loop_) loop_->request_shutdown();
        return std::nullopt;
    }

    void acknowledge(DeliveryTag tag) override { acked.push_back(tag); }
    void close() override { closed = true; }
    std::string endpoint() const override { return "fake://queue"; }

    bool fail_connect = false;
    bool connected = false;
    bool closed = false;
    int receive_calls = 0;
    std::vector<DeliveryTag> acked;

private:
    std::deque<Message> pending_;
    WhenDrained drained_;
    DispatchLoop* loop_ = nullptr;
};

// Invoker double: records every call and reports a configurable exit code.
class RecordingProcessInvoker : public Process::IProcessInvoker {
public:
    struct Call {
        std::filesystem::path executable;
        EnvironmentOverlay overlay;
    };

    Process::ExitStatus invoke(const std::filesystem::path& executable,
                               const EnvironmentOverlay& overlay,
                               std::error_code& ec) override {
        ec.clear();
        int now = ++running_;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            calls_.push_back(Call{executable, overlay});
            max_running_ = (std::max)(max_running_, now);
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --running_;
        return Process::ExitStatus::exited(exit_code);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }
    int max_running() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return max_running_;
    }

    int exit_code = 0;
    std::chrono::milliseconds delay{0};

private:
    mutable std::mutex mtx_;
    std::vector<Call> calls_;
    std::atomic<int> running_{0};
    int max_running_ = 0;
};

Message make_message(Headers headers, DeliveryTag tag) {
    Message m;
    m.headers = std::move(headers);
    m.body = "payload";
    m.delivery_tag = tag;
    return m;
}

std::shared_ptr<Logger> make_test_logger() {
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);
    return logger;
}

bool any_line_contains(const Logger& logger, const std::string& needle) {
    auto lines = logger.get_lines();
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
}

DispatchConfig make_config(std::size_t max_concurrent = 1) {
    DispatchConfig cfg;
    cfg.script_root = "/etc/hare/scripts";
    cfg.handler_key = "type";
    cfg.max_concurrent_invocations = max_concurrent;
    cfg.poll_interval = std::chrono::milliseconds(10);
    return cfg;
}

} // namespace

//==============================================================================
// Test 1: Header mapping
//==============================================================================
void test_header_mapping() {
    std::cout << "=== Test 1: Header Mapping ===" << std::endl;

    auto overlay = HeaderMapper::build({{"type", "deploy"}, {"app", "myapp"}});
    assert(overlay.size() == 2);
    assert(overlay.at("HARE_VAR_TYPE") == "deploy");
    assert(overlay.at("HARE_VAR_APP") == "myapp");

    // Only ASCII letters change case
    assert(HeaderMapper::variable_name("content-type") == "HARE_VAR_CONTENT-TYPE");
    assert(HeaderMapper::variable_name("x_Retry2") == "HARE_VAR_X_RETRY2");
    assert(HeaderMapper::variable_name("") == "HARE_VAR_");

    // Keys differing only in case collapse; the later header wins
    auto collided = HeaderMapper::build({{"app", "first"}, {"APP", "second"}});
    assert(collided.size() == 1);
    assert(collided.at("HARE_VAR_APP") == "second");

    // Values pass through untouched, including empty ones
    auto raw = HeaderMapper::build({{"note", "a=b c\td"}, {"empty", ""}});
    assert(raw.at("HARE_VAR_NOTE") == "a=b c\td");
    assert(raw.at("HARE_VAR_EMPTY").empty());

    assert(HeaderMapper::build({}).empty());

    std::cout << "Header mapping OK" << std::endl << std::endl;
}

//==============================================================================
// Test 2: Handler resolution
//==============================================================================
void test_handler_resolution() {
    std::cout << "=== Test 2: Handler Resolution ===" << std::endl;

    const std::filesystem::path root{"/etc/hare/scripts"};

    for (const char* name : {"deploy", "Deploy2", "0", "ABCxyz789"}) {
        auto r = HandlerResolver::resolve({{"type", name}}, "type", root);
        assert(r.has_value());
        assert(r->name == name);
        assert(r->script == root / name);
    }

    for (const char* bad : {"", "../etc/passwd", "a/b", "deploy.sh", "de ploy", ".", "..", "deploy\n",
                            "d\xc3\xa9ploy", "-rf"}) {
        assert(!HandlerResolver::is_valid_name(bad));
        assert(!HandlerResolver::resolve({{"type", bad}}, "type", root).has_value());
    }

    // Missing key, and a key that only differs in case
    assert(!HandlerResolver::resolve({{"app", "myapp"}}, "type", root).has_value());
    assert(!HandlerResolver::resolve({{"TYPE", "deploy"}}, "type", root).has_value());
    assert(!HandlerResolver::resolve({}, "type", root).has_value());

    // Duplicate key: the last value decides
    auto dup = HandlerResolver::resolve({{"type", "first"}, {"type", "second"}}, "type", root);
    assert(dup && dup->name == "second");

    // Custom handler key via the stateful resolver
    HandlerResolver resolver("action", "/opt/handlers");
    auto custom = resolver.resolve({{"type", "ignored"}, {"action", "restart"}});
    assert(custom && custom->script == std::filesystem::path("/opt/handlers/restart"));
    assert(resolver.handler_key() == "action");

    std::cout << "Handler resolution OK" << std::endl << std::endl;
}

//==============================================================================
// Test 3: Outcome policy and events
//==============================================================================
void test_outcome_policy() {
    std::cout << "=== Test 3: Outcome Policy ===" << std::endl;

    const auto when = std::chrono::system_clock::time_point{};
    DispatchOutcome skipped = Skipped{SkipReason::MissingHandler, {}};
    DispatchOutcome invalid = Skipped{SkipReason::InvalidHandler, "../x"};
    DispatchOutcome ok = Invoked{"deploy", "/etc/hare/scripts/deploy", Process::ExitStatus::exited(0)};
    DispatchOutcome failed_exit = Invoked{"deploy", "/etc/hare/scripts/deploy", Process::ExitStatus::exited(3)};
    DispatchOutcome killed = Invoked{"deploy", "/etc/hare/scripts/deploy", Process::ExitStatus::killed(9)};
    DispatchOutcome spawn_error = InvocationFailed{"deploy", "/etc/hare/scripts/deploy",
                                                   std::make_error_code(std::errc::no_such_file_or_directory)};

    for (const auto* o : {&skipped, &invalid, &ok, &failed_exit, &killed, &spawn_error}) {
        assert(should_acknowledge(*o));
    }

    assert(outcome_level(skipped) == LogLevel::Info);
    assert(outcome_level(ok) == LogLevel::Info);
    assert(outcome_level(failed_exit) == LogLevel::Warning);
    assert(outcome_level(killed) == LogLevel::Warning);
    assert(outcome_level(spawn_error) == LogLevel::Error);

    auto e1 = to_event(skipped, when);
    assert(e1["outcome"] == "skipped");
    assert(e1["handler"].is_null());
    assert(e1["script"] == "none");
    assert(e1["timestamp"] == "1970-01-01T00:00:00Z");

    auto e2 = to_event(invalid, when);
    assert(e2["handler"] == "../x");
    assert(e2["script"] == "none");

    auto e3 = to_event(failed_exit, when);
    assert(e3["outcome"] == "invoked");
    assert(e3["exit_code"] == 3);
    assert(e3["script"] == "/etc/hare/scripts/deploy");

    auto e4 = to_event(killed, when);
    assert(e4["signal"] == 9);
    assert(!e4.contains("exit_code"));

    auto e5 = to_event(spawn_error, when);
    assert(e5["outcome"] == "failed");
    assert(e5["errno"] == ENOENT);
    assert(e5["handler"] == "deploy");

    std::cout << "Outcome policy OK" << std::endl << std::endl;
}

//==============================================================================
// Test 4: Scenario - resolved handler runs with mapped environment
//==============================================================================
void test_scenario_invoked() {
    std::cout << "=== Test 4: Scenario Invoked ===" << std::endl;

    FakeQueueConsumer queue({make_message({{"type", "deploy"}, {"app", "myapp"}}, 1),
                             make_message({{"type", "deploy"}, {"app", "other"}}, 2)});
    RecordingProcessInvoker invoker;
    invoker.exit_code = 4; // acknowledged regardless
    auto logger = make_test_logger();

    DispatchLoop loop(make_config(), queue, invoker, logger);
    queue.attach(&loop);
    loop.run();

    auto calls = invoker.calls();
    assert(calls.size() == 2);
    assert(calls[0].executable == std::filesystem::path("/etc/hare/scripts/deploy"));
    assert(calls[0].overlay.at("HARE_VAR_TYPE") == "deploy");
    assert(calls[0].overlay.at("HARE_VAR_APP") == "myapp");
    assert(calls[1].overlay.at("HARE_VAR_APP") == "other");

    assert((queue.acked == std::vector<DeliveryTag>{1, 2}));
    assert(queue.connected && queue.closed);
    assert(loop.state() == DispatchLoop::State::ShuttingDown);
    assert(loop.stats().received == 2);
    assert(loop.stats().invoked == 2);
    assert(loop.stats().failed_exits == 2);
    assert(loop.stats().acknowledged == 2);

    assert(any_line_contains(*logger, "[WARNING] dispatch {"));
    assert(any_line_contains(*logger, "\"exit_code\":4"));
    assert(any_line_contains(*logger, "Dispatch summary: received=2"));

    std::cout << "Scenario invoked OK" << std::endl << std::endl;
}

//==============================================================================
// Test 5: Scenarios - traversal attempt and missing key are skipped
//==============================================================================
void test_scenario_skipped() {
    std::cout << "=== Test 5: Scenario Skipped ===" << std::endl;

    FakeQueueConsumer queue({make_message({{"type", "../etc/passwd"}}, 10),
                             make_message({{"app", "myapp"}}, 11),
                             make_message({}, 12)});
    RecordingProcessInvoker invoker;
    auto logger = make_test_logger();

    DispatchLoop loop(make_config(), queue, invoker, logger);
    queue.attach(&loop);
    loop.run();

    assert(invoker.calls().empty());
    assert((queue.acked == std::vector<DeliveryTag>{10, 11, 12}));
    assert(loop.stats().skipped == 3);
    assert(loop.stats().invoked == 0);
    assert(any_line_contains(*logger, "[INFO] dispatch {"));
    assert(any_line_contains(*logger, "\"outcome\":\"skipped\""));
    assert(any_line_contains(*logger, "\"handler\":\"../etc/passwd\""));
    assert(any_line_contains(*logger, "\"script\":\"none\""));

    std::cout << "Scenario skipped OK" << std::endl << std::endl;
}

//==============================================================================
// Test 6: Scenario - resolved script missing on disk
//==============================================================================
void test_scenario_missing_script() {
    std::cout << "=== Test 6: Scenario Missing Script ===" << std::endl;

    FakeQueueConsumer queue({make_message({{"type", "deploy"}}, 7)});
    Process::PosixProcessInvoker invoker;
    auto logger = make_test_logger();

    auto cfg = make_config();
    cfg.script_root = "/nonexistent/hare-test-root";
    DispatchLoop loop(cfg, queue, invoker, logger);
    queue.attach(&loop);
    loop.run();

    assert((queue.acked == std::vector<DeliveryTag>{7}));
    assert(loop.stats().invocation_errors == 1);
    assert(any_line_contains(*logger, "[ERROR] dispatch {"));
    assert(any_line_contains(*logger, "\"handler\":\"deploy\""));
    assert(any_line_contains(*logger, "/nonexistent/hare-test-root/deploy"));

    // Synchronous form reports the same outcome without acknowledging
    auto outcome = loop.dispatch(make_message({{"type", "deploy"}}, 8));
    auto* failed = std::get_if<InvocationFailed>(&outcome);
    assert(failed != nullptr);
    assert(failed->error == std::errc::no_such_file_or_directory);
    assert(queue.acked.size() == 1);

    std::cout << "Scenario missing script OK" << std::endl << std::endl;
}

//==============================================================================
// Test 7: Idempotence of resolution and mapping
//==============================================================================
void test_idempotence() {
    std::cout << "=== Test 7: Idempotence ===" << std::endl;

    FakeQueueConsumer queue(std::vector<Message>{});
    RecordingProcessInvoker invoker;
    DispatchLoop loop(make_config(), queue, invoker, nullptr);

    auto message = make_message({{"type", "deploy"}, {"app", "myapp"}}, 1);
    auto a = loop.dispatch(message);
    auto b = loop.dispatch(message);
    auto* ia = std::get_if<Invoked>(&a);
    auto* ib = std::get_if<Invoked>(&b);
    assert(ia && ib);
    assert(ia->script == ib->script && ia->handler == ib->handler && ia->status == ib->status);

    auto calls = invoker.calls();
    assert(calls.size() == 2);
    assert(calls[0].overlay == calls[1].overlay);
    assert(calls[0].executable == calls[1].executable);

    std::cout << "Idempotence OK" << std::endl << std::endl;
}

//==============================================================================
// Test 8: Transport failures propagate
//==============================================================================
void test_transport_failures() {
    std::cout << "=== Test 8: Transport Failures ===" << std::endl;

    {
        FakeQueueConsumer queue(std::vector<Message>{});
        queue.fail_connect = true;
        RecordingProcessInvoker invoker;
        DispatchLoop loop(make_config(), queue, invoker, make_test_logger());
        bool thrown = false;
        try {
            loop.run();
        } catch (const Transport::QueueError&) {
            thrown = true;
        }
        assert(thrown);
        assert(queue.receive_calls == 0);
    }

    {
        FakeQueueConsumer queue({make_message({{"type", "deploy"}}, 1)}, FakeQueueConsumer::WhenDrained::Fail);
        RecordingProcessInvoker invoker;
        auto logger = make_test_logger();
        DispatchLoop loop(make_config(), queue, invoker, logger);
        bool thrown = false;
        try {
            loop.run();
        } catch (const Transport::QueueError& e) {
            thrown = std::string(e.what()).find("reset") != std::string::npos;
        }
        assert(thrown);
        assert((queue.acked == std::vector<DeliveryTag>{1}));
        assert(queue.closed);
        assert(any_line_contains(*logger, "Queue connection lost"));
    }

    {
        FakeQueueConsumer queue(std::vector<Message>{});
        RecordingProcessInvoker invoker;
        auto cfg = make_config(0);
        bool rejected = false;
        try {
            DispatchLoop loop(cfg, queue, invoker, nullptr);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected);
    }

    std::cout << "Transport failures OK" << std::endl << std::endl;
}

//==============================================================================
// Test 9: Bounded concurrent invocations
//==============================================================================
void test_bounded_concurrency() {
    std::cout << "=== Test 9: Bounded Concurrency ===" << std::endl;

    std::vector<Message> messages;
    for (DeliveryTag tag = 1; tag <= 9; ++tag) {
        messages.push_back(make_message({{"type", "job"}, {"seq", std::to_string(tag)}}, tag));
    }
    messages.push_back(make_message({{"type", "bad/name"}}, 10));

    FakeQueueConsumer queue(std::move(messages));
    RecordingProcessInvoker invoker;
    invoker.delay = std::chrono::milliseconds(40);
    auto logger = make_test_logger();

    DispatchLoop loop(make_config(3), queue, invoker, logger);
    queue.attach(&loop);
    loop.run();

    // Every delivery is settled before run() returns, in whatever order handlers finished
    auto acked = queue.acked;
    std::sort(acked.begin(), acked.end());
    assert(acked.size() == 10);
    for (DeliveryTag tag = 1; tag <= 10; ++tag) {
        assert(acked[tag - 1] == tag);
    }

    assert(invoker.calls().size() == 9);
    assert(invoker.max_running() <= 3);
    assert(invoker.max_running() >= 2);
    assert(loop.stats().invoked == 9);
    assert(loop.stats().skipped == 1);
    std::cout << "Peak concurrent handlers: " << invoker.max_running() << std::endl;

    std::cout << "Bounded concurrency OK" << std::endl << std::endl;
}

//==============================================================================
// Main
//==============================================================================
int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Dispatch Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_header_mapping();
    test_handler_resolution();
    test_outcome_policy();
    test_scenario_invoked();
    test_scenario_skipped();
    test_scenario_missing_script();
    test_idempotence();
    test_transport_failures();
    test_bounded_concurrency();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;

    return 0;
}
