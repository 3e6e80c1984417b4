/**
 * \file dispatch/DispatchOutcome.cpp
 * \brief Outcome classification and event rendering.
 */
#include "DispatchOutcome.hpp"

namespace Hare::Dispatch {

namespace {
// Helper for std::visit with a set of lambdas
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

bool should_acknowledge(const DispatchOutcome& outcome) noexcept {
    (void)outcome;
    return true;
}

LogLevel outcome_level(const DispatchOutcome& outcome) noexcept {
    return std::visit(overloaded{
        [](const Skipped&) { return LogLevel::Info; },
        [](const Invoked& o) { return o.status.success() ? LogLevel::Info : LogLevel::Warning; },
        [](const InvocationFailed&) { return LogLevel::Error; },
    }, outcome);
}

const char* outcome_name(const DispatchOutcome& outcome) noexcept {
    switch (outcome.index()) {
        case 0:  return "skipped";
        case 1:  return "invoked";
        default: return "failed";
    }
}

nlohmann::json to_event(const DispatchOutcome& outcome, std::chrono::system_clock::time_point when) {
    nlohmann::json event;
    event["outcome"] = outcome_name(outcome);
    std::visit(overloaded{
        [&](const Skipped& o) {
            if (o.reason == SkipReason::MissingHandler) {
                event["handler"] = nullptr;
                event["reason"] = "handler not found";
            } else {
                event["handler"] = o.rejected_value;
                event["reason"] = "handler name invalid";
            }
            event["script"] = "none";
        },
        [&](const Invoked& o) {
            event["handler"] = o.handler;
            event["script"] = o.script.string();
            if (o.status.signaled) {
                event["signal"] = o.status.code;
            } else {
                event["exit_code"] = o.status.code;
            }
        },
        [&](const InvocationFailed& o) {
            event["handler"] = o.handler;
            event["script"] = o.script.string();
            event["error"] = o.error.message();
            event["errno"] = o.error.value();
        },
    }, outcome);
    event["timestamp"] = format_rfc3339(when);
    return event;
}

} // namespace Hare::Dispatch
