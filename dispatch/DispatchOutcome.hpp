/**
 * \file dispatch/DispatchOutcome.hpp
 * \brief Result of dispatching one message, and the acknowledgment policy applied to it.
 */
#pragma once

#include "process/IProcessInvoker.hpp"
#include "logger.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

#include <nlohmann/json.hpp>

namespace Hare::Dispatch {

enum class SkipReason {
    MissingHandler, ///< handler key not present in headers
    InvalidHandler  ///< value present but not strictly alphanumeric
};

/** \brief No handler could be selected; nothing was spawned. */
struct Skipped {
    SkipReason reason{SkipReason::MissingHandler};
    std::string rejected_value; ///< offending value for InvalidHandler, empty otherwise
};

/** \brief Handler ran to completion (any exit code). */
struct Invoked {
    std::string handler;
    std::filesystem::path script;
    Process::ExitStatus status;
};

/** \brief Handler could not be started. */
struct InvocationFailed {
    std::string handler;
    std::filesystem::path script;
    std::error_code error;
};

using DispatchOutcome = std::variant<Skipped, Invoked, InvocationFailed>;

/**
 * \brief Whether the delivery behind \p outcome is acknowledged.
 *
 * Always true: a message is consumed once whatever happened locally. A missing
 * or broken script is not fixed by redelivery.
 */
[[nodiscard]] bool should_acknowledge(const DispatchOutcome& outcome) noexcept;

/** \brief Log level for an outcome: Info for skips and clean exits, Warning for failed exits, Error for spawn failures. */
[[nodiscard]] LogLevel outcome_level(const DispatchOutcome& outcome) noexcept;

/** \brief "skipped", "invoked" or "failed". */
[[nodiscard]] const char* outcome_name(const DispatchOutcome& outcome) noexcept;

/**
 * \brief Structured log event for an outcome.
 *
 * Fields: outcome, handler (null when skipped for a missing key), script
 * ("none" when skipped), exit_code or signal or error, timestamp (RFC 3339).
 */
[[nodiscard]] nlohmann::json to_event(const DispatchOutcome& outcome,
                                      std::chrono::system_clock::time_point when);

} // namespace Hare::Dispatch
