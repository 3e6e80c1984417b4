/**
 * \file process/IProcessInvoker.hpp
 * \brief Capability interface for running handler executables.
 */
#pragma once

#include "dispatch/HeaderMapper.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace Hare::Process {

/** \brief How a handler process terminated. */
struct ExitStatus {
    bool signaled{false}; ///< true when terminated by a signal
    int code{0};          ///< exit code, or signal number when signaled

    static ExitStatus exited(int c) { return ExitStatus{false, c}; }
    static ExitStatus killed(int sig) { return ExitStatus{true, sig}; }

    [[nodiscard]] bool success() const noexcept { return !signaled && code == 0; }
    /** \brief "exit 3" or "signal 9". */
    [[nodiscard]] std::string describe() const {
        return (signaled ? "signal " : "exit ") + std::to_string(code);
    }

    bool operator==(const ExitStatus&) const = default;
};

/**
 * \brief Runs an executable with no arguments and an environment overlay, blocking until it exits.
 *
 * Implementations report start-up failures (missing file, permission denied,
 * bad executable format, fork failure) through \p ec; the returned status is
 * meaningless in that case. A child that starts and exits non-zero is not an
 * error.
 */
class IProcessInvoker {
public:
    virtual ~IProcessInvoker() = default;

    virtual ExitStatus invoke(const std::filesystem::path& executable,
                              const Dispatch::EnvironmentOverlay& overlay,
                              std::error_code& ec) = 0;
};

} // namespace Hare::Process
