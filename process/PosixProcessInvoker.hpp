/**
 * \file process/PosixProcessInvoker.hpp
 * \brief fork/execve implementation of \c IProcessInvoker.
 */
#pragma once

#include "IProcessInvoker.hpp"

#include <string>
#include <vector>

namespace Hare::Process {

/**
 * \brief Spawns handlers with fork/execve and reaps them with waitpid.
 *
 * The child inherits stdin/stdout/stderr. Its environment is the parent's
 * environment at call time with overlay entries replacing same-named
 * variables. Exec failures in the child are reported back through a
 * close-on-exec pipe so they surface as \c std::error_code in the parent.
 * An overlay name that is empty or holds '=' or NUL, or a value holding NUL,
 * fails with \c errc::invalid_argument before anything is spawned.
 * Safe to call from several threads at once.
 */
class PosixProcessInvoker : public IProcessInvoker {
public:
    ExitStatus invoke(const std::filesystem::path& executable,
                      const Dispatch::EnvironmentOverlay& overlay,
                      std::error_code& ec) override;

    /** \brief Inherited environment merged with \p overlay, as "NAME=value" entries. */
    static std::vector<std::string> merge_environment(const Dispatch::EnvironmentOverlay& overlay);
};

} // namespace Hare::Process
