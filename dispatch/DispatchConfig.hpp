/**
 * \file dispatch/DispatchConfig.hpp
 * \brief Immutable settings handed to the dispatch loop at startup.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace Hare::Dispatch {

/** \brief Dispatch settings resolved from CLI, environment, and config file. */
struct DispatchConfig {
    std::filesystem::path script_root{"/etc/hare/scripts"}; ///< Directory holding handler executables
    std::string handler_key{"type"};                        ///< Header naming the handler
    std::size_t max_concurrent_invocations{1};              ///< 1 = strictly sequential
    std::chrono::milliseconds poll_interval{1000};          ///< Receive slice between shutdown checks
};

} // namespace Hare::Dispatch
