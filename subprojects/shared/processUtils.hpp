#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <unistd.h>
#if defined(__linux__)
    #include <sys/syscall.h>
#endif

class ProcessUtils {
public:
    // Get the native thread ID that appears in debuggers
    static uint64_t get_native_thread_id() {
#if defined(__linux__)
        return static_cast<uint64_t>(syscall(SYS_gettid));
#else
        return static_cast<uint64_t>(getpid());
#endif
    }

    // Set current thread name (best-effort, truncated to 15 chars on Linux)
    static void set_current_thread_name(const std::string& name);

    // Snapshot of the current process environment as "NAME=value" entries
    static std::vector<std::string> environment_snapshot();

    // Name part of a "NAME=value" entry (whole entry when there is no '=')
    static std::string environment_name(const std::string& entry);
};
