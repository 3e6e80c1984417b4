#include "processUtils.hpp"
#include <pthread.h>

extern char** environ;

std::vector<std::string> ProcessUtils::environment_snapshot() {
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e) {
        entries.emplace_back(*e);
    }
    return entries;
}

std::string ProcessUtils::environment_name(const std::string& entry) {
    auto pos = entry.find('=');
    return pos == std::string::npos ? entry : entry.substr(0, pos);
}

void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__APPLE__)
    // macOS supports setting name for current thread only
    pthread_setname_np(name.c_str());
#elif defined(__linux__)
    // Linux limits name to 16 chars including NUL; longer names are rejected
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
#else
    (void)name; // no-op on unsupported platforms
#endif
}
