#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <optional>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>
#include <utility>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

// Usage:
//   auto logger = std::make_shared<Logger>("hare");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   logger->info("Connecting to amqp://localhost:5672");

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

/** \brief Parse a level name as accepted by --log-level (lower case). */
inline std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug")    return LogLevel::Debug;
    if (name == "info")     return LogLevel::Info;
    if (name == "warning")  return LogLevel::Warning;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

/** \brief RFC 3339 timestamp with second precision in UTC, e.g. 2026-10-19T08:15:02Z. */
inline std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& name, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }

protected:
    // "[2026-10-19T08:15:02Z INFO hare] message"
    static std::string format_line(LogLevel level, const std::string& name, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << format_rfc3339(std::chrono::system_clock::now()) << " " << to_string(level);
        if (!name.empty()) oss << " " << name;
        oss << "] " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& name, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format_line(level, name, message) << std::endl;
    }
private:
    std::mutex mutex_;
};

/**
 * \brief Appends formatted lines to a file; throws if the file cannot be opened.
 *
 * The descriptor is close-on-exec so spawned handlers do not inherit it.
 */
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path)
        : fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)) {
        if (fd_ == -1) {
            throw std::runtime_error("cannot open log destination '" + path + "': " + std::strerror(errno));
        }
    }
    ~FileSink() override { ::close(fd_); }
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void log(LogLevel level, const std::string& name, const std::string& message) override {
        if (level < min_level_) return;
        const std::string line = format_line(level, name, message) + "\n";
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t written = 0;
        while (written < line.size()) {
            ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
            if (n == -1) {
                if (errno == EINTR) continue;
                std::cerr << "log write failed: " << std::strerror(errno) << std::endl;
                return;
            }
            written += static_cast<std::size_t>(n);
        }
    }

    int native_handle() const { return fd_; }
private:
    int fd_;
    std::mutex mutex_;
};

/** \brief Keeps "[LEVEL] message" lines in memory; used by tests to inspect output. */
class VectorSink : public LogSink {
public:
    VectorSink() { min_level_ = LogLevel::Debug; }

    void log(LogLevel level, const std::string& name, const std::string& message) override {
        (void)name;
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, "[" + to_string(level) + "] " + message});
    }

    std::vector<std::string> get_lines(LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& e : entries_) {
            if (e.level >= min_level) out.push_back(e.text);
        }
        return out;
    }

private:
    struct Entry {
        LogLevel level;
        std::string text;
    };
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/**
 * \brief Named front end fanning each record out to its sinks.
 *
 * Sinks are attached during startup, before the logger is shared between
 * threads; log calls are then safe from any thread as long as every sink is.
 */
class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    // Lines held by the first in-memory sink, if one is attached
    std::vector<std::string> get_lines(LogLevel min_level = LogLevel::Debug) const {
        for (const auto& sink : sinks_) {
            if (auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink)) {
                return vector_sink->get_lines(min_level);
            }
        }
        return {};
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
