#pragma once
#include <sstream>
#include <string>
#include <atomic>
#include <mutex>
#include <ostream>
#include <memory>
#include <iostream>

enum class LogLevel {TRACE, DEBUG, INFO, WARN, ERROR };

// "debug", "INFO", ... ; throws TotpError(InvalidConfig) on unknown names
LogLevel log_level_from_string(const std::string& name);
const char* to_string(LogLevel level) noexcept;

class Logger {
public:
    // create with program wide name and optional output stream.
    // stdout is reserved for codes, so diagnostics default to stderr.
    explicit Logger(std::string name, std::ostream& out = std::cerr);

    // non-copyable, movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel lvl) const noexcept;

    // Basic logging API (thread-safe)
    void log(LogLevel lvl, const std::string& msg);
    void trace(const std::string& msg);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // convenience: streams all args into one message
    template<typename... Args>
    void debug_fmt(Args&&... args);
    template<typename... Args>
    void info_fmt(Args&&... args);

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::ostream* out_;
    std::unique_ptr<std::mutex> mutex_;
    void emit(LogLevel lvl, const std::string& payload);

    template<typename... Args>
    static std::string concat(Args&&... args);
};

template<typename... Args>
inline std::string Logger::concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename... Args>
inline void Logger::debug_fmt(Args&&... args) {
    if (!enabled(LogLevel::DEBUG)) return;
    debug(concat(std::forward<Args>(args)...));
}

template<typename... Args>
inline void Logger::info_fmt(Args&&... args) {
    if (!enabled(LogLevel::INFO)) return;
    info(concat(std::forward<Args>(args)...));
}
