#pragma once

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace tokvec {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

/**
 * Process-wide logger. Messages are assembled from any streamable
 * arguments and handed to an spdlog logger with a console sink and an
 * optional file sink.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    // Adds an append-mode file sink; returns false if the file cannot be opened
    bool setOutputFile(const std::string& filename);

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (level < level_.load(std::memory_order_relaxed)) return;

        std::ostringstream msg;
        msg << basename(file) << ":" << line << " " << func << "() - ";
        (msg << ... << std::forward<Args>(args));
        write(level, msg.str());
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    static const char* basename(const char* path);
    void write(LogLevel level, const std::string& message);

    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<LogLevel> level_;
};

// Parses "debug" / "info" / "warn" / "error" / "fatal"; unknown names map to INFO
LogLevel parse_log_level(const std::string& name);

// Convenience macros
#define LOG_DEBUG(...) tokvec::Logger::getInstance().log(tokvec::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  tokvec::Logger::getInstance().log(tokvec::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  tokvec::Logger::getInstance().log(tokvec::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) tokvec::Logger::getInstance().log(tokvec::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) tokvec::Logger::getInstance().log(tokvec::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline bool set_log_file(const std::string& filename) {
    return Logger::getInstance().setOutputFile(filename);
}

} // namespace tokvec
