#include "tokvec/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <mutex>
#include <shared_mutex>

namespace tokvec {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

class Logger::Impl {
public:
    Impl() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("tokvec", console_sink);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    // Writers hold the lock shared, so the sink list never changes under a log call
    bool add_file_sink(const std::string& filename) {
        std::unique_lock<std::shared_mutex> lock(mutex);
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            logger->sinks().push_back(file_sink);
            return true;
        } catch (const spdlog::spdlog_ex& e) {
            logger->error("Could not open log file {}: {}", filename, e.what());
            return false;
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    std::shared_mutex mutex;
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : impl_(std::make_unique<Impl>()), level_(LogLevel::INFO) {}

Logger::~Logger() {
    impl_->logger->flush();
}

void Logger::setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return level_.load(std::memory_order_relaxed);
}

bool Logger::setOutputFile(const std::string& filename) {
    return impl_->add_file_sink(filename);
}

const char* Logger::basename(const char* path) {
    const char* filename = std::strrchr(path, '/');
    if (!filename) filename = std::strrchr(path, '\\');
    return filename ? filename + 1 : path;
}

void Logger::write(LogLevel level, const std::string& message) {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    impl_->logger->log(to_spdlog(level), message);
    if (level == LogLevel::FATAL) {
        impl_->logger->flush();
    }
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

} // namespace tokvec
