#include "crimrag/logging.hpp"
#include "crimrag/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace crimrag {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    throw ConfigError("unknown log level '" + name + "'", "parse_log_level");
}

// Logger implementation
class Logger::Impl {
public:
    Impl() {
        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        rebuild();
    }

    std::shared_ptr<spdlog::logger> current() {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        logger_->set_level(to_spdlog(level));
    }

    LogLevel level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void set_output_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (filename.empty()) {
            file_sink_.reset();
        } else {
            try {
                file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
            } catch (const spdlog::spdlog_ex& e) {
                throw IOError(std::string("cannot open log file: ") + e.what(), "Logger::set_output_file");
            }
        }
        rebuild_locked();
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
        rebuild_locked();
    }

private:
    void rebuild() {
        std::lock_guard<std::mutex> lock(mutex_);
        rebuild_locked();
    }

    void rebuild_locked() {
        std::vector<spdlog::sink_ptr> sinks;
        if (console_enabled_) {
            sinks.push_back(console_sink_);
        }
        if (file_sink_) {
            sinks.push_back(file_sink_);
        }
        auto logger = std::make_shared<spdlog::logger>("crimrag", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(level_));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        logger_ = std::move(logger);
    }

    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::sink_ptr console_sink_;
    spdlog::sink_ptr file_sink_;
    bool console_enabled_ = true;
    LogLevel level_ = LogLevel::INFO;
};

// Logger singleton implementation
std::shared_ptr<Logger> Logger::getInstance() {
    static std::shared_ptr<Logger> instance(new Logger());
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->current()->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->current()->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->current()->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->current()->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->current()->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->current()->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    return pImpl->level();
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

void Logger::set_console_output(bool enabled) {
    pImpl->set_console_output(enabled);
}

void initialize_logging(const std::string& level, const std::string& file, bool console_output) {
    auto logger = Logger::getInstance();
    logger->set_level(parse_log_level(level));
    logger->set_console_output(console_output);
    logger->set_output_file(file);
}

} // namespace crimrag
