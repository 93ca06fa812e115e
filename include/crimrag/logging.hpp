#pragma once

#include <memory>
#include <string>

namespace crimrag {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Accepts trace/debug/info/warn/warning/error/critical/off, case-insensitive.
// Throws ConfigError on anything else.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static std::shared_ptr<Logger> getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Replaces the file sink. An empty filename removes it.
    void set_output_file(const std::string& filename);
    void set_console_output(bool enabled);

    ~Logger();

private:
    Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

void initialize_logging(const std::string& level, const std::string& file, bool console_output);

} // namespace crimrag

#define LOG_TRACE(msg) ::crimrag::Logger::getInstance()->trace(msg)
#define LOG_DEBUG(msg) ::crimrag::Logger::getInstance()->debug(msg)
#define LOG_INFO(msg) ::crimrag::Logger::getInstance()->info(msg)
#define LOG_WARNING(msg) ::crimrag::Logger::getInstance()->warning(msg)
#define LOG_ERROR(msg) ::crimrag::Logger::getInstance()->error(msg)
#define LOG_CRITICAL(msg) ::crimrag::Logger::getInstance()->critical(msg)
