#pragma once

#include <cstdarg>
#include <fstream>
#include <mutex>
#include <string>

namespace sqlxfer {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal, Off };

// Parse "trace|debug|info|warn|error|fatal|off"; throws ConfigError otherwise
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const { return level_; }
    void set_verbose(bool v);

    // Console threshold; the log file always receives everything >= level()
    void set_console_level(LogLevel level);

    void set_log_file(const std::string& path, bool append = false);
    void close_log_file();

    void log(LogLevel level, const char* fmt, ...);

    void trace(const char* fmt, ...);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
    void fatal(const char* fmt, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log_impl(LogLevel level, const char* fmt, va_list args);

    LogLevel           level_         = LogLevel::Info;
    LogLevel           console_level_ = LogLevel::Trace;
    std::ofstream      file_;
    mutable std::mutex mu_;
};

// Convenience macros
#define LOG_TRACE(...)  ::sqlxfer::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)  ::sqlxfer::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)   ::sqlxfer::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)   ::sqlxfer::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)  ::sqlxfer::Logger::instance().error(__VA_ARGS__)
#define LOG_FATAL(...)  ::sqlxfer::Logger::instance().fatal(__VA_ARGS__)

}  // namespace sqlxfer
