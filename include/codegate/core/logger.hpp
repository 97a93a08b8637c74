#ifndef codegate_CORE_LOGGER_HPP
#define codegate_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace codegate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Mirror every message (without colour codes) to a file.
    // Creates the parent directory if needed. An empty path closes the mirror.
    bool set_output_file(const std::string& path);
    const std::string& output_file() const { return file_path_; }

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    FILE* file_;
    std::string file_path_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) codegate::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  codegate::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  codegate::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) codegate::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace codegate

#endif // codegate_CORE_LOGGER_HPP
