#include <codegate/core/logger.hpp>
#include <codegate/core/utils.hpp>

namespace codegate {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m"; // Reset
    }
}

static const char* get_function_color() {
    return "\033[36m"; // Cyan for class::function
}

static const char* get_location_color() {
    return "\033[33m"; // Yellow for file:line
}

static const char* get_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", ""};
    }

    // Function signature up to the parameter list
    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        // Free function: name follows the last space (return type)
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return {"", func_name};
    }

    std::string func_name = signature.substr(last_colon + 2);

    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name;
    if (space_pos != std::string::npos) {
        class_name = before_last_colon.substr(space_pos + 1);
    } else {
        class_name = before_last_colon;
    }

    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }

    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }

    if (class_name.find("codegate::") == 0) {
        class_name = class_name.substr(10);
    }

    return {class_name, func_name};
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::set_output_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    file_path_.clear();

    if (path.empty()) {
        return true;
    }

    if (!create_parent_directory(path)) {
        fprintf(stderr, "Logger: cannot create directory for %s\n", path.c_str());
        return false;
    }

    file_ = fopen(path.c_str(), "a");
    if (!file_) {
        fprintf(stderr, "Logger: cannot open log file %s\n", path.c_str());
        return false;
    }
    file_path_ = path;
    return true;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO), file_(nullptr) {}

Logger::~Logger() {
    if (file_) {
        fclose(file_);
    }
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(mutex_);

    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    const char* color = get_color_code(level);
    const char* level_str = get_level_str(level);
    const char* func_color = get_function_color();
    const char* location_color = get_location_color();
    auto [class_name, func_name] = extract_class_and_function(func);

    // The file mirror needs its own copy of the argument list
    va_list file_args;
    va_copy(file_args, args);

    if (level_ == LogLevel::DEBUG) {
        if (!class_name.empty()) {
            fprintf(stderr, "[%s] %s[%s]\033[0m %s(%s::%s)\033[0m at %s%s:%d\033[0m ",
                    timestamp, color, level_str, func_color, class_name.c_str(), func_name.c_str(),
                    location_color, file, line);
        } else {
            fprintf(stderr, "[%s] %s[%s]\033[0m %s(%s)\033[0m at %s%s:%d\033[0m ",
                    timestamp, color, level_str, func_color, func_name.c_str(),
                    location_color, file, line);
        }
    } else {
        fprintf(stderr, "[%s] %s[%s]\033[0m ", timestamp, color, level_str);
    }
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);

    if (file_) {
        fprintf(file_, "%s - %s - %s - ", timestamp,
                class_name.empty() ? func_name.c_str() : class_name.c_str(), level_str);
        vfprintf(file_, fmt, file_args);
        fprintf(file_, "\n");
        fflush(file_);
    }
    va_end(file_args);
}

} // namespace codegate
