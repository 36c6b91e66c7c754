#include <pathjail/core/logger.hpp>

#include <unistd.h>

namespace pathjail {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m"; // Reset
    }
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

// "pathjail::FileService::read(const string&)" -> {"FileService", "read"}
static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", pf};
    }

    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        // Free function: drop the return type
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

    if (class_name.compare(0, 10, "pathjail::") == 0) {
        class_name = class_name.substr(10);
    }
    // Free functions inside the namespace
    if (class_name == "pathjail") {
        class_name.clear();
    }

    return {class_name, func_name};
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") {
        out = LogLevel::DEBUG;
    } else if (name == "info") {
        out = LogLevel::INFO;
    } else if (name == "warn" || name == "warning") {
        out = LogLevel::WARN;
    } else if (name == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , sink_(stderr)
    , colors_(isatty(STDERR_FILENO) != 0) {}

Logger::~Logger() {
    if (sink_ && sink_ != stderr) {
        fclose(sink_);
    }
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_.load(); }

bool Logger::set_output_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    FILE* next = stderr;
    if (!path.empty()) {
        next = fopen(path.c_str(), "ae");
        if (!next) {
            return false;
        }
    }
    if (sink_ && sink_ != stderr) {
        fclose(sink_);
    }
    sink_ = next;
    colors_ = (sink_ == stderr) && isatty(STDERR_FILENO) != 0;
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

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* level_str = get_level_str(level);
    auto [class_name, func_name] = extract_class_and_function(func);

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = colors_ ? get_color_code(level) : "";
    const char* reset = colors_ ? "\033[0m" : "";
    const char* func_color = colors_ ? "\033[36m" : "";
    const char* location_color = colors_ ? "\033[33m" : "";
    if (level_ == LogLevel::DEBUG) {
        if (!class_name.empty()) {
            fprintf(sink_, "[%s] %s[%s]%s %s(%s::%s)%s at %s%s:%d%s ",
                    timestamp, color, level_str, reset, func_color, class_name.c_str(),
                    func_name.c_str(), reset, location_color, file, line, reset);
        } else {
            fprintf(sink_, "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                    timestamp, color, level_str, reset, func_color, func_name.c_str(),
                    reset, location_color, file, line, reset);
        }
    } else {
        fprintf(sink_, "[%s] %s[%s]%s ", timestamp, color, level_str, reset);
    }
    vfprintf(sink_, fmt, args);
    fprintf(sink_, "\n");
    fflush(sink_);
}

} // namespace pathjail
