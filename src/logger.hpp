#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace koboshelf {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

class Logger {
public:
    // console=false keeps output in the log file only (used by the tests)
    static void init(LogLevel level, const std::string& log_file_path = "", bool console = true);
    static void shutdown();
    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }
    static void critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

    static LogLevel level();

    // Accepts DEBUG, INFO, WARN/WARNING, ERROR, CRITICAL (any case).
    // Returns false and leaves `out` untouched for anything else.
    static bool parse_level(const std::string& name, LogLevel& out);

private:
    static LogLevel current_level;
    static bool console_enabled;
    static std::ofstream log_file;
    static std::mutex log_mutex;
};

} // namespace koboshelf
