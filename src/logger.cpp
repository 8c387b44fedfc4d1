#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace koboshelf {

LogLevel Logger::current_level = LogLevel::INFO;
bool Logger::console_enabled = true;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level, const std::string& log_file_path, bool console) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    console_enabled = console;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.flush();
        log_file.close();
    }
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

bool Logger::parse_level(const std::string& name, LogLevel& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") { out = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { out = LogLevel::INFO; return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::WARN; return true; }
    if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
    if (upper == "CRITICAL") { out = LogLevel::CRITICAL; return true; }
    return false;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    // Timestamp
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm = *std::localtime(&time);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG:    level_str = "[DEBUG]"; break;
        case LogLevel::INFO:     level_str = "[INFO] "; break;
        case LogLevel::WARN:     level_str = "[WARN] "; break;
        case LogLevel::ERROR:    level_str = "[ERROR]"; break;
        case LogLevel::CRITICAL: level_str = "[CRIT] "; break;
    }

    if (log_file.is_open()) {
        log_file << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
    }

    if (!console_enabled) return;

    // WARN and above go to stderr
    std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
    out << std::put_time(&local_tm, "%H:%M:%S")
        << " " << level_str << " " << message << std::endl;
}

} // namespace koboshelf
