#include "postoga/logger.hpp"
#include "postoga/errors.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace postoga {

namespace {

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

}  // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
        default:              return "OFF";
    }
}

Logger::Logger(LogLevel level) : level_(level), console_(&std::cerr) {}

Logger::Logger(LogLevel level, std::ostream& console)
    : level_(level), console_(&console) {}

Logger::~Logger() {
    close();
}

void Logger::attach_file(const std::string& path) {
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        throw OutputError("cannot open log file: " + path);
    }
}

void Logger::close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    std::ostringstream line;
    line << timestamp() << " | " << log_level_name(level) << " | postoga | "
         << message << '\n';
    const std::string text = line.str();

    *console_ << text;
    if (file_.is_open()) {
        file_ << text;
        file_.flush();
    }
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t total_hours = total_minutes / 60;
    if (total_hours < 24) {
        return std::to_string(total_hours) + "h " + std::to_string(minutes) + "m " +
               std::to_string(seconds) + "s";
    }

    return std::to_string(total_hours / 24) + "d " + std::to_string(total_hours % 24) +
           "h " + std::to_string(minutes) + "m";
}

}  // namespace postoga
