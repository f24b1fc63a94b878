#pragma once
// Per-run logger handle. Created once by the subcommand, passed by
// reference into every component, closed when the run ends.

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <string>

namespace postoga {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// "debug", "info", "warn", "error", "off" (case-insensitive).
// Unknown names map to Info.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info);
    Logger(LogLevel level, std::ostream& console);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Mirror every record into `path` (appending). Throws OutputError.
    void attach_file(const std::string& path);
    void close();

    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const {
        return level_ != LogLevel::Off && level >= level_;
    }

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

private:
    LogLevel level_;
    std::ostream* console_;
    std::ofstream file_;
};

std::string format_duration_ms(int64_t ms);

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    return format_duration_ms(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
}

}  // namespace postoga
