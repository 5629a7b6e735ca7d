#ifndef INSTSHARE_LOGGER_HPP
#define INSTSHARE_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <atomic>

// Ordered by severity, the threshold drops everything below it.
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    void init(const std::string& filename);
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;
    void set_console_output(bool enabled);

    /**
     * @brief Parses "debug", "info", "warn"/"warning" or "error" (case-insensitive).
     * @return The parsed level, or INFO for anything unrecognised.
     */
    static LogLevel parse_level(const std::string& name);

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (level < level_) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    bool console_output_ = true;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // INSTSHARE_LOGGER_HPP
