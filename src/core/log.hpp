#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @brief Log severity, most severe first
 */
enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

/**
 * @brief Serialized status stream for the simulator
 *
 * Writes "HH:MM:SS.mmm LEVEL [tag] message" lines. INFO and DEBUG go to
 * stdout, WARN and ERROR to stderr. Safe to call from the network thread
 * and the publish loop at the same time.
 */
class Log {
public:
    static void set_level(LogLevel level) { level_ref().store(level); }
    static LogLevel level() { return level_ref().load(); }

    static void error(const std::string& tag, const std::string& msg) { write(LogLevel::ERROR, tag, msg); }
    static void warn(const std::string& tag, const std::string& msg)  { write(LogLevel::WARN, tag, msg); }
    static void info(const std::string& tag, const std::string& msg)  { write(LogLevel::INFO, tag, msg); }
    static void debug(const std::string& tag, const std::string& msg) { write(LogLevel::DEBUG, tag, msg); }

    /**
     * @brief Parse a level name ("error", "warn", "info", "debug")
     * @return false if the name is not recognized
     */
    static bool parse_level(const std::string& name, LogLevel& out) {
        if (name == "error") { out = LogLevel::ERROR; return true; }
        if (name == "warn")  { out = LogLevel::WARN;  return true; }
        if (name == "info")  { out = LogLevel::INFO;  return true; }
        if (name == "debug") { out = LogLevel::DEBUG; return true; }
        return false;
    }

private:
    static std::atomic<LogLevel>& level_ref() {
        static std::atomic<LogLevel> level{LogLevel::INFO};
        return level;
    }

    static std::mutex& stream_mutex() {
        static std::mutex m;
        return m;
    }

    static const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::DEBUG: return "DEBUG";
        }
        return "INFO ";
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << ms;
        return oss.str();
    }

    static void write(LogLevel lvl, const std::string& tag, const std::string& msg) {
        if (static_cast<int>(lvl) > static_cast<int>(level())) {
            return;
        }
        std::string line = timestamp() + " " + level_name(lvl) + " [" + tag + "] " + msg;
        std::lock_guard<std::mutex> lock(stream_mutex());
        if (lvl == LogLevel::ERROR || lvl == LogLevel::WARN) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }
};
