#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <functional>

namespace peerlink::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Sink menerima baris log yang sudah diformat
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Ganti output default (stdout/stderr), nullptr untuk reset
    static void setSink(LogSink sink);

    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    // Simple format string implementation, "{}" diganti berurutan
    template<typename... Args>
    static std::string format(const std::string& fmt, Args&&... args) {
        return formatString(fmt, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static LogSink sink_;
    static std::mutex mutex_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) return;

        std::string message = formatString(format, std::forward<Args>(args)...);
        if (sink_) {
            sink_(level, message);
            return;
        }

        // Get current time
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBUG"; break;
            case LogLevel::INFO:  level_str = "INFO "; break;
            case LogLevel::WARN:  level_str = "WARN "; break;
            case LogLevel::ERROR: level_str = "ERROR"; break;
        }

        auto& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << "[" << oss.str() << "] [" << level_str << "] " << message << std::endl;
    }

    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string partial = format;
            partial.replace(pos, 2, oss.str());
            // Lanjutkan setelah nilai yang baru dimasukkan
            std::string head = partial.substr(0, pos + oss.str().size());
            std::string tail = partial.substr(pos + oss.str().size());
            return head + formatString(tail, std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace peerlink::core
