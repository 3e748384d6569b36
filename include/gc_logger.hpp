/**
 * @file gc_logger.hpp
 * @brief Logging system for analytics components
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef GYMCOACH_GC_LOGGER_HPP
#define GYMCOACH_GC_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <optional>
#include <algorithm>
#include <cctype>

namespace gymcoach {

// Use LOG_ prefix to avoid Windows macro conflicts (ERROR is defined in WinGDI.h)
enum class LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

inline std::optional<LogLevel> parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::LOG_TRACE;
    if (name == "debug") return LogLevel::LOG_DEBUG;
    if (name == "info") return LogLevel::LOG_INFO;
    if (name == "warn" || name == "warning") return LogLevel::LOG_WARNING;
    if (name == "error") return LogLevel::LOG_ERROR;
    if (name == "fatal") return LogLevel::LOG_FATAL;
    return std::nullopt;
}

class CoachLogger {
public:
    static CoachLogger& instance() { static CoachLogger l; return l; }

    /// Enables file output in @p dir. Console output is independent of this.
    bool initialize(const std::filesystem::path& dir, LogLevel level = LogLevel::LOG_INFO) {
        std::lock_guard<std::mutex> lock(mtx_);
        dir_ = dir;
        level_ = level;
        std::error_code ec;
        if (!std::filesystem::exists(dir_, ec)) std::filesystem::create_directories(dir_, ec);
        if (ec) return false;
        openFile();
        init_ = file_.is_open();
        return init_;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    void log(LogLevel level, const std::string& component, const std::string& message) {
        if (level < level_) return;
        std::lock_guard<std::mutex> lock(mtx_);
        std::string line = formatLine(level, component, message);
        if (init_ && file_.is_open()) { file_ << line << "\n"; file_.flush(); }
        // stdout carries reports, so console logging goes to stderr
        if (console_) std::cerr << line << "\n";
    }

    void trace(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_TRACE, comp, msg); }
    void debug(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_DEBUG, comp, msg); }
    void info(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_INFO, comp, msg); }
    void warning(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_WARNING, comp, msg); }
    void error(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_ERROR, comp, msg); }
    void fatal(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_FATAL, comp, msg); }

    void rotate() { std::lock_guard<std::mutex> lock(mtx_); if (init_) openFile(); }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
        init_ = false;
    }

private:
    CoachLogger() = default;
    ~CoachLogger() { if (file_.is_open()) file_.close(); }
    CoachLogger(const CoachLogger&) = delete;
    CoachLogger& operator=(const CoachLogger&) = delete;

    static std::tm localNow() {
        auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        return tm;
    }

    void openFile() {
        if (file_.is_open()) file_.close();
        std::tm tm = localNow();
        std::ostringstream fn;
        fn << "gymcoach_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
        file_.open(dir_ / fn.str(), std::ios::app);
    }

    std::string formatLine(LogLevel level, const std::string& comp, const std::string& msg) {
        static const char* levels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        std::tm tm = localNow();
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << levels[static_cast<int>(level)]
            << "] [" << comp << "] " << msg;
        return oss.str();
    }

    mutable std::mutex mtx_;
    std::filesystem::path dir_;
    std::ofstream file_;
    std::atomic<LogLevel> level_{LogLevel::LOG_WARNING};
    bool init_ = false;
    std::atomic<bool> console_{true};
};

#define GC_LOG_TRACE(comp, msg) gymcoach::CoachLogger::instance().trace(comp, msg)
#define GC_LOG_DEBUG(comp, msg) gymcoach::CoachLogger::instance().debug(comp, msg)
#define GC_LOG_INFO(comp, msg) gymcoach::CoachLogger::instance().info(comp, msg)
#define GC_LOG_WARNING(comp, msg) gymcoach::CoachLogger::instance().warning(comp, msg)
#define GC_LOG_ERROR(comp, msg) gymcoach::CoachLogger::instance().error(comp, msg)
#define GC_LOG_FATAL(comp, msg) gymcoach::CoachLogger::instance().fatal(comp, msg)

} // namespace gymcoach
#endif // GYMCOACH_GC_LOGGER_HPP
