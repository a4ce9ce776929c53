#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

std::mutex Logger::mutex_;
std::ofstream Logger::stream_;
std::string Logger::logPath_;
LogLevel Logger::threshold_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleOutput_ = true;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty()) {
            std::filesystem::create_directories(logDir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Failed to create diagnostic log directory: " << e.what() << std::endl;
        return false;
    }

    stream_.open(logPath, std::ios::out | std::ios::app);
    if (!stream_.is_open()) {
        std::cerr << "Failed to open diagnostic log " << logPath << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    logPath_ = logPath;
    threshold_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
    stream_.clear();
    logPath_.clear();
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enabled;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

std::string Logger::formatLine(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::ostringstream line;
    line << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << millis
         << " [" << levelToString(level) << "]"
         << " [" << std::this_thread::get_id() << "] "
         << message << '\n';
    return line.str();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < threshold_) {
        return;
    }

    std::string line = formatLine(level, message);

    if (consoleOutput_) {
        std::ostream& console = level >= LogLevel::ERROR ? std::cerr : std::cout;
        console << line;
        console.flush();
    }

    stream_ << line;
    stream_.flush();
    if (!stream_) {
        // Drop the file sink but keep logging to the console
        std::cerr << "Diagnostic log " << logPath_ << " is no longer writable" << std::endl;
        stream_.close();
        stream_.clear();
        stream_.open("/dev/null");
    }
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    write(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    write(LogLevel::FATAL, message);
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
    }
    return "UNKNOWN";
}
