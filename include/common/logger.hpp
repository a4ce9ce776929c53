#pragma once

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Process-wide diagnostic log. Transfer records go through LogDispatcher instead.
// Every line carries the writing thread so lane workers can be told apart.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);
    static bool isInitialized();
    static std::string getLogPath();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

    // Accepts DEBUG, INFO, WARNING (or WARN), ERROR, FATAL in any case; unknown names map to INFO
    static LogLevel parseLevel(const std::string& name);
    static std::string levelToString(LogLevel level);

private:
    static void write(LogLevel level, const std::string& message);
    static std::string formatLine(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static std::ofstream stream_;
    static std::string logPath_;
    static LogLevel threshold_;
    static bool initialized_;
    static bool consoleOutput_;
};
