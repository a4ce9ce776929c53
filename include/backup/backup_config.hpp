#pragma once

#include <string>
#include <vector>
#include <cstdint>

enum class LogTarget {
    Local,
    Server,
    Both
};

enum class LogFormat {
    Tree,   // indented JSON object per record
    Flat    // one JSON object per line
};

std::string logTargetToString(LogTarget target);
bool logTargetFromString(const std::string& name, LogTarget& target);
std::string logFormatToString(LogFormat format);
bool logFormatFromString(const std::string& name, LogFormat& format);

// Orchestrator tuning, copied at the start of each run
struct EngineSettings {
    int maxSimultaneousJobs{3};
    int fileSizeThresholdMB{10};
    std::vector<std::string> priorityExtensions;

    uint64_t thresholdBytes() const {
        return static_cast<uint64_t>(fileSizeThresholdMB) * 1024ULL * 1024ULL;
    }
};

// Everything read from the settings file
struct AppSettings {
    EngineSettings engine;

    std::string encryptionKey{"DefaultKey"};
    std::vector<std::string> encryptedExtensions;

    std::vector<std::string> watchedProcesses;
    int pollIntervalMs{2000};

    LogTarget logTarget{LogTarget::Both};
    LogFormat logFormat{LogFormat::Tree};
    std::string logDirectory{"logs"};
    std::string serverBase{"http://localhost:5000"};

    std::string statePath{"state.json"};
    std::string jobsPath{"jobs.json"};

    std::string logLevel{"INFO"};
    std::string diagnosticLog{"treesave.log"};
};

class SettingsStore {
public:
    explicit SettingsStore(const std::string& path);

    // Missing file yields defaults and is not an error
    bool load(AppSettings& settings);
    bool save(const AppSettings& settings);

    std::string getPath() const { return path_; }
    std::string getLastError() const { return lastError_; }

private:
    std::string path_;
    std::string lastError_;
};
