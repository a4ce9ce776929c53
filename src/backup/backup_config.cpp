#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string logTargetToString(LogTarget target) {
    switch (target) {
        case LogTarget::Local:  return "Local";
        case LogTarget::Server: return "Server";
        case LogTarget::Both:   return "Both";
    }
    return "Both";
}

bool logTargetFromString(const std::string& name, LogTarget& target) {
    std::string lower = toLower(name);
    if (lower == "local") {
        target = LogTarget::Local;
    } else if (lower == "server") {
        target = LogTarget::Server;
    } else if (lower == "both") {
        target = LogTarget::Both;
    } else {
        return false;
    }
    return true;
}

std::string logFormatToString(LogFormat format) {
    return format == LogFormat::Tree ? "Tree" : "Flat";
}

bool logFormatFromString(const std::string& name, LogFormat& format) {
    std::string lower = toLower(name);
    if (lower == "tree") {
        format = LogFormat::Tree;
    } else if (lower == "flat") {
        format = LogFormat::Flat;
    } else {
        return false;
    }
    return true;
}

SettingsStore::SettingsStore(const std::string& path)
    : path_(path) {
}

bool SettingsStore::load(AppSettings& settings) {
    lastError_.clear();
    settings = AppSettings();

    if (!std::filesystem::exists(path_)) {
        Logger::info("Settings file " + path_ + " not found, using defaults");
        return true;
    }

    try {
        std::ifstream file(path_);
        if (!file.is_open()) {
            lastError_ = "Failed to open settings file: " + path_;
            return false;
        }

        json document;
        file >> document;

        if (document.contains("engine")) {
            const auto& engine = document["engine"];
            settings.engine.maxSimultaneousJobs =
                std::clamp(engine.value("maxSimultaneousJobs", settings.engine.maxSimultaneousJobs), 1, 10);
            settings.engine.fileSizeThresholdMB =
                std::max(1, engine.value("fileSizeThresholdMB", settings.engine.fileSizeThresholdMB));
            settings.engine.priorityExtensions =
                engine.value("priorityExtensions", settings.engine.priorityExtensions);
        }

        if (document.contains("encryption")) {
            const auto& encryption = document["encryption"];
            settings.encryptionKey = encryption.value("key", settings.encryptionKey);
            settings.encryptedExtensions = encryption.value("extensions", settings.encryptedExtensions);
        }

        if (document.contains("processes")) {
            const auto& processes = document["processes"];
            settings.watchedProcesses = processes.value("watched", settings.watchedProcesses);
            settings.pollIntervalMs = std::max(50, processes.value("pollIntervalMs", settings.pollIntervalMs));
        }

        if (document.contains("logging")) {
            const auto& logging = document["logging"];
            std::string target = logging.value("target", logTargetToString(settings.logTarget));
            if (!logTargetFromString(target, settings.logTarget)) {
                Logger::warning("Unknown log target '" + target + "', keeping " +
                                logTargetToString(settings.logTarget));
            }
            std::string format = logging.value("format", logFormatToString(settings.logFormat));
            if (!logFormatFromString(format, settings.logFormat)) {
                Logger::warning("Unknown log format '" + format + "', keeping " +
                                logFormatToString(settings.logFormat));
            }
            settings.logDirectory = logging.value("directory", settings.logDirectory);
            settings.serverBase = logging.value("serverBase", settings.serverBase);
            settings.logLevel = logging.value("level", settings.logLevel);
            settings.diagnosticLog = logging.value("diagnosticLog", settings.diagnosticLog);
        }

        settings.statePath = document.value("statePath", settings.statePath);
        settings.jobsPath = document.value("jobsPath", settings.jobsPath);
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to parse settings file " + path_ + ": " + e.what();
        settings = AppSettings();
        return false;
    }
}

bool SettingsStore::save(const AppSettings& settings) {
    lastError_.clear();
    try {
        json document;
        document["engine"] = {
            {"maxSimultaneousJobs", settings.engine.maxSimultaneousJobs},
            {"fileSizeThresholdMB", settings.engine.fileSizeThresholdMB},
            {"priorityExtensions", settings.engine.priorityExtensions}
        };
        document["encryption"] = {
            {"key", settings.encryptionKey},
            {"extensions", settings.encryptedExtensions}
        };
        document["processes"] = {
            {"watched", settings.watchedProcesses},
            {"pollIntervalMs", settings.pollIntervalMs}
        };
        document["logging"] = {
            {"target", logTargetToString(settings.logTarget)},
            {"format", logFormatToString(settings.logFormat)},
            {"directory", settings.logDirectory},
            {"serverBase", settings.serverBase},
            {"level", settings.logLevel},
            {"diagnosticLog", settings.diagnosticLog}
        };
        document["statePath"] = settings.statePath;
        document["jobsPath"] = settings.jobsPath;

        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(path_, std::ios::trunc);
        if (!file.is_open()) {
            lastError_ = "Failed to open settings file for writing: " + path_;
            return false;
        }
        file << document.dump(4);
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to write settings file " + path_ + ": " + e.what();
        return false;
    }
}
