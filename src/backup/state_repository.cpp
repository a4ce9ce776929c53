#include "backup/state_repository.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

json stateToJson(const BackupJobState& state) {
    json document;
    document["Id"] = state.id;
    document["Name"] = state.name;
    document["SourcePath"] = state.sourcePath;
    document["TargetPath"] = state.targetPath;
    document["Type"] = backupTypeToString(state.type);
    document["State"] = backupStateToString(state.state);
    document["LastActionTimestamp"] = formatTimestamp(state.lastActionTimestamp);
    document["TotalFiles"] = state.totalFiles;
    document["TotalSize"] = state.totalSize;
    document["RemainingFiles"] = state.remainingFiles;
    document["RemainingSize"] = state.remainingSize;
    document["FailedFiles"] = state.failedFiles;
    document["ProgressPercentage"] = state.progressPercentage();
    document["CurrentSourceFile"] = state.currentSourceFile;
    document["CurrentTargetFile"] = state.currentTargetFile;
    return document;
}

JsonStateRepository::JsonStateRepository(const std::string& statePath)
    : statePath_(statePath) {
}

bool JsonStateRepository::updateState(const std::vector<BackupJobState>& states) {
    json document = json::array();
    for (const auto& state : states) {
        document.push_back(stateToJson(state));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path target(statePath_);
    fs::path temp = target;
    temp += ".tmp";

    try {
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }

        {
            std::ofstream file(temp, std::ios::trunc);
            if (!file.is_open()) {
                lastError_ = "Failed to open state file for writing: " + temp.string();
                Logger::error(lastError_);
                return false;
            }
            file << document.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
            if (!file) {
                lastError_ = "Failed to write state file: " + temp.string();
                Logger::error(lastError_);
                return false;
            }
        }

        fs::rename(temp, target);
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to persist state to " + statePath_ + ": " + e.what();
        Logger::error(lastError_);
        return false;
    }
}

void JsonStateRepository::setStatePath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    statePath_ = path;
}

std::string JsonStateRepository::getStatePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statePath_;
}

std::string JsonStateRepository::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
