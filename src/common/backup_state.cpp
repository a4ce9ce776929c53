#include "common/backup_state.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

bool isValidTransition(BackupState from, BackupState to) {
    switch (from) {
        case BackupState::Inactive:
            return to == BackupState::Active || to == BackupState::Stopped || to == BackupState::Error;
        case BackupState::Active:
            return to == BackupState::Paused || to == BackupState::Completed ||
                   to == BackupState::Stopped || to == BackupState::Error;
        case BackupState::Paused:
            return to == BackupState::Active || to == BackupState::Stopped || to == BackupState::Error;
        case BackupState::Completed:
        case BackupState::Stopped:
        case BackupState::Error:
            return false;
    }
    return false;
}

bool isTerminal(BackupState state) {
    return state == BackupState::Completed || state == BackupState::Stopped || state == BackupState::Error;
}

std::string backupStateToString(BackupState state) {
    switch (state) {
        case BackupState::Inactive:  return "Inactive";
        case BackupState::Active:    return "Active";
        case BackupState::Paused:    return "Paused";
        case BackupState::Completed: return "Completed";
        case BackupState::Stopped:   return "Stopped";
        case BackupState::Error:     return "Error";
    }
    return "Unknown";
}

bool backupStateFromString(const std::string& name, BackupState& state) {
    for (auto candidate : {BackupState::Inactive, BackupState::Active, BackupState::Paused,
                           BackupState::Completed, BackupState::Stopped, BackupState::Error}) {
        if (backupStateToString(candidate) == name) {
            state = candidate;
            return true;
        }
    }
    return false;
}

std::string backupTypeToString(BackupType type) {
    return type == BackupType::Complete ? "Complete" : "Differential";
}

bool backupTypeFromString(const std::string& name, BackupType& type) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "complete" || lower == "full") {
        type = BackupType::Complete;
        return true;
    }
    if (lower == "differential" || lower == "diff") {
        type = BackupType::Differential;
        return true;
    }
    return false;
}

int BackupJobState::progressPercentage() const {
    if (totalSize <= 0) {
        return state == BackupState::Completed ? 100 : 0;
    }
    int64_t processed = totalSize - remainingSize;
    return static_cast<int>(processed * 100 / totalSize);
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "None";
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::IO:            return "IOError";
        case ErrorKind::Encryption:    return "EncryptionError";
        case ErrorKind::Network:       return "NetworkError";
    }
    return "Unknown";
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm localTime{};
    localtime_r(&raw, &localTime);
    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}
