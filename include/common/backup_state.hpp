#pragma once

#include <string>
#include <chrono>
#include <cstdint>

enum class BackupState {
    Inactive,
    Active,
    Paused,
    Completed,
    Stopped,
    Error
};

enum class BackupType {
    Complete,
    Differential
};

// Inactive -> Active | Stopped | Error
// Active   -> Paused | Completed | Stopped | Error
// Paused   -> Active | Stopped | Error
bool isValidTransition(BackupState from, BackupState to);
bool isTerminal(BackupState state);

std::string backupStateToString(BackupState state);
bool backupStateFromString(const std::string& name, BackupState& state);
std::string backupTypeToString(BackupType type);
bool backupTypeFromString(const std::string& name, BackupType& type);

struct BackupJobState {
    int id{0};
    std::string name;
    std::string sourcePath;
    std::string targetPath;
    BackupType type{BackupType::Complete};
    BackupState state{BackupState::Inactive};
    std::chrono::system_clock::time_point lastActionTimestamp{std::chrono::system_clock::now()};
    int64_t totalFiles{0};
    int64_t totalSize{0};
    int64_t remainingFiles{0};
    int64_t remainingSize{0};
    int64_t failedFiles{0};
    std::string currentSourceFile;
    std::string currentTargetFile;

    // 100 for a completed job with nothing to copy
    int progressPercentage() const;
};

enum class ErrorKind {
    None,
    Configuration,
    IO,
    Encryption,
    Network
};

std::string errorKindToString(ErrorKind kind);

// Local time as YYYY-MM-DDTHH:MM:SS
std::string formatTimestamp(std::chrono::system_clock::time_point time);
