#pragma once

#include "common/backup_state.hpp"
#include <string>
#include <cstdint>

// Persisted definition of a source/target pair. Read-only during a run.
struct BackupJob {
    std::string name;
    std::string sourceDir;
    std::string targetDir;
    BackupType type{BackupType::Complete};
};

// One file to transfer, produced by FileEnumerator and consumed exactly once
struct FileTask {
    std::string sourcePath;
    std::string destinationPath;
    std::string jobName;
    bool isEncrypted{false};
    bool isPriority{false};
    uint64_t fileSize{0};
};
