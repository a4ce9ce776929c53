#pragma once

#include "backup/backup_config.hpp"
#include <string>
#include <vector>

// Turns selections such as "1-3", "1;3" or "2" (1-based, several arguments
// allowed) into sorted, de-duplicated 0-based job indices
bool parseJobIndices(const std::vector<std::string>& selection,
                     std::vector<int>& indices,
                     std::string& error);

class BackupCLI {
public:
    explicit BackupCLI(const std::string& settingsPath = "treesave.json");

    // Returns the process exit code
    int run(const std::vector<std::string>& args);

    // Where `run` reads pause/resume/stop commands, stdin by default; -1 disables
    void setControlInput(int fd) { controlFd_ = fd; }
    void printUsage() const;

private:
    bool loadSettings();
    bool saveSettings();

    int handleRunCommand(const std::vector<std::string>& args);
    int handleJobsCommand(const std::vector<std::string>& args);
    int handleWatchCommand(const std::vector<std::string>& args);
    int handleEncryptCommand(const std::vector<std::string>& args);

    int fail(const std::string& message) const;

    std::string settingsPath_;
    AppSettings settings_;
    int controlFd_;
};
