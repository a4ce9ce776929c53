#pragma once

#include "backup/backup_job.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <mutex>

// Job-definition registry backed by a JSON file
class JobManager {
public:
    explicit JobManager(const std::string& configPath = "jobs.json");
    ~JobManager() = default;

    // Job registry and lookup
    std::vector<BackupJob> getAllJobs() const;
    std::optional<BackupJob> getJob(int index) const;
    size_t getJobCount() const;

    // Job lifecycle management
    std::pair<bool, std::string> createJob(const std::string& name,
                                           const std::string& sourceDir,
                                           const std::string& targetDir,
                                           BackupType type);
    bool removeJob(int index);

    void updateConfigPath(const std::string& path);
    std::string getConfigPath() const;

    // Error handling
    std::string getLastError() const;

private:
    std::vector<BackupJob> loadJobs() const;
    bool saveJobs(const std::vector<BackupJob>& jobs);

    std::string configPath_;
    mutable std::string lastError_;
    mutable std::mutex mutex_;
};
