#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

JobManager::JobManager(const std::string& configPath)
    : configPath_(configPath) {
}

std::vector<BackupJob> JobManager::getAllJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadJobs();
}

std::optional<BackupJob> JobManager::getJob(int index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto jobs = loadJobs();
    if (index < 0 || static_cast<size_t>(index) >= jobs.size()) {
        return std::nullopt;
    }
    return jobs[index];
}

size_t JobManager::getJobCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadJobs().size();
}

std::pair<bool, std::string> JobManager::createJob(const std::string& name,
                                                   const std::string& sourceDir,
                                                   const std::string& targetDir,
                                                   BackupType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto jobs = loadJobs();

    if (isBlank(name)) {
        return {false, "Job name cannot be empty"};
    }
    for (const auto& job : jobs) {
        if (equalsIgnoreCase(job.name, name)) {
            return {false, "A job named '" + name + "' already exists"};
        }
    }
    if (isBlank(sourceDir)) {
        return {false, "Source directory cannot be empty"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(sourceDir, ec)) {
        return {false, "Source directory not found: " + sourceDir};
    }
    if (isBlank(targetDir)) {
        return {false, "Target directory cannot be empty"};
    }

    jobs.push_back(BackupJob{name, sourceDir, targetDir, type});
    if (!saveJobs(jobs)) {
        return {false, "Failed to save job configuration: " + lastError_};
    }

    Logger::info("Created job '" + name + "' (" + backupTypeToString(type) + ")");
    return {true, ""};
}

bool JobManager::removeJob(int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto jobs = loadJobs();
    if (index < 0 || static_cast<size_t>(index) >= jobs.size()) {
        lastError_ = "Invalid job index: " + std::to_string(index);
        return false;
    }

    std::string name = jobs[index].name;
    jobs.erase(jobs.begin() + index);
    if (!saveJobs(jobs)) {
        return false;
    }
    Logger::info("Removed job '" + name + "'");
    return true;
}

void JobManager::updateConfigPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    configPath_ = path;
}

std::string JobManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configPath_;
}

std::string JobManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::vector<BackupJob> JobManager::loadJobs() const {
    std::vector<BackupJob> jobs;
    if (!std::filesystem::exists(configPath_)) {
        return jobs;
    }

    try {
        std::ifstream file(configPath_);
        if (!file.is_open()) {
            lastError_ = "Failed to open job configuration: " + configPath_;
            Logger::error(lastError_);
            return jobs;
        }

        json document;
        file >> document;
        for (const auto& item : document) {
            BackupJob job;
            job.name = item.value("name", "");
            job.sourceDir = item.value("sourceDir", "");
            job.targetDir = item.value("targetDir", "");
            std::string type = item.value("type", "Complete");
            if (!backupTypeFromString(type, job.type)) {
                Logger::warning("Job '" + job.name + "' has unknown type '" + type + "', treating as Complete");
                job.type = BackupType::Complete;
            }
            jobs.push_back(job);
        }
    } catch (const std::exception& e) {
        lastError_ = "Failed to read job configuration: " + std::string(e.what());
        Logger::error(lastError_);
        jobs.clear();
    }
    return jobs;
}

bool JobManager::saveJobs(const std::vector<BackupJob>& jobs) {
    try {
        json document = json::array();
        for (const auto& job : jobs) {
            document.push_back({
                {"name", job.name},
                {"sourceDir", job.sourceDir},
                {"targetDir", job.targetDir},
                {"type", backupTypeToString(job.type)}
            });
        }

        std::filesystem::path parent = std::filesystem::path(configPath_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(configPath_, std::ios::trunc);
        if (!file.is_open()) {
            lastError_ = "Failed to open job configuration for writing: " + configPath_;
            Logger::error(lastError_);
            return false;
        }
        file << document.dump(4);
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to write job configuration: " + std::string(e.what());
        Logger::error(lastError_);
        return false;
    }
}
