#pragma once

#include "backup/backup_job.hpp"
#include <string>
#include <vector>
#include <set>
#include <cstdint>

struct EnumerationResult {
    std::vector<FileTask> tasks;
    int64_t totalFiles{0};
    int64_t totalSize{0};
};

// Builds the transfer list of one job run. Stateless apart from the extension sets,
// so one instance can serve several jobs concurrently.
class FileEnumerator {
public:
    FileEnumerator(const std::vector<std::string>& priorityExtensions,
                   const std::vector<std::string>& encryptedExtensions);

    // Source must be a directory; creates the target directory when missing
    bool prepareTarget(const BackupJob& job, std::string& error) const;

    // Tasks come back in traversal order: a directory's files sorted by name,
    // then its subdirectories sorted by name
    bool enumerate(const BackupJob& job, EnumerationResult& result, std::string& error) const;

    // Lower-cased extension with leading dot, empty when the path has none
    static std::string normalizedExtension(const std::string& path);
    static std::string normalizeExtension(const std::string& extension);

private:
    void walk(const BackupJob& job, const std::string& relativeDir, EnumerationResult& result) const;
    bool needsTransfer(const BackupJob& job, const std::string& sourceFile,
                       const std::string& destinationFile) const;

    std::set<std::string> priorityExtensions_;
    std::set<std::string> encryptedExtensions_;
};
