#include "backup/file_enumerator.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

FileEnumerator::FileEnumerator(const std::vector<std::string>& priorityExtensions,
                               const std::vector<std::string>& encryptedExtensions) {
    for (const auto& ext : priorityExtensions) {
        std::string normalized = normalizeExtension(ext);
        if (!normalized.empty()) {
            priorityExtensions_.insert(normalized);
        }
    }
    for (const auto& ext : encryptedExtensions) {
        std::string normalized = normalizeExtension(ext);
        if (!normalized.empty()) {
            encryptedExtensions_.insert(normalized);
        }
    }
}

bool FileEnumerator::prepareTarget(const BackupJob& job, std::string& error) const {
    std::error_code ec;
    if (job.sourceDir.empty() || !fs::is_directory(job.sourceDir, ec)) {
        error = "Source directory '" + job.sourceDir + "' does not exist";
        return false;
    }
    if (job.targetDir.empty()) {
        error = "Target directory is not set";
        return false;
    }

    fs::create_directories(job.targetDir, ec);
    if (ec || !fs::is_directory(job.targetDir)) {
        error = "Unable to create target directory '" + job.targetDir + "'" +
                (ec ? ": " + ec.message() : std::string());
        return false;
    }
    return true;
}

bool FileEnumerator::enumerate(const BackupJob& job, EnumerationResult& result, std::string& error) const {
    result = EnumerationResult();

    std::error_code ec;
    if (!fs::is_directory(job.sourceDir, ec)) {
        error = "Source directory '" + job.sourceDir + "' does not exist";
        return false;
    }

    try {
        walk(job, "", result);
    } catch (const fs::filesystem_error& e) {
        error = "Failed to enumerate '" + job.sourceDir + "': " + e.what();
        return false;
    }

    result.totalFiles = static_cast<int64_t>(result.tasks.size());
    Logger::debug("Enumerated " + std::to_string(result.totalFiles) + " file(s), " +
                  std::to_string(result.totalSize) + " byte(s) for job '" + job.name + "'");
    return true;
}

void FileEnumerator::walk(const BackupJob& job, const std::string& relativeDir, EnumerationResult& result) const {
    fs::path sourceDir = relativeDir.empty() ? fs::path(job.sourceDir) : fs::path(job.sourceDir) / relativeDir;

    std::vector<fs::path> files;
    std::vector<fs::path> directories;
    for (const auto& entry : fs::directory_iterator(sourceDir)) {
        // Linked directories are not followed, links can form cycles
        if (entry.is_symlink() && entry.is_directory()) {
            Logger::debug("Skipping linked directory " + entry.path().string());
            continue;
        }
        if (entry.is_directory()) {
            directories.push_back(entry.path().filename());
        } else if (entry.is_regular_file()) {
            files.push_back(entry.path().filename());
        }
    }
    std::sort(files.begin(), files.end());
    std::sort(directories.begin(), directories.end());

    for (const auto& name : files) {
        fs::path relative = relativeDir.empty() ? name : fs::path(relativeDir) / name;
        std::string sourceFile = (fs::path(job.sourceDir) / relative).string();
        std::string destinationFile = (fs::path(job.targetDir) / relative).string();

        if (!needsTransfer(job, sourceFile, destinationFile)) {
            continue;
        }

        FileTask task;
        task.sourcePath = sourceFile;
        task.destinationPath = destinationFile;
        task.jobName = job.name;
        task.fileSize = fs::file_size(sourceFile);

        std::string ext = normalizedExtension(sourceFile);
        task.isPriority = !ext.empty() && priorityExtensions_.count(ext) > 0;
        task.isEncrypted = !ext.empty() && encryptedExtensions_.count(ext) > 0;

        result.totalSize += static_cast<int64_t>(task.fileSize);
        result.tasks.push_back(std::move(task));
    }

    for (const auto& name : directories) {
        walk(job, relativeDir.empty() ? name.string() : (fs::path(relativeDir) / name).string(), result);
    }
}

bool FileEnumerator::needsTransfer(const BackupJob& job, const std::string& sourceFile,
                                   const std::string& destinationFile) const {
    if (job.type == BackupType::Complete) {
        return true;
    }

    std::error_code ec;
    if (!fs::exists(destinationFile, ec)) {
        return true;
    }
    auto destinationTime = fs::last_write_time(destinationFile, ec);
    if (ec) {
        return true;
    }
    return fs::last_write_time(sourceFile) > destinationTime;
}

std::string FileEnumerator::normalizedExtension(const std::string& path) {
    return normalizeExtension(fs::path(path).extension().string());
}

std::string FileEnumerator::normalizeExtension(const std::string& extension) {
    std::string ext;
    for (char c : extension) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (ext.empty() || ext == ".") {
        return "";
    }
    return ext[0] == '.' ? ext : "." + ext;
}
