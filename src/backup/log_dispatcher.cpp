#include "backup/log_dispatcher.hpp"
#include "common/logger.hpp"
#include "common/backup_state.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>
#include <climits>

namespace fs = std::filesystem;
using json = nlohmann::json;

json LogEntry::toJson() const {
    json record;
    record["Name"] = name;
    record["Source"] = source;
    record["Target"] = target;
    record["Size"] = size;
    record["Time"] = transferTime;
    record["EncryptionTime"] = encryptionTime;
    record["Timestamp"] = formatTimestamp(timestamp);
    record["MachineName"] = machineIdentity;
    record["UserName"] = userIdentity;
    if (!error.empty()) {
        record["Error"] = error;
    }
    return record;
}

std::string LogEntry::serialize(int indent) const {
    // Paths are raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing
    return toJson().dump(indent, ' ', false, json::error_handler_t::replace);
}

LogEntry LogEntry::fromTransfer(const FileTask& task, const TransferResult& result) {
    LogEntry entry;
    entry.name = task.jobName;
    entry.source = task.sourcePath;
    entry.target = task.destinationPath;
    entry.size = static_cast<int64_t>(result.success ? task.fileSize : result.bytesCopied);
    entry.transferTime = result.transferMs;
    entry.encryptionTime = result.encryptionMs;
    entry.timestamp = std::chrono::system_clock::now();
    entry.machineIdentity = currentMachineName();
    entry.userIdentity = currentUserName();
    if (!result.success) {
        entry.error = errorKindToString(result.errorKind) + ": " + result.error;
    }
    return entry;
}

std::string currentMachineName() {
    char hostname[HOST_NAME_MAX + 1] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return "unknown";
    }
    return hostname;
}

std::string currentUserName() {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    struct passwd* pw = getpwuid(geteuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "unknown";
}

LocalLogSink::LocalLogSink(const std::string& directory, LogFormat format)
    : directory_(directory), format_(format) {
}

std::string LocalLogSink::filePathFor(std::chrono::system_clock::time_point time) const {
    std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm localTime{};
    localtime_r(&raw, &localTime);
    std::stringstream name;
    name << "log_" << std::put_time(&localTime, "%Y%m%d") << ".json";

    std::lock_guard<std::mutex> lock(mutex_);
    return (fs::path(directory_) / name.str()).string();
}

bool LocalLogSink::write(const LogEntry& entry, std::string& error) {
    std::string path = filePathFor(entry.timestamp);

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        fs::create_directories(directory_);
        std::ofstream file(path, std::ios::app);
        if (!file.is_open()) {
            error = "Failed to open log file: " + path;
            return false;
        }
        file << entry.serialize(format_ == LogFormat::Tree ? 4 : -1) << "\n";
        file.flush();
        if (!file) {
            error = "Failed to write log file: " + path;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = "Failed to write log file " + path + ": " + e.what();
        return false;
    }
}

void LocalLogSink::setDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    directory_ = directory;
}

std::string LocalLogSink::getDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return directory_;
}

void LocalLogSink::setFormat(LogFormat format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

LogFormat LocalLogSink::getFormat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return format_;
}

RemoteEndpoint::RemoteEndpoint(const std::string& serverBase)
    : serverBase_(serverBase) {
}

void RemoteEndpoint::setServerBase(const std::string& serverBase) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    serverBase_ = serverBase;
}

std::string RemoteEndpoint::getServerBase() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return serverBase_;
}

std::string RemoteEndpoint::logsUrl() const {
    std::string base = getServerBase();
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/Logs";
}

RemoteLogSink::RemoteLogSink(RemoteEndpoint& endpoint, long timeoutSeconds)
    : endpoint_(endpoint), timeoutSeconds_(timeoutSeconds) {
    curl_global_init(CURL_GLOBAL_ALL);
}

RemoteLogSink::~RemoteLogSink() {
    curl_global_cleanup();
}

size_t RemoteLogSink::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

bool RemoteLogSink::write(const LogEntry& entry, std::string& error) {
    std::string url = endpoint_.logsUrl();

    std::string body;
    try {
        body = entry.serialize();
    } catch (const std::exception& e) {
        error = "Failed to encode transfer record for " + url + ": " + e.what();
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "Failed to initialize CURL";
        return false;
    }

    std::string response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        error = "POST " + url + " failed: " + std::string(curl_easy_strerror(res));
        return false;
    }
    if (httpCode < 200 || httpCode >= 300) {
        error = "POST " + url + " returned HTTP " + std::to_string(httpCode);
        return false;
    }
    return true;
}

LogDispatcher::LogDispatcher(std::shared_ptr<LogSink> localSink,
                             std::shared_ptr<LogSink> remoteSink,
                             LogTarget target)
    : localSink_(std::move(localSink)),
      remoteSink_(std::move(remoteSink)),
      target_(target) {
}

bool LogDispatcher::dispatch(const LogEntry& entry) {
    switch (target_.load()) {
        case LogTarget::Local:
            return writeLocal(entry);
        case LogTarget::Server:
            return writeRemote(entry);
        case LogTarget::Both: {
            bool local = writeLocal(entry);
            bool remote = writeRemote(entry);
            return local || remote;
        }
    }
    return false;
}

bool LogDispatcher::writeLocal(const LogEntry& entry) {
    if (!localSink_) {
        return false;
    }
    std::string error;
    try {
        if (localSink_->write(entry, error)) {
            return true;
        }
    } catch (const std::exception& e) {
        error = e.what();
    }
    ++localFailures_;
    Logger::error("Local transfer log write failed: " + error);
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
    return false;
}

bool LogDispatcher::writeRemote(const LogEntry& entry) {
    if (!remoteSink_) {
        return false;
    }
    std::string error;
    try {
        if (remoteSink_->write(entry, error)) {
            return true;
        }
    } catch (const std::exception& e) {
        error = e.what();
    }
    ++remoteFailures_;
    Logger::warning(errorKindToString(ErrorKind::Network) + ": " + error);
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
    return false;
}

void LogDispatcher::setTarget(LogTarget target) {
    target_ = target;
    Logger::info("Transfer log target set to " + logTargetToString(target));
}

LogTarget LogDispatcher::getTarget() const {
    return target_.load();
}

std::string LogDispatcher::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}
