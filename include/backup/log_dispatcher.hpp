#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/encryption_gate.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

// One record per file transfer, failed transfers included
struct LogEntry {
    std::string name;
    std::string source;
    std::string target;
    int64_t size{0};
    double transferTime{0.0};     // milliseconds
    int64_t encryptionTime{0};    // milliseconds, 0 when not encrypted, -1 on cipher failure
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::string machineIdentity;
    std::string userIdentity;
    std::string error;

    nlohmann::json toJson() const;
    // indent -1 gives a single line
    std::string serialize(int indent = -1) const;

    static LogEntry fromTransfer(const FileTask& task, const TransferResult& result);
};

std::string currentMachineName();
std::string currentUserName();

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual bool write(const LogEntry& entry, std::string& error) = 0;
};

// Appends to <directory>/log_YYYYMMDD.json
class LocalLogSink : public LogSink {
public:
    LocalLogSink(const std::string& directory, LogFormat format);

    bool write(const LogEntry& entry, std::string& error) override;

    void setDirectory(const std::string& directory);
    std::string getDirectory() const;
    void setFormat(LogFormat format);
    LogFormat getFormat() const;

    std::string filePathFor(std::chrono::system_clock::time_point time) const;

private:
    mutable std::mutex mutex_;
    std::string directory_;
    LogFormat format_;
};

// Address of the log server, shared between the sink and whoever reconfigures it
class RemoteEndpoint {
public:
    explicit RemoteEndpoint(const std::string& serverBase = "http://localhost:5000");

    void setServerBase(const std::string& serverBase);
    std::string getServerBase() const;
    std::string logsUrl() const;

private:
    mutable std::shared_mutex mutex_;
    std::string serverBase_;
};

class RemoteLogSink : public LogSink {
public:
    explicit RemoteLogSink(RemoteEndpoint& endpoint, long timeoutSeconds = 5);
    ~RemoteLogSink() override;

    RemoteLogSink(const RemoteLogSink&) = delete;
    RemoteLogSink& operator=(const RemoteLogSink&) = delete;

    // POST <serverBase>/Logs, any 2xx status is a success
    bool write(const LogEntry& entry, std::string& error) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    RemoteEndpoint& endpoint_;
    long timeoutSeconds_;
};

class LogDispatcher {
public:
    LogDispatcher(std::shared_ptr<LogSink> localSink,
                  std::shared_ptr<LogSink> remoteSink,
                  LogTarget target = LogTarget::Both);

    // Routes one entry. In Both mode the local write always comes first and a
    // remote failure is only counted. A sink that throws counts as a failed
    // write. Returns false when no sink accepted it.
    bool dispatch(const LogEntry& entry);

    void setTarget(LogTarget target);
    LogTarget getTarget() const;

    uint64_t getLocalFailures() const { return localFailures_; }
    uint64_t getRemoteFailures() const { return remoteFailures_; }
    std::string getLastError() const;

private:
    bool writeLocal(const LogEntry& entry);
    bool writeRemote(const LogEntry& entry);

    std::shared_ptr<LogSink> localSink_;
    std::shared_ptr<LogSink> remoteSink_;
    std::atomic<LogTarget> target_;
    std::atomic<uint64_t> localFailures_{0};
    std::atomic<uint64_t> remoteFailures_{0};

    mutable std::mutex errorMutex_;
    std::string lastError_;
};
