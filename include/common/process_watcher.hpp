#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>

// Lists the names of processes running on the host
class ProcessSource {
public:
    virtual ~ProcessSource() = default;
    virtual std::vector<std::string> listProcessNames() = 0;
};

// Reads /proc/<pid>/comm for every numeric entry of /proc
class ProcfsProcessSource : public ProcessSource {
public:
    explicit ProcfsProcessSource(const std::string& procRoot = "/proc");
    std::vector<std::string> listProcessNames() override;

private:
    std::string procRoot_;
};

class ProcessWatcher {
public:
    using DetectionCallback = std::function<void(const std::string& processName)>;

    explicit ProcessWatcher(std::shared_ptr<ProcessSource> source = std::make_shared<ProcfsProcessSource>());
    ~ProcessWatcher();

    ProcessWatcher(const ProcessWatcher&) = delete;
    ProcessWatcher& operator=(const ProcessWatcher&) = delete;

    // Watch-list mutators, picked up by the next poll
    bool add(const std::string& processName);
    bool remove(const std::string& processName);
    std::vector<std::string> list() const;
    bool contains(const std::string& processName) const;
    void setWatched(const std::vector<std::string>& names);

    size_t subscribe(DetectionCallback callback);
    void unsubscribe(size_t id);

    // Continuous monitoring on a background thread
    bool start(std::chrono::milliseconds interval = std::chrono::milliseconds(2000));
    void stop();
    bool isRunning() const { return running_; }

    // One poll on the calling thread. Returns the names that newly appeared,
    // spelled as they were added to the watch list.
    std::vector<std::string> checkNow();

    // Watched names currently running, without touching the edge state
    std::vector<std::string> runningWatched();

    // JSON array of names
    bool load(const std::string& path);
    bool save(const std::string& path) const;
    std::string getLastError() const;

    // Lower-case base name without directory or extension
    static std::string normalizeName(const std::string& name);

private:
    void monitorLoop();
    std::set<std::string> matchRunning();
    std::vector<std::string> displayNames(const std::vector<std::string>& keys) const;

    std::shared_ptr<ProcessSource> source_;

    mutable std::shared_mutex watchMutex_;
    std::map<std::string, std::string> watched_;   // normalized -> display name

    std::mutex pollMutex_;
    std::set<std::string> present_;

    std::mutex callbackMutex_;
    std::map<size_t, DetectionCallback> callbacks_;
    size_t nextCallbackId_{1};

    std::mutex loopMutex_;
    std::condition_variable loopCondition_;
    std::thread monitorThread_;
    std::atomic<bool> running_{false};
    std::chrono::milliseconds interval_{2000};

    mutable std::mutex errorMutex_;
    mutable std::string lastError_;
};
