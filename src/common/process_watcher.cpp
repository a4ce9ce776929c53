#include "common/process_watcher.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

ProcfsProcessSource::ProcfsProcessSource(const std::string& procRoot)
    : procRoot_(procRoot) {
}

std::vector<std::string> ProcfsProcessSource::listProcessNames() {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(procRoot_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string pid = it->path().filename().string();
        if (pid.empty() || !std::all_of(pid.begin(), pid.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }

        // Processes can exit between listing and reading
        std::ifstream comm(it->path() / "comm");
        std::string name;
        if (comm && std::getline(comm, name) && !name.empty()) {
            names.push_back(name);
        }
    }
    if (ec) {
        Logger::warning("Failed to list processes under " + procRoot_ + ": " + ec.message());
    }
    return names;
}

ProcessWatcher::ProcessWatcher(std::shared_ptr<ProcessSource> source)
    : source_(std::move(source)) {
}

ProcessWatcher::~ProcessWatcher() {
    stop();
}

std::string ProcessWatcher::normalizeName(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    auto dot = base.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        base = base.substr(0, dot);
    }
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return base;
}

bool ProcessWatcher::add(const std::string& processName) {
    std::string key = normalizeName(processName);
    if (key.empty()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(watchMutex_);
    return watched_.emplace(key, processName).second;
}

bool ProcessWatcher::remove(const std::string& processName) {
    std::string key = normalizeName(processName);
    bool removed = false;
    {
        std::unique_lock<std::shared_mutex> lock(watchMutex_);
        removed = watched_.erase(key) > 0;
    }
    if (removed) {
        std::lock_guard<std::mutex> lock(pollMutex_);
        present_.erase(key);
    }
    return removed;
}

std::vector<std::string> ProcessWatcher::list() const {
    std::shared_lock<std::shared_mutex> lock(watchMutex_);
    std::vector<std::string> names;
    names.reserve(watched_.size());
    for (const auto& pair : watched_) {
        names.push_back(pair.second);
    }
    return names;
}

bool ProcessWatcher::contains(const std::string& processName) const {
    std::shared_lock<std::shared_mutex> lock(watchMutex_);
    return watched_.count(normalizeName(processName)) > 0;
}

void ProcessWatcher::setWatched(const std::vector<std::string>& names) {
    std::map<std::string, std::string> updated;
    for (const auto& name : names) {
        std::string key = normalizeName(name);
        if (!key.empty()) {
            updated.emplace(key, name);
        }
    }
    std::unique_lock<std::shared_mutex> lock(watchMutex_);
    watched_ = std::move(updated);
}

size_t ProcessWatcher::subscribe(DetectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    size_t id = nextCallbackId_++;
    callbacks_[id] = std::move(callback);
    return id;
}

void ProcessWatcher::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.erase(id);
}

bool ProcessWatcher::start(std::chrono::milliseconds interval) {
    if (running_) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = "Process monitoring is already running";
        return false;
    }
    interval_ = interval;
    running_ = true;
    monitorThread_ = std::thread(&ProcessWatcher::monitorLoop, this);
    Logger::info("Process monitoring started, interval " + std::to_string(interval.count()) + " ms");
    return true;
}

void ProcessWatcher::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        running_ = false;
    }
    loopCondition_.notify_all();
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }
    Logger::info("Process monitoring stopped");
}

void ProcessWatcher::monitorLoop() {
    while (running_) {
        checkNow();

        std::unique_lock<std::mutex> lock(loopMutex_);
        loopCondition_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

std::set<std::string> ProcessWatcher::matchRunning() {
    std::set<std::string> watchedKeys;
    {
        std::shared_lock<std::shared_mutex> lock(watchMutex_);
        for (const auto& pair : watched_) {
            watchedKeys.insert(pair.first);
        }
    }

    std::set<std::string> running;
    if (watchedKeys.empty()) {
        return running;
    }
    for (const auto& name : source_->listProcessNames()) {
        std::string key = normalizeName(name);
        if (watchedKeys.count(key) > 0) {
            running.insert(key);
        }
    }
    return running;
}

std::vector<std::string> ProcessWatcher::checkNow() {
    std::vector<std::string> appeared;
    {
        std::lock_guard<std::mutex> lock(pollMutex_);
        std::set<std::string> running = matchRunning();
        for (const auto& key : running) {
            if (present_.count(key) == 0) {
                appeared.push_back(key);
            }
        }
        present_ = std::move(running);
    }

    if (appeared.empty()) {
        return appeared;
    }

    std::vector<DetectionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        for (const auto& pair : callbacks_) {
            callbacks.push_back(pair.second);
        }
    }

    appeared = displayNames(appeared);
    for (const auto& name : appeared) {
        Logger::warning("Watched process detected: " + name);
        for (const auto& callback : callbacks) {
            try {
                callback(name);
            } catch (const std::exception& e) {
                Logger::error("Process detection listener failed: " + std::string(e.what()));
            }
        }
    }
    return appeared;
}

std::vector<std::string> ProcessWatcher::runningWatched() {
    std::set<std::string> running = matchRunning();
    return displayNames(std::vector<std::string>(running.begin(), running.end()));
}

std::vector<std::string> ProcessWatcher::displayNames(const std::vector<std::string>& keys) const {
    std::shared_lock<std::shared_mutex> lock(watchMutex_);
    std::vector<std::string> names;
    names.reserve(keys.size());
    for (const auto& key : keys) {
        // Removed since the poll
        auto it = watched_.find(key);
        names.push_back(it != watched_.end() ? it->second : key);
    }
    return names;
}

bool ProcessWatcher::load(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return true;
        }
        std::ifstream file(path);
        if (!file.is_open()) {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastError_ = "Failed to open watch list: " + path;
            return false;
        }
        json document;
        file >> document;
        setWatched(document.get<std::vector<std::string>>());
        return true;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = "Failed to read watch list " + path + ": " + e.what();
        return false;
    }
}

bool ProcessWatcher::save(const std::string& path) const {
    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastError_ = "Failed to open watch list for writing: " + path;
            return false;
        }
        file << json(list()).dump(4);
        return true;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = "Failed to write watch list " + path + ": " + e.what();
        return false;
    }
}

std::string ProcessWatcher::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}
