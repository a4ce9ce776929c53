#include "backup/state_reporter.hpp"
#include "common/logger.hpp"
#include <algorithm>

StateReporter::StateReporter(std::shared_ptr<StateRepository> repository)
    : repository_(std::move(repository)) {
}

void StateReporter::registerJob(const BackupJobState& initial) {
    auto tracked = std::make_shared<TrackedJob>();
    tracked->state = initial;
    tracked->state.lastActionTimestamp = std::chrono::system_clock::now();
    {
        std::unique_lock<std::shared_mutex> lock(jobsMutex_);
        jobs_[initial.name] = tracked;
    }
    bool drain = false;
    {
        std::lock_guard<std::mutex> lock(tracked->mutex);
        drain = enqueueLocked(*tracked);
    }
    if (drain) {
        deliver(*tracked);
    }
    persist();
}

void StateReporter::clear() {
    std::unique_lock<std::shared_mutex> lock(jobsMutex_);
    jobs_.clear();
}

std::shared_ptr<StateReporter::TrackedJob> StateReporter::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(jobsMutex_);
    auto it = jobs_.find(name);
    return it != jobs_.end() ? it->second : nullptr;
}

bool StateReporter::update(const std::string& name, const std::function<bool(BackupJobState&)>& mutation) {
    auto tracked = find(name);
    if (!tracked) {
        Logger::warning("State update for untracked job: " + name);
        return false;
    }
    bool drain = false;
    {
        std::lock_guard<std::mutex> lock(tracked->mutex);
        if (!mutation(tracked->state)) {
            return false;
        }
        tracked->state.lastActionTimestamp = std::chrono::system_clock::now();
        drain = enqueueLocked(*tracked);
    }
    if (drain) {
        deliver(*tracked);
    }
    persist();
    return true;
}

bool StateReporter::enqueueLocked(TrackedJob& job) {
    job.pending.push_back(job.state);
    if (job.draining) {
        return false;
    }
    job.draining = true;
    return true;
}

void StateReporter::deliver(TrackedJob& job) {
    while (true) {
        BackupJobState next;
        {
            std::lock_guard<std::mutex> lock(job.mutex);
            if (job.pending.empty()) {
                job.draining = false;
                job.drained.notify_all();
                return;
            }
            next = std::move(job.pending.front());
            job.pending.pop_front();
        }
        emit(next);
    }
}

bool StateReporter::setTotals(const std::string& name, int64_t totalFiles, int64_t totalSize) {
    return update(name, [&](BackupJobState& state) {
        state.totalFiles = totalFiles;
        state.totalSize = totalSize;
        state.remainingFiles = totalFiles;
        state.remainingSize = totalSize;
        state.failedFiles = 0;
        return true;
    });
}

bool StateReporter::transition(const std::string& name, BackupState to) {
    return update(name, [&](BackupJobState& state) {
        if (!isValidTransition(state.state, to)) {
            Logger::debug("Rejected transition of " + name + " from " +
                          backupStateToString(state.state) + " to " + backupStateToString(to));
            return false;
        }
        state.state = to;
        if (isTerminal(to)) {
            state.currentSourceFile.clear();
            state.currentTargetFile.clear();
        }
        return true;
    });
}

bool StateReporter::transitionFrom(const std::string& name, BackupState from, BackupState to) {
    return update(name, [&](BackupJobState& state) {
        if (state.state != from || !isValidTransition(from, to)) {
            return false;
        }
        state.state = to;
        return true;
    });
}

size_t StateReporter::transitionAll(BackupState from, BackupState to) {
    std::vector<std::string> names;
    for (const auto& state : snapshots()) {
        if (state.state == from) {
            names.push_back(state.name);
        }
    }

    size_t changed = 0;
    for (const auto& name : names) {
        // The job may have moved on since the snapshot
        if (transitionFrom(name, from, to)) {
            ++changed;
        }
    }
    return changed;
}

bool StateReporter::applyCompletion(const FileTask& task, bool success) {
    return update(task.jobName, [&](BackupJobState& state) {
        state.remainingFiles = std::max<int64_t>(0, state.remainingFiles - 1);
        state.remainingSize = std::max<int64_t>(0, state.remainingSize - static_cast<int64_t>(task.fileSize));
        if (!success) {
            ++state.failedFiles;
        }
        state.currentSourceFile = task.sourcePath;
        state.currentTargetFile = task.destinationPath;
        return true;
    });
}

void StateReporter::flush() {
    std::vector<std::shared_ptr<TrackedJob>> tracked;
    {
        std::shared_lock<std::shared_mutex> lock(jobsMutex_);
        for (const auto& pair : jobs_) {
            tracked.push_back(pair.second);
        }
    }
    for (const auto& job : tracked) {
        std::unique_lock<std::mutex> lock(job->mutex);
        job->drained.wait(lock, [&job] { return !job->draining; });
    }
}

std::optional<BackupJobState> StateReporter::snapshot(const std::string& name) const {
    auto tracked = find(name);
    if (!tracked) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(tracked->mutex);
    return tracked->state;
}

std::vector<BackupJobState> StateReporter::snapshots() const {
    std::vector<std::shared_ptr<TrackedJob>> tracked;
    {
        std::shared_lock<std::shared_mutex> lock(jobsMutex_);
        for (const auto& pair : jobs_) {
            tracked.push_back(pair.second);
        }
    }

    std::vector<BackupJobState> states;
    states.reserve(tracked.size());
    for (const auto& job : tracked) {
        std::lock_guard<std::mutex> lock(job->mutex);
        states.push_back(job->state);
    }
    std::sort(states.begin(), states.end(), [](const BackupJobState& a, const BackupJobState& b) {
        return a.id < b.id;
    });
    return states;
}

size_t StateReporter::subscribe(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    size_t id = nextCallbackId_++;
    callbacks_[id] = std::move(callback);
    return id;
}

void StateReporter::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.erase(id);
}

void StateReporter::emit(const BackupJobState& state) {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        for (const auto& pair : callbacks_) {
            callbacks.push_back(pair.second);
        }
    }

    const BackupJobState copy = state;
    for (const auto& callback : callbacks) {
        try {
            callback(copy);
        } catch (const std::exception& e) {
            Logger::error("Progress listener failed: " + std::string(e.what()));
        }
    }
}

void StateReporter::persist() {
    if (!repository_) {
        return;
    }
    std::lock_guard<std::mutex> lock(persistMutex_);
    if (!repository_->updateState(snapshots())) {
        Logger::warning("Job state snapshot was not persisted");
    }
}
