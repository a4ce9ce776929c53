#pragma once

#include "common/backup_state.hpp"
#include "backup/backup_job.hpp"
#include "backup/state_repository.hpp"
#include <string>
#include <vector>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <functional>

// Live job states of the current run.
//
// Every change runs under the job's own lock: mutate, refresh the timestamp,
// queue a copy for the ProgressChanged listeners. One thread at a time drains
// a job's queue with no lock held, so listeners see each job's changes in
// order and may call back into the reporter or the orchestrator. A change made
// while another thread is draining is delivered by that thread. The full set
// of states is persisted after delivery.
class StateReporter {
public:
    using ProgressCallback = std::function<void(const BackupJobState& state)>;

    explicit StateReporter(std::shared_ptr<StateRepository> repository);

    void registerJob(const BackupJobState& initial);
    void clear();

    bool setTotals(const std::string& name, int64_t totalFiles, int64_t totalSize);

    // Rejects transitions outside the state machine and unknown jobs
    bool transition(const std::string& name, BackupState to);
    // Applies only while the job is still in the expected state
    bool transitionFrom(const std::string& name, BackupState from, BackupState to);
    size_t transitionAll(BackupState from, BackupState to);

    // One finished transfer, successful or not
    bool applyCompletion(const FileTask& task, bool success);

    // Waits until every queued change has reached the listeners. Not for use
    // from inside a listener.
    void flush();

    std::optional<BackupJobState> snapshot(const std::string& name) const;
    std::vector<BackupJobState> snapshots() const;

    size_t subscribe(ProgressCallback callback);
    void unsubscribe(size_t id);

private:
    struct TrackedJob {
        std::mutex mutex;
        BackupJobState state;
        std::deque<BackupJobState> pending;
        bool draining{false};
        std::condition_variable drained;
    };

    std::shared_ptr<TrackedJob> find(const std::string& name) const;
    bool update(const std::string& name, const std::function<bool(BackupJobState&)>& mutation);
    // Called with the job lock held, true when the caller must deliver
    bool enqueueLocked(TrackedJob& job);
    void deliver(TrackedJob& job);
    void emit(const BackupJobState& state);
    void persist();

    std::shared_ptr<StateRepository> repository_;

    mutable std::shared_mutex jobsMutex_;
    std::map<std::string, std::shared_ptr<TrackedJob>> jobs_;

    std::mutex persistMutex_;

    std::mutex callbackMutex_;
    std::map<size_t, ProgressCallback> callbacks_;
    size_t nextCallbackId_{1};
};
