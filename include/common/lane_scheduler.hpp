#pragma once

#include "backup/backup_job.hpp"
#include <vector>
#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <map>
#include <string>
#include <cstdint>

enum class Lane {
    Small,
    Large
};

struct LaneAssignment {
    Lane lane;
    bool priority;
};

// Files at or above the threshold go to the large lane
LaneAssignment classify(const FileTask& task, uint64_t thresholdBytes);
std::string laneToString(Lane lane);

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t discardedTasks{0};
    size_t currentQueueSize{0};
    size_t smallInFlight{0};
    size_t largeInFlight{0};
};

// Two-queue, two-lane dispatcher shared by every job of a run.
//
// Priority tasks (any job) are drained before normal tasks: a normal task is only
// handed out once no priority task is pending or in flight. The large lane admits
// one transfer at a time, the small lane admits smallLaneSlots. Tasks whose job is
// refused by the dispatch gate stay queued until wake() is called.
class LaneScheduler {
public:
    using Executor = std::function<void(const FileTask& task, Lane lane)>;
    using DispatchGate = std::function<bool(const std::string& jobName)>;
    using CompletionCallback = std::function<void(const std::string& jobName)>;
    using LaneHook = std::function<void(const FileTask& task, Lane lane, bool entering)>;

    LaneScheduler(size_t smallLaneSlots, uint64_t thresholdBytes, Executor executor);
    ~LaneScheduler();

    LaneScheduler(const LaneScheduler&) = delete;
    LaneScheduler& operator=(const LaneScheduler&) = delete;

    // Callbacks must be installed before start(). The gate runs under the
    // scheduler lock and must not call back into the scheduler.
    void setDispatchGate(DispatchGate gate) { gate_ = std::move(gate); }
    void setCompletionCallback(CompletionCallback callback) { completion_ = std::move(callback); }
    void setLaneHook(LaneHook hook) { laneHook_ = std::move(hook); }

    void start();
    void shutdown();

    // Appends tasks in the given order
    void submit(const std::vector<FileTask>& tasks);

    // Drops every pending task of a job, returns how many were dropped
    size_t discard(const std::string& jobName);

    // Re-evaluates the dispatch gate after a pause/resume change
    void wake();

    // Pending plus in-flight tasks of a job
    size_t outstanding(const std::string& jobName) const;
    size_t inFlight(const std::string& jobName) const;

    TaskStats getStats() const;
    size_t getWorkerCount() const { return workers_.size(); }

private:
    struct Entry {
        FileTask task;
        Lane lane;
    };

    void workerThread();
    bool selectNext(Entry& entry);
    bool takeFrom(std::deque<Entry>& queue, Entry& entry);
    bool laneAvailable(Lane lane) const;

    const size_t smallLaneSlots_;
    const uint64_t thresholdBytes_;
    Executor executor_;
    DispatchGate gate_;
    CompletionCallback completion_;
    LaneHook laneHook_;

    std::vector<std::thread> workers_;
    std::deque<Entry> priorityQueue_;
    std::deque<Entry> normalQueue_;
    size_t priorityInFlight_{0};
    size_t smallInFlight_{0};
    size_t largeInFlight_{0};
    std::map<std::string, size_t> jobPending_;
    std::map<std::string, size_t> jobInFlight_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_{false};
    bool started_{false};

    TaskStats stats_;
};
