#include "common/lane_scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

LaneAssignment classify(const FileTask& task, uint64_t thresholdBytes) {
    return LaneAssignment{task.fileSize >= thresholdBytes ? Lane::Large : Lane::Small, task.isPriority};
}

std::string laneToString(Lane lane) {
    return lane == Lane::Large ? "large" : "small";
}

LaneScheduler::LaneScheduler(size_t smallLaneSlots, uint64_t thresholdBytes, Executor executor)
    : smallLaneSlots_(std::max<size_t>(1, smallLaneSlots))
    , thresholdBytes_(thresholdBytes)
    , executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("LaneScheduler requires an executor");
    }
}

LaneScheduler::~LaneScheduler() {
    shutdown();
}

void LaneScheduler::start() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (started_) {
        return;
    }
    started_ = true;

    // One worker per small-lane slot plus the single large-lane slot
    for (size_t i = 0; i < smallLaneSlots_ + 1; ++i) {
        workers_.emplace_back(&LaneScheduler::workerThread, this);
    }
}

void LaneScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();
}

void LaneScheduler::submit(const std::vector<FileTask>& tasks) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        for (const auto& task : tasks) {
            LaneAssignment assignment = classify(task, thresholdBytes_);
            Entry entry{task, assignment.lane};
            if (assignment.priority) {
                priorityQueue_.push_back(std::move(entry));
            } else {
                normalQueue_.push_back(std::move(entry));
            }
            ++jobPending_[task.jobName];
            ++stats_.totalTasks;
            ++stats_.currentQueueSize;
        }
    }
    condition_.notify_all();
}

size_t LaneScheduler::discard(const std::string& jobName) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        auto dropFrom = [&](std::deque<Entry>& queue) {
            auto it = std::remove_if(queue.begin(), queue.end(), [&](const Entry& entry) {
                return entry.task.jobName == jobName;
            });
            dropped += static_cast<size_t>(std::distance(it, queue.end()));
            queue.erase(it, queue.end());
        };
        dropFrom(priorityQueue_);
        dropFrom(normalQueue_);

        jobPending_.erase(jobName);
        stats_.discardedTasks += dropped;
        stats_.currentQueueSize -= dropped;
    }
    // Dropped priority tasks may unblock the normal queue
    condition_.notify_all();
    return dropped;
}

void LaneScheduler::wake() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
    }
    condition_.notify_all();
}

size_t LaneScheduler::outstanding(const std::string& jobName) const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    size_t count = 0;
    auto pending = jobPending_.find(jobName);
    if (pending != jobPending_.end()) {
        count += pending->second;
    }
    auto running = jobInFlight_.find(jobName);
    if (running != jobInFlight_.end()) {
        count += running->second;
    }
    return count;
}

size_t LaneScheduler::inFlight(const std::string& jobName) const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    auto running = jobInFlight_.find(jobName);
    return running != jobInFlight_.end() ? running->second : 0;
}

TaskStats LaneScheduler::getStats() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    TaskStats stats = stats_;
    stats.smallInFlight = smallInFlight_;
    stats.largeInFlight = largeInFlight_;
    return stats;
}

bool LaneScheduler::laneAvailable(Lane lane) const {
    return lane == Lane::Large ? largeInFlight_ < 1 : smallInFlight_ < smallLaneSlots_;
}

bool LaneScheduler::takeFrom(std::deque<Entry>& queue, Entry& entry) {
    for (auto it = queue.begin(); it != queue.end(); ++it) {
        if (!laneAvailable(it->lane)) {
            continue;
        }
        if (gate_ && !gate_(it->task.jobName)) {
            continue;
        }
        entry = std::move(*it);
        queue.erase(it);
        return true;
    }
    return false;
}

bool LaneScheduler::selectNext(Entry& entry) {
    if (!priorityQueue_.empty() || priorityInFlight_ > 0) {
        return takeFrom(priorityQueue_, entry);
    }
    return takeFrom(normalQueue_, entry);
}

void LaneScheduler::workerThread() {
    while (true) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this, &entry] {
                return stop_ || selectNext(entry);
            });

            if (stop_) {
                return;
            }

            auto pending = jobPending_.find(entry.task.jobName);
            if (pending != jobPending_.end() && --pending->second == 0) {
                jobPending_.erase(pending);
            }
            ++jobInFlight_[entry.task.jobName];
            if (entry.task.isPriority) {
                ++priorityInFlight_;
            }
            if (entry.lane == Lane::Large) {
                ++largeInFlight_;
            } else {
                ++smallInFlight_;
            }
            --stats_.currentQueueSize;
        }

        if (laneHook_) {
            laneHook_(entry.task, entry.lane, true);
        }

        try {
            executor_(entry.task, entry.lane);
        } catch (const std::exception& e) {
            Logger::error("Transfer of " + entry.task.sourcePath + " raised: " + e.what());
        }

        if (laneHook_) {
            laneHook_(entry.task, entry.lane, false);
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            auto running = jobInFlight_.find(entry.task.jobName);
            if (running != jobInFlight_.end() && --running->second == 0) {
                jobInFlight_.erase(running);
            }
            if (entry.task.isPriority) {
                --priorityInFlight_;
            }
            if (entry.lane == Lane::Large) {
                --largeInFlight_;
            } else {
                --smallInFlight_;
            }
            ++stats_.completedTasks;
        }
        condition_.notify_all();

        if (completion_) {
            completion_(entry.task.jobName);
        }
    }
}
