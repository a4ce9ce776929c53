#include "backup/backup_orchestrator.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <sstream>

namespace {

std::string joinLines(const std::vector<std::string>& lines) {
    std::stringstream ss;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            ss << "\n";
        }
        ss << lines[i];
    }
    return ss.str();
}

}  // namespace

BackupOrchestrator::BackupOrchestrator(JobManager& jobManager,
                                       EncryptionConfig& encryptionConfig,
                                       LogDispatcher& logDispatcher,
                                       std::shared_ptr<StateRepository> stateRepository,
                                       ProcessWatcher* processWatcher,
                                       const EngineSettings& settings)
    : jobManager_(jobManager)
    , encryptionConfig_(encryptionConfig)
    , encryptionGate_(encryptionConfig)
    , logDispatcher_(logDispatcher)
    , stateReporter_(std::move(stateRepository))
    , processWatcher_(processWatcher) {
    updateThreadingSettings(settings.maxSimultaneousJobs, settings.fileSizeThresholdMB);
    setPriorityExtensions(settings.priorityExtensions);

    if (processWatcher_) {
        watcherSubscription_ = processWatcher_->subscribe(
            [this](const std::string& processName) { onProcessDetected(processName); });
    }
}

BackupOrchestrator::~BackupOrchestrator() {
    if (processWatcher_) {
        processWatcher_->unsubscribe(watcherSubscription_);
    }
}

std::optional<std::string> BackupOrchestrator::executeBackup(const std::vector<int>& jobIndices) {
    std::unique_lock<std::mutex> runLock(runMutex_, std::try_to_lock);
    if (!runLock.owns_lock()) {
        setLastError("A backup run is already in progress");
        return getLastError();
    }
    if (jobIndices.empty()) {
        setLastError("No backup job specified.");
        return getLastError();
    }

    const EngineSettings settings = getSettings();
    const std::vector<BackupJob> allJobs = jobManager_.getAllJobs();

    std::vector<std::string> errors;
    std::vector<std::pair<BackupJob, int>> selected;
    std::set<std::string> seen;
    for (int index : jobIndices) {
        if (index < 0 || static_cast<size_t>(index) >= allJobs.size()) {
            errors.push_back(errorKindToString(ErrorKind::Configuration) +
                             ": Invalid job index: " + std::to_string(index));
            continue;
        }
        const BackupJob& job = allJobs[index];
        if (!seen.insert(job.name).second) {
            Logger::warning("Job " + job.name + " selected more than once, running it once");
            continue;
        }
        selected.emplace_back(job, index);
    }

    if (selected.empty()) {
        setLastError(errors.empty() ? "No backup job specified." : joinLines(errors));
        return getLastError();
    }

    stateReporter_.clear();
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        runs_.clear();
        runOrder_.clear();
        globalPaused_ = false;
        activeJobs_ = 0;
        running_ = true;
        for (const auto& entry : selected) {
            JobRun run;
            run.job = entry.first;
            runs_[entry.first.name] = std::move(run);
            runOrder_.push_back(entry.first.name);
        }
    }

    for (const auto& entry : selected) {
        BackupJobState state;
        state.id = entry.second + 1;
        state.name = entry.first.name;
        state.sourcePath = entry.first.sourceDir;
        state.targetPath = entry.first.targetDir;
        state.type = entry.first.type;
        state.state = BackupState::Inactive;
        stateReporter_.registerJob(state);
    }

    // Every selected job is analysed up front so that all priority files of
    // the run are queued before the first transfer is dispatched
    FileEnumerator enumerator(settings.priorityExtensions, encryptionConfig_.getExtensions());
    std::vector<std::future<std::string>> analyses;
    for (const auto& entry : selected) {
        const BackupJob job = entry.first;
        analyses.push_back(ThreadUtils::async([this, &enumerator, job]() -> std::string {
            try {
                std::string error;
                EnumerationResult result;
                if (!enumerator.prepareTarget(job, error) || !enumerator.enumerate(job, result, error)) {
                    return error;
                }
                stateReporter_.setTotals(job.name, result.totalFiles, result.totalSize);
                std::lock_guard<std::mutex> lock(controlMutex_);
                JobRun& run = runs_[job.name];
                run.files = std::move(result);
                run.prepared = true;
                return std::string();
            } catch (const std::exception& e) {
                return std::string(e.what());
            }
        }));
    }
    ThreadUtils::waitAll(analyses);

    for (size_t i = 0; i < selected.size(); ++i) {
        std::string error = analyses[i].get();
        if (error.empty()) {
            continue;
        }
        const std::string& name = selected[i].first.name;
        Logger::error("Job " + name + " could not start: " + error);
        errors.push_back(errorKindToString(ErrorKind::Configuration) +
                         ": Job '" + name + "' could not start: " + error);
        stateReporter_.transition(name, BackupState::Error);
        std::lock_guard<std::mutex> lock(controlMutex_);
        runs_[name].finished = true;
    }

    auto scheduler = std::make_shared<LaneScheduler>(
        static_cast<size_t>(settings.maxSimultaneousJobs), settings.thresholdBytes(),
        [this](const FileTask& task, Lane lane) { transfer(task, lane); });
    scheduler->setDispatchGate([this](const std::string& jobName) { return canDispatch(jobName); });
    scheduler->setCompletionCallback([this](const std::string& jobName) { checkJobFinished(jobName); });
    {
        std::lock_guard<std::mutex> lock(settingsMutex_);
        if (transferHook_) {
            scheduler->setLaneHook(transferHook_);
        }
    }
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        scheduler_ = scheduler;
    }

    // A watched process that is already running blocks the run from the start
    if (processWatcher_) {
        for (const auto& processName : processWatcher_->runningWatched()) {
            onProcessDetected(processName);
        }
    }

    scheduler->start();
    Logger::info("Backup run started: " + std::to_string(selected.size()) + " job(s), " +
                 std::to_string(settings.maxSimultaneousJobs) + " job slot(s), large file threshold " +
                 std::to_string(settings.fileSizeThresholdMB) + " MB");

    const size_t maxJobs = static_cast<size_t>(settings.maxSimultaneousJobs);
    size_t next = 0;
    std::unique_lock<std::mutex> lock(controlMutex_);
    while (true) {
        std::vector<std::string> toAdmit;
        while (activeJobs_ < maxJobs && next < runOrder_.size()) {
            JobRun& run = runs_[runOrder_[next++]];
            if (run.finished) {
                continue;
            }
            run.admitted = true;
            ++activeJobs_;
            toAdmit.push_back(run.job.name);
        }

        if (!toAdmit.empty()) {
            lock.unlock();
            for (const auto& name : toAdmit) {
                admit(name);
            }
            lock.lock();
            continue;
        }

        bool allFinished = std::all_of(runs_.begin(), runs_.end(),
                                       [](const std::pair<const std::string, JobRun>& entry) {
                                           return entry.second.finished;
                                       });
        if (allFinished) {
            break;
        }
        controlCondition_.wait(lock);
    }
    running_ = false;
    scheduler_.reset();
    lock.unlock();

    scheduler->shutdown();
    stateReporter_.flush();

    TaskStats stats = scheduler->getStats();
    Logger::info("Backup run finished: " + std::to_string(stats.completedTasks) + " transfer(s), " +
                 std::to_string(stats.discardedTasks) + " discarded");

    if (errors.empty()) {
        return std::nullopt;
    }
    setLastError(joinLines(errors));
    return getLastError();
}

void BackupOrchestrator::admit(const std::string& jobName) {
    std::vector<FileTask> tasks;
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        JobRun& run = runs_[jobName];
        stopped = run.stopped;
        tasks = std::move(run.files.tasks);
    }

    if (!stopped && stateReporter_.transition(jobName, BackupState::Active)) {
        Logger::info("Job " + jobName + " started with " + std::to_string(tasks.size()) + " file(s)");

        // Re-read after activation: a pause issued before this point did not see the job as Active
        bool paused = false;
        {
            std::lock_guard<std::mutex> lock(controlMutex_);
            paused = globalPaused_ || runs_[jobName].paused;
        }
        if (paused) {
            stateReporter_.transitionFrom(jobName, BackupState::Active, BackupState::Paused);
        }

        auto scheduler = currentScheduler();
        if (scheduler && !tasks.empty()) {
            scheduler->submit(tasks);

            // stopJob may have discarded before the tasks were queued
            bool stoppedMeanwhile = false;
            {
                std::lock_guard<std::mutex> lock(controlMutex_);
                stoppedMeanwhile = runs_[jobName].stopped;
            }
            if (stoppedMeanwhile) {
                scheduler->discard(jobName);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        runs_[jobName].submitted = true;
    }
    checkJobFinished(jobName);
}

void BackupOrchestrator::transfer(const FileTask& task, Lane lane) {
    Logger::debug("Transferring " + task.sourcePath + " on the " + laneToString(lane) + " lane");

    TransferResult result = encryptionGate_.transferFile(task);
    if (!result.success) {
        Logger::error(errorKindToString(result.errorKind) + " on " + task.sourcePath + ": " + result.error);
    }

    try {
        if (!logDispatcher_.dispatch(LogEntry::fromTransfer(task, result))) {
            Logger::warning("Transfer record for " + task.sourcePath + " was not written");
        }
    } catch (const std::exception& e) {
        Logger::error("Transfer record for " + task.sourcePath + " failed: " + e.what());
    }
    stateReporter_.applyCompletion(task, result.success);
}

bool BackupOrchestrator::canDispatch(const std::string& jobName) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = runs_.find(jobName);
    if (it == runs_.end()) {
        return false;
    }
    return running_ && !globalPaused_ && !it->second.paused && !it->second.stopped;
}

void BackupOrchestrator::checkJobFinished(const std::string& jobName) {
    auto scheduler = currentScheduler();
    if (scheduler && scheduler->outstanding(jobName) > 0) {
        return;
    }

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        auto it = runs_.find(jobName);
        if (it == runs_.end() || !it->second.submitted || it->second.finished) {
            return;
        }
        stopped = it->second.stopped;
    }

    if (!stopped) {
        // A paused job stays open until it is resumed
        if (!stateReporter_.transitionFrom(jobName, BackupState::Active, BackupState::Completed)) {
            return;
        }
        auto state = stateReporter_.snapshot(jobName);
        if (state && state->failedFiles > 0) {
            Logger::warning("Job " + jobName + " completed with " +
                            std::to_string(state->failedFiles) + " failed file(s)");
        } else {
            Logger::info("Job " + jobName + " completed");
        }
    }

    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        JobRun& run = runs_[jobName];
        if (run.finished) {
            return;
        }
        run.finished = true;
        if (run.admitted && activeJobs_ > 0) {
            --activeJobs_;
        }
    }
    controlCondition_.notify_all();
}

bool BackupOrchestrator::pause() {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        if (globalPaused_) {
            setLastError("Backup is already paused");
            return false;
        }
        globalPaused_ = true;
    }

    size_t paused = stateReporter_.transitionAll(BackupState::Active, BackupState::Paused);
    Logger::info("Backup paused, " + std::to_string(paused) + " job(s) suspended");
    return true;
}

bool BackupOrchestrator::resume() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        if (!globalPaused_) {
            setLastError("Backup is not paused");
            return false;
        }
        globalPaused_ = false;
        for (const auto& name : runOrder_) {
            const JobRun& run = runs_[name];
            if (!run.paused && !run.stopped && !run.finished) {
                names.push_back(name);
            }
        }
    }

    for (const auto& name : names) {
        stateReporter_.transitionFrom(name, BackupState::Paused, BackupState::Active);
    }

    auto scheduler = currentScheduler();
    if (scheduler) {
        scheduler->wake();
    }
    for (const auto& name : names) {
        checkJobFinished(name);
    }
    Logger::info("Backup resumed");
    return true;
}

bool BackupOrchestrator::stop() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        for (const auto& name : runOrder_) {
            const JobRun& run = runs_[name];
            if (!run.stopped && !run.finished) {
                names.push_back(name);
            }
        }
    }

    for (const auto& name : names) {
        if (!stopJob(name)) {
            Logger::debug("Job " + name + " finished before it could be stopped");
        }
    }
    Logger::info("Backup stopped");
    return true;
}

bool BackupOrchestrator::pauseJob(const std::string& jobName) {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        auto it = runs_.find(jobName);
        if (it == runs_.end()) {
            setLastError("Job " + jobName + " is not part of the current run");
            return false;
        }
        if (it->second.paused) {
            setLastError("Job " + jobName + " is already paused");
            return false;
        }
        it->second.paused = true;
    }

    if (!stateReporter_.transitionFrom(jobName, BackupState::Active, BackupState::Paused)) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        runs_[jobName].paused = false;
        setLastError("Job " + jobName + " is not active");
        return false;
    }
    Logger::info("Job " + jobName + " paused");
    return true;
}

bool BackupOrchestrator::resumeJob(const std::string& jobName) {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        auto it = runs_.find(jobName);
        if (it == runs_.end()) {
            setLastError("Job " + jobName + " is not part of the current run");
            return false;
        }
        if (!it->second.paused) {
            setLastError("Job " + jobName + " is not paused");
            return false;
        }
        if (globalPaused_) {
            setLastError("Backup is paused globally, resume it first");
            return false;
        }
        it->second.paused = false;
    }

    stateReporter_.transitionFrom(jobName, BackupState::Paused, BackupState::Active);
    auto scheduler = currentScheduler();
    if (scheduler) {
        scheduler->wake();
    }
    checkJobFinished(jobName);
    Logger::info("Job " + jobName + " resumed");
    return true;
}

bool BackupOrchestrator::stopJob(const std::string& jobName) {
    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            setLastError("No backup is running");
            return false;
        }
        auto it = runs_.find(jobName);
        if (it == runs_.end()) {
            setLastError("Job " + jobName + " is not part of the current run");
            return false;
        }
        if (it->second.stopped || it->second.finished) {
            setLastError("Job " + jobName + " has already finished");
            return false;
        }
        it->second.stopped = true;
        admitted = it->second.admitted;
        if (!admitted) {
            it->second.finished = true;
        }
    }

    auto scheduler = currentScheduler();
    size_t dropped = scheduler ? scheduler->discard(jobName) : 0;
    stateReporter_.transition(jobName, BackupState::Stopped);
    Logger::info("Job " + jobName + " stopped, " + std::to_string(dropped) + " pending file(s) discarded");

    if (admitted) {
        checkJobFinished(jobName);
    } else {
        controlCondition_.notify_all();
    }
    return true;
}

bool BackupOrchestrator::isRunning() const {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return running_;
}

std::vector<BackupJobState> BackupOrchestrator::getJobStates() const {
    return stateReporter_.snapshots();
}

std::optional<BackupJobState> BackupOrchestrator::getJobState(const std::string& jobName) const {
    return stateReporter_.snapshot(jobName);
}

size_t BackupOrchestrator::subscribeProgress(ProgressCallback callback) {
    return stateReporter_.subscribe(std::move(callback));
}

void BackupOrchestrator::unsubscribeProgress(size_t id) {
    stateReporter_.unsubscribe(id);
}

size_t BackupOrchestrator::subscribeInterruption(InterruptionCallback callback) {
    std::lock_guard<std::mutex> lock(interruptionMutex_);
    size_t id = nextInterruptionId_++;
    interruptionCallbacks_[id] = std::move(callback);
    return id;
}

void BackupOrchestrator::unsubscribeInterruption(size_t id) {
    std::lock_guard<std::mutex> lock(interruptionMutex_);
    interruptionCallbacks_.erase(id);
}

void BackupOrchestrator::onProcessDetected(const std::string& processName) {
    if (!isRunning()) {
        return;
    }
    Logger::warning("Business process " + processName + " detected, pausing backup");
    if (!pause()) {
        Logger::debug("Backup already paused: " + getLastError());
    }
    notifyInterruption(processName);
}

void BackupOrchestrator::notifyInterruption(const std::string& processName) {
    std::vector<InterruptionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(interruptionMutex_);
        for (const auto& pair : interruptionCallbacks_) {
            callbacks.push_back(pair.second);
        }
    }
    for (const auto& callback : callbacks) {
        try {
            callback(processName);
        } catch (const std::exception& e) {
            Logger::error("Interruption listener failed: " + std::string(e.what()));
        }
    }
}

void BackupOrchestrator::updateThreadingSettings(int maxSimultaneousJobs, int fileSizeThresholdMB) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    settings_.maxSimultaneousJobs = std::max(1, std::min(10, maxSimultaneousJobs));
    settings_.fileSizeThresholdMB = std::max(1, fileSizeThresholdMB);
    Logger::debug("Threading settings: " + std::to_string(settings_.maxSimultaneousJobs) +
                  " job slot(s), large file threshold " + std::to_string(settings_.fileSizeThresholdMB) + " MB");
}

EngineSettings BackupOrchestrator::getSettings() const {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return settings_;
}

void BackupOrchestrator::setPriorityExtensions(const std::vector<std::string>& extensions) {
    std::vector<std::string> normalized;
    for (const auto& extension : extensions) {
        std::string value = FileEnumerator::normalizeExtension(extension);
        if (!value.empty() && std::find(normalized.begin(), normalized.end(), value) == normalized.end()) {
            normalized.push_back(value);
        }
    }
    std::lock_guard<std::mutex> lock(settingsMutex_);
    settings_.priorityExtensions = std::move(normalized);
}

std::vector<std::string> BackupOrchestrator::getPriorityExtensions() const {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return settings_.priorityExtensions;
}

void BackupOrchestrator::setTransferHook(TransferHook hook) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    transferHook_ = std::move(hook);
}

std::shared_ptr<LaneScheduler> BackupOrchestrator::currentScheduler() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return scheduler_;
}

void BackupOrchestrator::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

std::string BackupOrchestrator::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}
