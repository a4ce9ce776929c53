#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/encryption_gate.hpp"
#include "backup/file_enumerator.hpp"
#include "backup/log_dispatcher.hpp"
#include "backup/state_reporter.hpp"
#include "common/job_manager.hpp"
#include "common/lane_scheduler.hpp"
#include "common/process_watcher.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <functional>

// Runs a set of jobs through the shared lane scheduler and drives the
// per-job state machine. Pause, resume and stop take effect at file
// boundaries only: a file that is already being copied always completes.
class BackupOrchestrator {
public:
    using ProgressCallback = StateReporter::ProgressCallback;
    using InterruptionCallback = std::function<void(const std::string& processName)>;
    using TransferHook = LaneScheduler::LaneHook;

    BackupOrchestrator(JobManager& jobManager,
                       EncryptionConfig& encryptionConfig,
                       LogDispatcher& logDispatcher,
                       std::shared_ptr<StateRepository> stateRepository,
                       ProcessWatcher* processWatcher = nullptr,
                       const EngineSettings& settings = EngineSettings());
    ~BackupOrchestrator();

    BackupOrchestrator(const BackupOrchestrator&) = delete;
    BackupOrchestrator& operator=(const BackupOrchestrator&) = delete;

    // Blocks until every requested job is terminal. Indices are 0-based into
    // the job manager. Returns the newline-joined reasons for jobs that could
    // not start, nothing on full success.
    std::optional<std::string> executeBackup(const std::vector<int>& jobIndices);

    bool pause();
    bool resume();
    bool stop();
    bool pauseJob(const std::string& jobName);
    bool resumeJob(const std::string& jobName);
    bool stopJob(const std::string& jobName);

    bool isRunning() const;
    std::vector<BackupJobState> getJobStates() const;
    std::optional<BackupJobState> getJobState(const std::string& jobName) const;

    size_t subscribeProgress(ProgressCallback callback);
    void unsubscribeProgress(size_t id);
    size_t subscribeInterruption(InterruptionCallback callback);
    void unsubscribeInterruption(size_t id);

    // Applied from the next run on. maxJobs is clamped to 1..10.
    void updateThreadingSettings(int maxSimultaneousJobs, int fileSizeThresholdMB);
    EngineSettings getSettings() const;
    void setPriorityExtensions(const std::vector<std::string>& extensions);
    std::vector<std::string> getPriorityExtensions() const;

    // Called on lane entry and exit of every transfer
    void setTransferHook(TransferHook hook);

    std::string getLastError() const;

private:
    struct JobRun {
        BackupJob job;
        EnumerationResult files;
        bool prepared{false};
        bool admitted{false};
        bool submitted{false};
        bool finished{false};
        bool paused{false};
        bool stopped{false};
    };

    void transfer(const FileTask& task, Lane lane);
    bool canDispatch(const std::string& jobName);
    void admit(const std::string& jobName);
    void checkJobFinished(const std::string& jobName);
    void onProcessDetected(const std::string& processName);
    void notifyInterruption(const std::string& processName);
    std::shared_ptr<LaneScheduler> currentScheduler();
    void setLastError(const std::string& error);

    JobManager& jobManager_;
    EncryptionConfig& encryptionConfig_;
    EncryptionGate encryptionGate_;
    LogDispatcher& logDispatcher_;
    StateReporter stateReporter_;
    ProcessWatcher* processWatcher_;
    size_t watcherSubscription_{0};

    mutable std::mutex settingsMutex_;
    EngineSettings settings_;
    TransferHook transferHook_;

    // Serializes executeBackup calls
    std::mutex runMutex_;

    mutable std::mutex controlMutex_;
    std::condition_variable controlCondition_;
    bool running_{false};
    bool globalPaused_{false};
    std::map<std::string, JobRun> runs_;
    std::vector<std::string> runOrder_;
    size_t activeJobs_{0};
    std::shared_ptr<LaneScheduler> scheduler_;

    std::mutex interruptionMutex_;
    std::map<size_t, InterruptionCallback> interruptionCallbacks_;
    size_t nextInterruptionId_{1};

    mutable std::mutex errorMutex_;
    std::string lastError_;
};
