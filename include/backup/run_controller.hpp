#pragma once

#include "backup/backup_orchestrator.hpp"
#include "common/process_watcher.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

// Control path of a headless run. Reads one command per line from a file
// descriptor while the run is in progress:
//
//   pause [job]   resume [job]   stop [job]   status
//
// A run paused by a watched process is resumed once none of the watched
// processes is running any more, unless the operator paused it as well.
class RunController {
public:
    RunController(BackupOrchestrator& orchestrator,
                  ProcessWatcher& watcher,
                  int inputFd,
                  std::chrono::milliseconds checkInterval = std::chrono::milliseconds(2000));
    ~RunController();

    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    void start();
    void stop();

    // Wire to BackupOrchestrator::subscribeInterruption
    void onInterrupted(const std::string& processName);

    // Applies one command line. Blank lines succeed with an empty reply.
    static bool applyCommand(BackupOrchestrator& orchestrator,
                             const std::string& line,
                             std::string& reply);

private:
    void controlLoop();
    void readInput();
    void handleLine(const std::string& line);
    void resumeIfClear();

    BackupOrchestrator& orchestrator_;
    ProcessWatcher& watcher_;
    int inputFd_;
    bool inputOpen_;
    std::string pendingInput_;
    std::chrono::milliseconds checkInterval_;
    std::chrono::steady_clock::time_point lastCheck_;

    std::atomic<bool> running_{false};
    std::atomic<bool> interrupted_{false};
    std::atomic<bool> operatorPaused_{false};
    std::thread thread_;
};
