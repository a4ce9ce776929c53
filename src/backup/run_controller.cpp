#include "backup/run_controller.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace {

constexpr int kPollTimeoutMs = 100;

std::string describe(const BackupJobState& state) {
    std::ostringstream line;
    line << state.id << "  " << state.name << "  " << backupStateToString(state.state)
         << "  " << state.progressPercentage() << "%  "
         << state.remainingFiles << "/" << state.totalFiles << " file(s) left";
    if (state.failedFiles > 0) {
        line << ", " << state.failedFiles << " failed";
    }
    return line.str();
}

} // namespace

RunController::RunController(BackupOrchestrator& orchestrator,
                             ProcessWatcher& watcher,
                             int inputFd,
                             std::chrono::milliseconds checkInterval)
    : orchestrator_(orchestrator)
    , watcher_(watcher)
    , inputFd_(inputFd)
    , inputOpen_(inputFd >= 0)
    , checkInterval_(checkInterval)
    , lastCheck_(std::chrono::steady_clock::now()) {
}

RunController::~RunController() {
    stop();
}

void RunController::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&RunController::controlLoop, this);
}

void RunController::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RunController::onInterrupted(const std::string& processName) {
    Logger::info("Run interrupted by " + processName + ", waiting for it to exit");
    interrupted_ = true;
}

bool RunController::applyCommand(BackupOrchestrator& orchestrator,
                                 const std::string& line,
                                 std::string& reply) {
    std::istringstream words(line);
    std::string command;
    std::string job;
    words >> command >> job;
    reply.clear();

    if (command.empty()) {
        return true;
    }

    if (command == "status") {
        std::ostringstream out;
        for (const auto& state : orchestrator.getJobStates()) {
            out << describe(state) << "\n";
        }
        reply = out.str();
        return true;
    }

    bool ok = false;
    std::string done;
    if (command == "pause") {
        ok = job.empty() ? orchestrator.pause() : orchestrator.pauseJob(job);
        done = "paused";
    } else if (command == "resume") {
        ok = job.empty() ? orchestrator.resume() : orchestrator.resumeJob(job);
        done = "resumed";
    } else if (command == "stop") {
        ok = job.empty() ? orchestrator.stop() : orchestrator.stopJob(job);
        done = "stopped";
    } else {
        reply = "Unknown command: " + command;
        return false;
    }

    reply = ok ? (job.empty() ? "Backup " : "Job " + job + " ") + done
               : "Error: " + orchestrator.getLastError();
    return ok;
}

void RunController::controlLoop() {
    while (running_) {
        // Commands wait in the input until the run has started
        if (inputOpen_ && orchestrator_.isRunning()) {
            readInput();
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
        }
        resumeIfClear();
    }
}

void RunController::readInput() {
    pollfd descriptor{};
    descriptor.fd = inputFd_;
    descriptor.events = POLLIN;

    int ready = ::poll(&descriptor, 1, kPollTimeoutMs);
    if (ready < 0) {
        if (errno != EINTR) {
            Logger::warning("Run control input unavailable: " + std::string(std::strerror(errno)));
            inputOpen_ = false;
        }
        return;
    }
    if (ready == 0) {
        return;
    }

    char buffer[256];
    ssize_t count = ::read(inputFd_, buffer, sizeof(buffer));
    if (count <= 0) {
        // End of input: the run keeps going without an operator
        inputOpen_ = false;
        return;
    }
    pendingInput_.append(buffer, static_cast<size_t>(count));

    size_t newline;
    while ((newline = pendingInput_.find('\n')) != std::string::npos) {
        std::string line = pendingInput_.substr(0, newline);
        pendingInput_.erase(0, newline + 1);
        handleLine(line);
    }
}

void RunController::handleLine(const std::string& line) {
    std::string reply;
    bool ok = applyCommand(orchestrator_, line, reply);
    if (ok) {
        std::istringstream words(line);
        std::string command;
        std::string job;
        words >> command >> job;
        if (job.empty() && command == "pause") {
            operatorPaused_ = true;
        } else if (job.empty() && command == "resume") {
            operatorPaused_ = false;
            interrupted_ = false;
        }
    }
    if (!reply.empty()) {
        (ok ? std::cout : std::cerr) << "\n" << reply << std::endl;
    }
    Logger::info("Run control '" + line + "': " + (ok ? "applied" : reply));
}

void RunController::resumeIfClear() {
    if (!interrupted_) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (now - lastCheck_ < checkInterval_) {
        return;
    }
    lastCheck_ = now;

    if (!watcher_.runningWatched().empty()) {
        return;
    }
    interrupted_ = false;
    if (operatorPaused_) {
        return;
    }
    if (orchestrator_.resume()) {
        std::cout << "\nWatched processes exited, backup resumed" << std::endl;
    } else {
        Logger::debug("Automatic resume skipped: " + orchestrator_.getLastError());
    }
}
