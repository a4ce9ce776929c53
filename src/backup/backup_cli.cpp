#include "backup/backup_cli.hpp"
#include "backup/backup_orchestrator.hpp"
#include "backup/encryption_gate.hpp"
#include "backup/log_dispatcher.hpp"
#include "backup/run_controller.hpp"
#include "backup/state_repository.hpp"
#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include "common/process_watcher.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>
#include <unistd.h>

namespace {

bool parseJobNumber(const std::string& text, int& value) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = std::stoi(trimmed);
    } catch (const std::exception&) {
        return false;
    }
    return value >= 1;
}

}  // namespace

bool parseJobIndices(const std::vector<std::string>& selection,
                     std::vector<int>& indices,
                     std::string& error) {
    std::set<int> collected;
    for (const auto& arg : selection) {
        auto dash = arg.find('-');
        if (dash != std::string::npos) {
            int first = 0;
            int last = 0;
            if (!parseJobNumber(arg.substr(0, dash), first) || !parseJobNumber(arg.substr(dash + 1), last)) {
                error = "Invalid job range: " + arg;
                return false;
            }
            if (first > last) {
                error = "Job range is reversed: " + arg;
                return false;
            }
            for (int i = first; i <= last; ++i) {
                collected.insert(i - 1);
            }
            continue;
        }

        std::stringstream parts(arg);
        std::string part;
        while (std::getline(parts, part, ';')) {
            int number = 0;
            if (!parseJobNumber(part, number)) {
                error = "Invalid job number: " + part;
                return false;
            }
            collected.insert(number - 1);
        }
    }

    if (collected.empty()) {
        error = "No backup job specified.";
        return false;
    }
    indices.assign(collected.begin(), collected.end());
    return true;
}

BackupCLI::BackupCLI(const std::string& settingsPath)
    : settingsPath_(settingsPath)
    , controlFd_(STDIN_FILENO) {
}

void BackupCLI::printUsage() const {
    std::cout << "Usage: treesave [--config <file>] <command> [options]\n"
              << "Commands:\n"
              << "  run <selection>                       Run jobs, e.g. 1-3 or \"1;3\"\n"
              << "  jobs list                             List configured jobs\n"
              << "  jobs add <name> <source> <target> [complete|differential]\n"
              << "  jobs remove <number>                  Remove a job\n"
              << "  watch list|add <name>|remove <name>   Manage business processes\n"
              << "  encrypt list                          Show encrypted extensions\n"
              << "  encrypt key <key>                     Set the encryption key\n"
              << "  encrypt add|remove <extension>        Manage encrypted extensions\n"
              << "\n"
              << "While a run is in progress, stdin accepts: pause [job], resume [job],\n"
              << "stop [job] and status, one per line.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config   Settings file (default treesave.json)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version information\n";
}

int BackupCLI::fail(const std::string& message) const {
    std::cerr << "Error: " << message << std::endl;
    if (Logger::isInitialized()) {
        Logger::error(message);
    }
    return 1;
}

bool BackupCLI::loadSettings() {
    SettingsStore store(settingsPath_);
    if (!store.load(settings_)) {
        std::cerr << "Error: " << store.getLastError() << std::endl;
        return false;
    }

    if (!Logger::isInitialized() &&
        !Logger::initialize(settings_.diagnosticLog, Logger::parseLevel(settings_.logLevel))) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return false;
    }
    Logger::debug("Settings loaded from " + settingsPath_);
    return true;
}

bool BackupCLI::saveSettings() {
    SettingsStore store(settingsPath_);
    if (!store.save(settings_)) {
        fail(store.getLastError());
        return false;
    }
    return true;
}

int BackupCLI::run(const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "-c" || args[i] == "--config") && i + 1 < args.size()) {
            settingsPath_ = args[++i];
        } else {
            rest.push_back(args[i]);
        }
    }

    if (rest.empty()) {
        printUsage();
        return 1;
    }

    const std::string command = rest.front();
    if (command == "-h" || command == "--help") {
        printUsage();
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << "treesave version 1.0.0\n";
        return 0;
    }

    if (!loadSettings()) {
        return 1;
    }

    std::vector<std::string> commandArgs(rest.begin() + 1, rest.end());
    try {
        if (command == "run") {
            return handleRunCommand(commandArgs);
        } else if (command == "jobs") {
            return handleJobsCommand(commandArgs);
        } else if (command == "watch") {
            return handleWatchCommand(commandArgs);
        } else if (command == "encrypt") {
            return handleEncryptCommand(commandArgs);
        }
        printUsage();
        return fail("Unknown command: " + command);
    } catch (const std::exception& e) {
        return fail("Unexpected error: " + std::string(e.what()));
    }
}

int BackupCLI::handleRunCommand(const std::vector<std::string>& args) {
    std::vector<int> indices;
    std::string error;
    if (!parseJobIndices(args, indices, error)) {
        return fail(error);
    }

    JobManager jobManager(settings_.jobsPath);
    EncryptionConfig encryptionConfig(settings_.encryptionKey, settings_.encryptedExtensions);

    auto localSink = std::make_shared<LocalLogSink>(settings_.logDirectory, settings_.logFormat);
    RemoteEndpoint endpoint(settings_.serverBase);
    auto remoteSink = std::make_shared<RemoteLogSink>(endpoint);
    LogDispatcher logDispatcher(localSink, remoteSink, settings_.logTarget);

    auto stateRepository = std::make_shared<JsonStateRepository>(settings_.statePath);

    ProcessWatcher processWatcher;
    processWatcher.setWatched(settings_.watchedProcesses);

    BackupOrchestrator orchestrator(jobManager, encryptionConfig, logDispatcher,
                                    stateRepository, &processWatcher, settings_.engine);

    orchestrator.subscribeProgress([](const BackupJobState& state) {
        std::cout << "\r[" << state.name << "] " << backupStateToString(state.state) << " "
                  << std::setw(3) << state.progressPercentage() << "% ("
                  << state.remainingFiles << " file(s) left)" << std::flush;
        if (isTerminal(state.state)) {
            std::cout << std::endl;
        }
    });
    RunController controller(orchestrator, processWatcher, controlFd_,
                             std::chrono::milliseconds(settings_.pollIntervalMs));
    orchestrator.subscribeInterruption([&controller](const std::string& processName) {
        std::cout << "\nBackup paused: business process " << processName
                  << " is running. It resumes when the process exits;"
                  << " enter 'resume' or 'stop' to decide now." << std::endl;
        controller.onInterrupted(processName);
    });

    if (!settings_.watchedProcesses.empty() &&
        !processWatcher.start(std::chrono::milliseconds(settings_.pollIntervalMs))) {
        Logger::warning("Process monitoring unavailable: " + processWatcher.getLastError());
    }

    controller.start();
    auto result = orchestrator.executeBackup(indices);
    controller.stop();
    processWatcher.stop();

    if (logDispatcher.getRemoteFailures() > 0) {
        Logger::warning(std::to_string(logDispatcher.getRemoteFailures()) +
                        " transfer record(s) could not be sent to " + endpoint.logsUrl());
    }

    if (result) {
        return fail(*result);
    }
    std::cout << "Backup finished" << std::endl;
    return 0;
}

int BackupCLI::handleJobsCommand(const std::vector<std::string>& args) {
    JobManager jobManager(settings_.jobsPath);
    const std::string action = args.empty() ? "list" : args.front();

    if (action == "list") {
        auto jobs = jobManager.getAllJobs();
        if (jobs.empty()) {
            std::cout << "No backup jobs configured" << std::endl;
            return 0;
        }
        for (size_t i = 0; i < jobs.size(); ++i) {
            std::cout << std::setw(3) << (i + 1) << "  " << jobs[i].name << "  "
                      << backupTypeToString(jobs[i].type) << "  "
                      << jobs[i].sourceDir << " -> " << jobs[i].targetDir << std::endl;
        }
        return 0;
    }

    if (action == "add") {
        if (args.size() < 4) {
            return fail("Usage: treesave jobs add <name> <source> <target> [complete|differential]");
        }
        BackupType type = BackupType::Complete;
        if (args.size() > 4 && !backupTypeFromString(args[4], type)) {
            return fail("Unknown backup type: " + args[4]);
        }
        auto created = jobManager.createJob(args[1], args[2], args[3], type);
        if (!created.first) {
            return fail(created.second);
        }
        std::cout << "Job " << args[1] << " created" << std::endl;
        return 0;
    }

    if (action == "remove") {
        int number = 0;
        if (args.size() < 2 || !parseJobNumber(args[1], number)) {
            return fail("Usage: treesave jobs remove <number>");
        }
        if (!jobManager.removeJob(number - 1)) {
            return fail(jobManager.getLastError());
        }
        std::cout << "Job " << number << " removed" << std::endl;
        return 0;
    }

    return fail("Unknown jobs action: " + action);
}

int BackupCLI::handleWatchCommand(const std::vector<std::string>& args) {
    ProcessWatcher watcher;
    watcher.setWatched(settings_.watchedProcesses);
    const std::string action = args.empty() ? "list" : args.front();

    if (action == "list") {
        for (const auto& name : watcher.list()) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    if (args.size() < 2) {
        return fail("Usage: treesave watch " + action + " <process>");
    }

    if (action == "add") {
        if (!watcher.add(args[1])) {
            return fail("Process " + args[1] + " is already watched");
        }
    } else if (action == "remove") {
        if (!watcher.remove(args[1])) {
            return fail("Process " + args[1] + " is not watched");
        }
    } else {
        return fail("Unknown watch action: " + action);
    }

    settings_.watchedProcesses = watcher.list();
    return saveSettings() ? 0 : 1;
}

int BackupCLI::handleEncryptCommand(const std::vector<std::string>& args) {
    EncryptionConfig config(settings_.encryptionKey, settings_.encryptedExtensions);
    const std::string action = args.empty() ? "list" : args.front();

    if (action == "list") {
        for (const auto& extension : config.getExtensions()) {
            std::cout << extension << std::endl;
        }
        return 0;
    }

    if (args.size() < 2) {
        return fail("Usage: treesave encrypt " + action + " <value>");
    }

    if (action == "key") {
        if (!config.setKey(args[1])) {
            return fail("Encryption key must not be blank");
        }
    } else if (action == "add") {
        if (!config.addExtension(args[1])) {
            return fail("Extension " + args[1] + " is already encrypted or invalid");
        }
    } else if (action == "remove") {
        if (!config.removeExtension(args[1])) {
            return fail("Extension " + args[1] + " is not encrypted");
        }
    } else {
        return fail("Unknown encrypt action: " + action);
    }

    settings_.encryptionKey = config.getKey();
    settings_.encryptedExtensions = config.getExtensions();
    return saveSettings() ? 0 : 1;
}
