#include <gtest/gtest.h>
#include "backup/backup_orchestrator.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <thread>

class BackupOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        jobManager_ = std::make_unique<JobManager>(temp_.str("jobs.json"));
        localSink_ = std::make_shared<LocalLogSink>(temp_.str("logs"), LogFormat::Flat);
        remoteSink_ = std::make_shared<RecordingLogSink>();
        dispatcher_ = std::make_unique<LogDispatcher>(localSink_, remoteSink_, LogTarget::Both);
        repository_ = std::make_shared<InMemoryStateRepository>();
        processSource_ = std::make_shared<FakeProcessSource>();
        watcher_ = std::make_unique<ProcessWatcher>(processSource_);
    }

    void createOrchestrator(const EngineSettings& settings = EngineSettings()) {
        orchestrator_ = std::make_unique<BackupOrchestrator>(*jobManager_, encryption_, *dispatcher_,
                                                             repository_, watcher_.get(), settings);
        orchestrator_->subscribeProgress([this](const BackupJobState& state) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.push_back(state);
        });
        orchestrator_->subscribeInterruption([this](const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex_);
            interruptions_.push_back(name);
        });
    }

    fs::path sourceOf(const std::string& job) const { return temp_.path() / job / "src"; }
    fs::path targetOf(const std::string& job) const { return temp_.path() / job / "dst"; }

    void addJob(const std::string& name, BackupType type = BackupType::Complete) {
        fs::create_directories(sourceOf(name));
        auto created = jobManager_->createJob(name, sourceOf(name).string(), targetOf(name).string(), type);
        ASSERT_TRUE(created.first) << created.second;
    }

    void addSmallFiles(const std::string& job, int count) {
        for (int i = 0; i < count; ++i) {
            writeFile(sourceOf(job) / ("file" + std::to_string(i) + ".txt"), "content " + std::to_string(i));
        }
    }

    // Source files of a job in the order CurrentSourceFile reported them
    std::vector<std::string> transferredSources(const std::string& job) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> sources;
        for (const auto& state : progress_) {
            if (state.name == job && !state.currentSourceFile.empty() &&
                (sources.empty() || sources.back() != state.currentSourceFile)) {
                sources.push_back(state.currentSourceFile);
            }
        }
        return sources;
    }

    std::vector<std::string> interruptions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return interruptions_;
    }

    BackupState stateOf(const std::string& job) const {
        auto state = orchestrator_->getJobState(job);
        return state ? state->state : BackupState::Inactive;
    }

    TempDir temp_;
    EncryptionConfig encryption_;
    std::unique_ptr<JobManager> jobManager_;
    std::shared_ptr<LocalLogSink> localSink_;
    std::shared_ptr<RecordingLogSink> remoteSink_;
    std::unique_ptr<LogDispatcher> dispatcher_;
    std::shared_ptr<InMemoryStateRepository> repository_;
    std::shared_ptr<FakeProcessSource> processSource_;
    std::unique_ptr<ProcessWatcher> watcher_;

    std::mutex mutex_;
    std::vector<BackupJobState> progress_;
    std::vector<std::string> interruptions_;

    std::unique_ptr<BackupOrchestrator> orchestrator_;
};

TEST_F(BackupOrchestratorTest, PriorityFilesLeadAndEmptyDifferentialCompletes) {
    addJob("A", BackupType::Complete);
    for (int i = 1; i <= 7; ++i) {
        writeFile(sourceOf("A") / ("0" + std::to_string(i) + ".txt"), std::string(100 * i, 'a'));
    }
    writeSizedFile(sourceOf("A") / "big.bin", 3 * 1024 * 1024 / 2);
    writeFile(sourceOf("A") / "x.pri", "first priority");
    writeFile(sourceOf("A") / "y.pri", "second priority");

    addJob("B", BackupType::Differential);
    writeFile(sourceOf("B") / "same.txt", "unchanged");
    writeFile(targetOf("B") / "same.txt", "unchanged");
    fs::last_write_time(targetOf("B") / "same.txt", fs::last_write_time(sourceOf("B") / "same.txt"));

    EngineSettings settings;
    settings.maxSimultaneousJobs = 3;
    settings.fileSizeThresholdMB = 1;
    settings.priorityExtensions = {".pri"};
    createOrchestrator(settings);

    auto result = orchestrator_->executeBackup({0, 1});
    EXPECT_FALSE(result.has_value()) << *result;

    auto b = orchestrator_->getJobState("B");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->state, BackupState::Completed);
    EXPECT_EQ(b->totalFiles, 0);
    EXPECT_EQ(b->progressPercentage(), 100);

    auto a = orchestrator_->getJobState("A");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->state, BackupState::Completed);
    EXPECT_EQ(a->totalFiles, 10);
    EXPECT_EQ(a->remainingFiles, 0);
    EXPECT_EQ(a->remainingSize, 0);
    EXPECT_EQ(a->failedFiles, 0);

    auto sources = transferredSources("A");
    ASSERT_EQ(sources.size(), 10u);
    EXPECT_EQ(fs::path(sources[0]).extension(), ".pri");
    EXPECT_EQ(fs::path(sources[1]).extension(), ".pri");

    EXPECT_EQ(readFile(targetOf("A") / "x.pri"), "first priority");
    EXPECT_EQ(fs::file_size(targetOf("A") / "big.bin"), 3u * 1024 * 1024 / 2);
    EXPECT_EQ(remoteSink_->entries().size(), 10u);

    // The persisted snapshot carries both jobs
    auto persisted = repository_->last();
    ASSERT_EQ(persisted.size(), 2u);
    EXPECT_EQ(persisted[0].id, 1);
    EXPECT_EQ(persisted[1].id, 2);
}

TEST_F(BackupOrchestratorTest, InvalidIndexIsReportedWhileValidJobsRun) {
    addJob("A");
    addSmallFiles("A", 2);
    createOrchestrator();

    auto result = orchestrator_->executeBackup({0, 7});
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->find("Invalid job index: 7"), std::string::npos);
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
    EXPECT_TRUE(fs::exists(targetOf("A") / "file1.txt"));
}

TEST_F(BackupOrchestratorTest, EmptySelectionIsRejected) {
    createOrchestrator();
    auto result = orchestrator_->executeBackup({});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "No backup job specified.");
}

TEST_F(BackupOrchestratorTest, JobWithMissingSourceNeverBecomesActive) {
    addJob("A");
    addJob("B");
    addSmallFiles("B", 1);
    fs::remove_all(sourceOf("A"));
    createOrchestrator();

    auto result = orchestrator_->executeBackup({0, 1});
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->find("'A' could not start"), std::string::npos);
    EXPECT_EQ(stateOf("A"), BackupState::Error);
    EXPECT_EQ(stateOf("B"), BackupState::Completed);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& state : progress_) {
        if (state.name == "A") {
            EXPECT_NE(state.state, BackupState::Active);
        }
    }
}

TEST_F(BackupOrchestratorTest, PauseHoldsDispatchUntilResume) {
    addJob("A");
    addSmallFiles("A", 5);

    EngineSettings settings;
    settings.maxSimultaneousJobs = 1;
    createOrchestrator(settings);

    std::atomic<bool> pausedOnce{false};
    orchestrator_->setTransferHook([this, &pausedOnce](const FileTask&, Lane, bool entering) {
        if (entering && !pausedOnce.exchange(true)) {
            EXPECT_TRUE(orchestrator_->pause());
        }
    });

    std::optional<std::string> result;
    std::thread run([&] { result = orchestrator_->executeBackup({0}); });

    ASSERT_TRUE(waitFor([&] {
        return stateOf("A") == BackupState::Paused && transferredSources("A").size() == 1;
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(transferredSources("A").size(), 1u);
    EXPECT_EQ(remoteSink_->entries().size(), 1u);
    EXPECT_FALSE(orchestrator_->pause());

    EXPECT_TRUE(orchestrator_->resume());
    run.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
    EXPECT_EQ(orchestrator_->getJobState("A")->remainingFiles, 0);
    EXPECT_EQ(transferredSources("A").size(), 5u);
}

TEST_F(BackupOrchestratorTest, ProgressListenerCanPauseAndQueryStates) {
    addJob("A");
    addSmallFiles("A", 3);

    EngineSettings settings;
    settings.maxSimultaneousJobs = 1;
    createOrchestrator(settings);

    std::atomic<bool> pausedOnce{false};
    std::atomic<size_t> listed{0};
    orchestrator_->subscribeProgress([this, &pausedOnce, &listed](const BackupJobState& state) {
        if (state.state == BackupState::Active && !pausedOnce.exchange(true)) {
            listed = orchestrator_->getJobStates().size();
            EXPECT_TRUE(orchestrator_->pause());
        }
    });

    std::optional<std::string> result;
    std::thread run([&] { result = orchestrator_->executeBackup({0}); });

    bool paused = waitFor([&] { return stateOf("A") == BackupState::Paused; });
    EXPECT_TRUE(paused);
    EXPECT_EQ(listed, 1u);
    EXPECT_TRUE(transferredSources("A").empty());

    EXPECT_TRUE(orchestrator_->resume());
    run.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
    EXPECT_EQ(transferredSources("A").size(), 3u);
}

TEST_F(BackupOrchestratorTest, StopDiscardsRemainingFiles) {
    addJob("A");
    addSmallFiles("A", 5);

    EngineSettings settings;
    settings.maxSimultaneousJobs = 1;
    createOrchestrator(settings);

    std::atomic<bool> stopped{false};
    orchestrator_->setTransferHook([this, &stopped](const FileTask&, Lane, bool entering) {
        if (entering && !stopped.exchange(true)) {
            EXPECT_TRUE(orchestrator_->stop());
        }
    });

    auto result = orchestrator_->executeBackup({0});
    EXPECT_FALSE(result.has_value());

    auto state = orchestrator_->getJobState("A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->state, BackupState::Stopped);
    EXPECT_EQ(state->remainingFiles, 4);
    EXPECT_EQ(remoteSink_->entries().size(), 1u);
}

TEST_F(BackupOrchestratorTest, LargeFilesOfConcurrentJobsShareOneLane) {
    for (const std::string name : {"A", "B", "C"}) {
        addJob(name);
        writeSizedFile(sourceOf(name) / "large.bin", 1024 * 1024 + 512);
        addSmallFiles(name, 2);
    }

    EngineSettings settings;
    settings.maxSimultaneousJobs = 3;
    settings.fileSizeThresholdMB = 1;
    createOrchestrator(settings);

    std::atomic<int> large{0};
    std::atomic<int> maxLarge{0};
    std::atomic<int> largeEntries{0};
    orchestrator_->setTransferHook([&](const FileTask&, Lane lane, bool entering) {
        if (lane != Lane::Large) {
            return;
        }
        if (entering) {
            ++largeEntries;
            int now = ++large;
            int seen = maxLarge.load();
            while (now > seen && !maxLarge.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        } else {
            --large;
        }
    });

    auto result = orchestrator_->executeBackup({0, 1, 2});
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(largeEntries.load(), 3);
    EXPECT_EQ(maxLarge.load(), 1);
    for (const std::string name : {"A", "B", "C"}) {
        EXPECT_EQ(stateOf(name), BackupState::Completed);
    }
}

TEST_F(BackupOrchestratorTest, RunningWatchedProcessPausesRunAtStart) {
    addJob("A");
    addSmallFiles("A", 3);
    watcher_->add("Calc.exe");
    processSource_->setNames({"calc"});
    createOrchestrator();

    std::optional<std::string> result;
    std::thread run([&] { result = orchestrator_->executeBackup({0}); });

    ASSERT_TRUE(waitFor([&] { return stateOf("A") == BackupState::Paused; }));
    EXPECT_EQ(interruptions(), std::vector<std::string>{"Calc.exe"});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(remoteSink_->entries().empty());

    // Paused runs stay paused until resumed explicitly
    processSource_->setNames({});
    watcher_->checkNow();
    EXPECT_EQ(stateOf("A"), BackupState::Paused);

    EXPECT_TRUE(orchestrator_->resume());
    run.join();
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
}

TEST_F(BackupOrchestratorTest, ProcessDetectedMidRunPausesAndNotifies) {
    addJob("A");
    addSmallFiles("A", 4);
    watcher_->add("calc");

    EngineSettings settings;
    settings.maxSimultaneousJobs = 1;
    createOrchestrator(settings);

    std::atomic<bool> launched{false};
    orchestrator_->setTransferHook([this, &launched](const FileTask&, Lane, bool entering) {
        if (entering && !launched.exchange(true)) {
            processSource_->setNames({"calc"});
            watcher_->checkNow();
        }
    });

    std::optional<std::string> result;
    std::thread run([&] { result = orchestrator_->executeBackup({0}); });

    ASSERT_TRUE(waitFor([&] {
        return stateOf("A") == BackupState::Paused && transferredSources("A").size() == 1;
    }));
    EXPECT_EQ(interruptions(), std::vector<std::string>{"calc"});

    EXPECT_TRUE(orchestrator_->resume());
    run.join();
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
    EXPECT_EQ(transferredSources("A").size(), 4u);
}

TEST_F(BackupOrchestratorTest, PerJobPauseLeavesOtherJobsRunning) {
    addJob("A");
    addSmallFiles("A", 4);
    addJob("B");
    addSmallFiles("B", 4);

    EngineSettings settings;
    settings.maxSimultaneousJobs = 2;
    createOrchestrator(settings);

    std::atomic<bool> pausedA{false};
    orchestrator_->setTransferHook([this, &pausedA](const FileTask& task, Lane, bool entering) {
        if (entering && task.jobName == "A" && !pausedA.exchange(true)) {
            EXPECT_TRUE(orchestrator_->pauseJob("A"));
        }
    });

    std::optional<std::string> result;
    std::thread run([&] { result = orchestrator_->executeBackup({0, 1}); });

    ASSERT_TRUE(waitFor([&] {
        return stateOf("B") == BackupState::Completed && stateOf("A") == BackupState::Paused;
    }));
    // A second file of A may already have been dispatched when the pause landed
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    size_t copiedWhilePaused = transferredSources("A").size();
    EXPECT_LT(copiedWhilePaused, 4u);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(transferredSources("A").size(), copiedWhilePaused);

    EXPECT_FALSE(orchestrator_->resumeJob("B"));
    EXPECT_FALSE(orchestrator_->pauseJob("A"));

    EXPECT_TRUE(orchestrator_->resumeJob("A"));
    run.join();
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
}

TEST_F(BackupOrchestratorTest, SecondRunIsRejectedWhileRunning) {
    addJob("A");
    addSmallFiles("A", 1);
    watcher_->add("calc");
    processSource_->setNames({"calc"});
    createOrchestrator();

    std::thread run([&] { orchestrator_->executeBackup({0}); });
    ASSERT_TRUE(waitFor([&] { return stateOf("A") == BackupState::Paused; }));

    auto second = orchestrator_->executeBackup({0});
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second->find("already in progress"), std::string::npos);

    EXPECT_TRUE(orchestrator_->resume());
    run.join();
    EXPECT_EQ(stateOf("A"), BackupState::Completed);
}

TEST_F(BackupOrchestratorTest, FailedFileIsCountedAndJobCompletes) {
    addJob("A");
    addSmallFiles("A", 3);
    // A directory where the copy should go makes that one transfer fail
    fs::create_directories(targetOf("A") / "file1.txt");
    createOrchestrator();

    auto result = orchestrator_->executeBackup({0});
    EXPECT_FALSE(result.has_value());

    auto state = orchestrator_->getJobState("A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->state, BackupState::Completed);
    EXPECT_EQ(state->remainingFiles, 0);
    EXPECT_EQ(state->failedFiles, 1);

    auto entries = remoteSink_->entries();
    ASSERT_EQ(entries.size(), 3u);
    int failed = 0;
    for (const auto& entry : entries) {
        if (!entry.error.empty()) {
            ++failed;
            EXPECT_NE(entry.error.find("IOError"), std::string::npos);
        }
    }
    EXPECT_EQ(failed, 1);
}

TEST_F(BackupOrchestratorTest, NonUtf8FileNameIsCopiedAndCounted) {
    addJob("A");
    writeFile(sourceOf("A") / "report\xff.txt", "bytes");
    writeFile(sourceOf("A") / "plain.txt", "text");
    createOrchestrator();

    auto result = orchestrator_->executeBackup({0});
    EXPECT_FALSE(result.has_value());

    auto state = orchestrator_->getJobState("A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->state, BackupState::Completed);
    EXPECT_EQ(state->remainingFiles, 0);
    EXPECT_EQ(state->failedFiles, 0);
    EXPECT_TRUE(fs::exists(targetOf("A") / "report\xff.txt"));
    EXPECT_EQ(remoteSink_->bodies().size(), 2u);
    EXPECT_EQ(dispatcher_->getLocalFailures(), 0u);
}

TEST_F(BackupOrchestratorTest, ControlCallsOutsideRunFail) {
    createOrchestrator();
    EXPECT_FALSE(orchestrator_->pause());
    EXPECT_EQ(orchestrator_->getLastError(), "No backup is running");
    EXPECT_FALSE(orchestrator_->resume());
    EXPECT_FALSE(orchestrator_->stop());
    EXPECT_FALSE(orchestrator_->stopJob("A"));
    EXPECT_FALSE(orchestrator_->isRunning());
}

TEST_F(BackupOrchestratorTest, ThreadingSettingsAreClamped) {
    createOrchestrator();
    orchestrator_->updateThreadingSettings(0, 0);
    EXPECT_EQ(orchestrator_->getSettings().maxSimultaneousJobs, 1);
    EXPECT_EQ(orchestrator_->getSettings().fileSizeThresholdMB, 1);

    orchestrator_->updateThreadingSettings(42, 50);
    EXPECT_EQ(orchestrator_->getSettings().maxSimultaneousJobs, 10);
    EXPECT_EQ(orchestrator_->getSettings().fileSizeThresholdMB, 50);

    orchestrator_->setPriorityExtensions({"PDF", ".pdf", "docx"});
    EXPECT_EQ(orchestrator_->getPriorityExtensions(), (std::vector<std::string>{".pdf", ".docx"}));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
