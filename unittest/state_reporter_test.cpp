#include <gtest/gtest.h>
#include "backup/state_reporter.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <future>
#include <thread>
#include <nlohmann/json.hpp>

namespace {

BackupJobState makeState(int id, const std::string& name) {
    BackupJobState state;
    state.id = id;
    state.name = name;
    state.sourcePath = "/src/" + name;
    state.targetPath = "/dst/" + name;
    return state;
}

FileTask makeTask(const std::string& job, const std::string& file, uint64_t size) {
    FileTask task;
    task.jobName = job;
    task.sourcePath = "/src/" + job + "/" + file;
    task.destinationPath = "/dst/" + job + "/" + file;
    task.fileSize = size;
    return task;
}

}  // namespace

class StateReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<InMemoryStateRepository>();
        reporter_ = std::make_unique<StateReporter>(repository_);
        reporter_->subscribe([this](const BackupJobState& state) {
            std::lock_guard<std::mutex> lock(mutex_);
            emitted_.push_back(state);
        });
    }

    std::vector<BackupJobState> emitted() {
        std::lock_guard<std::mutex> lock(mutex_);
        return emitted_;
    }

    std::mutex mutex_;
    std::vector<BackupJobState> emitted_;
    std::shared_ptr<InMemoryStateRepository> repository_;
    std::unique_ptr<StateReporter> reporter_;
};

TEST_F(StateReporterTest, CompletionUpdatesEmitsAndPersistsAllJobs) {
    reporter_->registerJob(makeState(1, "A"));
    reporter_->registerJob(makeState(2, "B"));
    ASSERT_TRUE(reporter_->setTotals("A", 2, 300));
    ASSERT_TRUE(reporter_->transition("A", BackupState::Active));

    ASSERT_TRUE(reporter_->applyCompletion(makeTask("A", "one.txt", 100), true));

    auto last = emitted().back();
    EXPECT_EQ(last.name, "A");
    EXPECT_EQ(last.remainingFiles, 1);
    EXPECT_EQ(last.remainingSize, 200);
    EXPECT_EQ(last.currentSourceFile, "/src/A/one.txt");
    EXPECT_EQ(last.currentTargetFile, "/dst/A/one.txt");
    EXPECT_EQ(last.progressPercentage(), 33);

    auto persisted = repository_->last();
    ASSERT_EQ(persisted.size(), 2u);
    EXPECT_EQ(persisted[0].name, "A");
    EXPECT_EQ(persisted[0].remainingFiles, 1);
    EXPECT_EQ(persisted[1].name, "B");

    ASSERT_TRUE(reporter_->applyCompletion(makeTask("A", "two.txt", 200), false));
    auto state = reporter_->snapshot("A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->remainingFiles, 0);
    EXPECT_EQ(state->remainingSize, 0);
    EXPECT_EQ(state->failedFiles, 1);
}

TEST_F(StateReporterTest, RejectsUndefinedTransitions) {
    reporter_->registerJob(makeState(1, "A"));
    EXPECT_FALSE(reporter_->transition("A", BackupState::Paused));
    EXPECT_FALSE(reporter_->transition("A", BackupState::Completed));
    EXPECT_TRUE(reporter_->transition("A", BackupState::Active));
    EXPECT_TRUE(reporter_->transition("A", BackupState::Completed));
    EXPECT_FALSE(reporter_->transition("A", BackupState::Active));
    EXPECT_FALSE(reporter_->transition("missing", BackupState::Active));

    EXPECT_EQ(reporter_->snapshot("A")->state, BackupState::Completed);
}

TEST_F(StateReporterTest, TransitionFromChecksCurrentState) {
    reporter_->registerJob(makeState(1, "A"));
    EXPECT_FALSE(reporter_->transitionFrom("A", BackupState::Paused, BackupState::Active));
    EXPECT_EQ(reporter_->snapshot("A")->state, BackupState::Inactive);
}

TEST_F(StateReporterTest, TransitionAllOnlyMovesMatchingJobs) {
    reporter_->registerJob(makeState(1, "A"));
    reporter_->registerJob(makeState(2, "B"));
    reporter_->registerJob(makeState(3, "C"));
    reporter_->transition("A", BackupState::Active);
    reporter_->transition("B", BackupState::Active);

    EXPECT_EQ(reporter_->transitionAll(BackupState::Active, BackupState::Paused), 2u);
    auto states = reporter_->snapshots();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0].state, BackupState::Paused);
    EXPECT_EQ(states[1].state, BackupState::Paused);
    EXPECT_EQ(states[2].state, BackupState::Inactive);
}

TEST_F(StateReporterTest, UpdatesOfOneJobAreSerialized) {
    const int threads = 4;
    const int perThread = 250;
    reporter_->registerJob(makeState(1, "A"));
    reporter_->setTotals("A", threads * perThread, threads * perThread * 10);
    reporter_->transition("A", BackupState::Active);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t, perThread] {
            for (int i = 0; i < perThread; ++i) {
                reporter_->applyCompletion(makeTask("A", std::to_string(t) + "-" + std::to_string(i), 10), true);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(reporter_->snapshot("A")->remainingFiles, 0);
    EXPECT_EQ(reporter_->snapshot("A")->remainingSize, 0);

    // Every emitted copy must show one fewer remaining file than the one before
    int64_t previous = threads * perThread;
    for (const auto& state : emitted()) {
        if (state.currentSourceFile.empty()) {
            continue;
        }
        EXPECT_EQ(state.remainingFiles, previous - 1);
        previous = state.remainingFiles;
    }
    EXPECT_EQ(previous, 0);
}

TEST_F(StateReporterTest, UnsubscribedListenerStopsReceiving) {
    int calls = 0;
    size_t id = reporter_->subscribe([&calls](const BackupJobState&) { ++calls; });
    reporter_->registerJob(makeState(1, "A"));
    EXPECT_EQ(calls, 1);

    reporter_->unsubscribe(id);
    reporter_->transition("A", BackupState::Active);
    EXPECT_EQ(calls, 1);
}

TEST_F(StateReporterTest, ListenerMayCallBackIntoReporter) {
    reporter_->registerJob(makeState(1, "A"));
    reporter_->registerJob(makeState(2, "B"));

    std::atomic<int> seenJobs{0};
    reporter_->subscribe([this, &seenJobs](const BackupJobState& state) {
        if (state.name == "A" && state.totalFiles == 1 && state.state == BackupState::Inactive) {
            seenJobs = static_cast<int>(reporter_->snapshots().size());
            reporter_->transition("A", BackupState::Active);
        }
    });

    auto done = std::async(std::launch::async, [this] { return reporter_->setTotals("A", 1, 10); });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(done.get());
    EXPECT_EQ(seenJobs, 2);
    EXPECT_EQ(reporter_->snapshot("A")->state, BackupState::Active);

    // The nested change is delivered after the one that triggered it
    auto states = emitted();
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states[states.size() - 2].state, BackupState::Inactive);
    EXPECT_EQ(states.back().state, BackupState::Active);
}

TEST_F(StateReporterTest, ListenersOfTwoJobsMayChangeEachOther) {
    reporter_->registerJob(makeState(1, "A"));
    reporter_->registerJob(makeState(2, "B"));
    reporter_->transition("A", BackupState::Active);
    reporter_->transition("B", BackupState::Active);

    reporter_->subscribe([this](const BackupJobState& state) {
        if (state.currentSourceFile.empty()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        reporter_->transitionFrom(state.name == "A" ? "B" : "A", BackupState::Active, BackupState::Paused);
    });

    auto a = std::async(std::launch::async, [this] { return reporter_->applyCompletion(makeTask("A", "a", 1), true); });
    auto b = std::async(std::launch::async, [this] { return reporter_->applyCompletion(makeTask("B", "b", 1), true); });
    ASSERT_EQ(a.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(b.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    reporter_->flush();
    EXPECT_EQ(reporter_->snapshot("A")->state, BackupState::Paused);
    EXPECT_EQ(reporter_->snapshot("B")->state, BackupState::Paused);
}

TEST_F(StateReporterTest, ClearDropsTrackedJobs) {
    reporter_->registerJob(makeState(1, "A"));
    reporter_->clear();
    EXPECT_TRUE(reporter_->snapshots().empty());
    EXPECT_FALSE(reporter_->snapshot("A").has_value());
}

TEST(JsonStateRepositoryTest, OverwritesStateFile) {
    TempDir temp;
    JsonStateRepository repository(temp.str("state/state.json"));

    BackupJobState state = makeState(1, "A");
    state.totalSize = 100;
    state.remainingSize = 25;
    ASSERT_TRUE(repository.updateState({state, makeState(2, "B")})) << repository.getLastError();
    ASSERT_TRUE(repository.updateState({state})) << repository.getLastError();

    auto document = nlohmann::json::parse(readFile(temp.path() / "state" / "state.json"));
    ASSERT_TRUE(document.is_array());
    ASSERT_EQ(document.size(), 1u);
    EXPECT_EQ(document[0]["Name"], "A");
    EXPECT_EQ(document[0]["State"], "Inactive");
    EXPECT_EQ(document[0]["ProgressPercentage"], 75);
    EXPECT_FALSE(fs::exists(temp.path() / "state" / "state.json.tmp"));

    repository.setStatePath(temp.str("moved.json"));
    EXPECT_EQ(repository.getStatePath(), temp.str("moved.json"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
