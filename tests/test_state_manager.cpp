#include <gtest/gtest.h>
#include <managers/transfer_state_manager.hpp>
#include <managers/state_store.hpp>
#include <filesystem>
#include <atomic>
#include <fstream>
#include <map>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// In-memory tree: counts persist() calls, can be told to fail them.
struct FakeTreeLog {
    int persist_count = 0;
    bool fail_persist = false;
    std::map<std::string, bool> persisted_keys;     // repo_key -> exists on "disk"
};

class FakeTree : public SnapshotTree {
public:
    FakeTree(std::string repo_key, std::shared_ptr<FakeTreeLog> log)
        : repo_key_(std::move(repo_key)), log_(std::move(log)), root_("", nullptr) {}

    const std::string& repo_key() const override { return repo_key_; }

    Result<SnapshotNode*> look_up_node(const std::string& relative_path) override {
        if (relative_path.empty()) return Result<SnapshotNode*>::Ok(&root_);
        SnapshotNode* node = root_.child(relative_path);
        if (!node) return Result<SnapshotNode*>::Err("no node " + relative_path, ErrorCode::NotFound);
        return Result<SnapshotNode*>::Ok(node);
    }

    Result<SnapshotNode*> get_directory_node_with_lru(const std::string& relative_path) override {
        if (relative_path.empty()) return Result<SnapshotNode*>::Ok(&root_);
        return Result<SnapshotNode*>::Ok(root_.get_or_add_child(relative_path));
    }

    Result<void> persist() override {
        if (log_->fail_persist) return Result<void>::Err("disk full", ErrorCode::Io);
        log_->persist_count++;
        log_->persisted_keys[repo_key_] = true;
        return Result<void>::Ok();
    }

private:
    std::string repo_key_;
    std::shared_ptr<FakeTreeLog> log_;
    SnapshotNode root_;
};

class FakeTreeFactory : public SnapshotTreeFactory {
public:
    explicit FakeTreeFactory(std::shared_ptr<FakeTreeLog> log) : log_(std::move(log)) {}

    std::unique_ptr<SnapshotTree> create(const std::string& repo_key, const fs::path&) override {
        return std::make_unique<FakeTree>(repo_key, log_);
    }

    Result<std::unique_ptr<SnapshotTree>> load(const std::string& repo_key,
                                               const fs::path&) override {
        if (!log_->persisted_keys.count(repo_key)) {
            return Result<std::unique_ptr<SnapshotTree>>::Ok(nullptr);
        }
        return Result<std::unique_ptr<SnapshotTree>>::Ok(std::make_unique<FakeTree>(repo_key, log_));
    }

private:
    std::shared_ptr<FakeTreeLog> log_;
};

class StateManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<FakeTreeLog> log;
    TransferStateManager::Clock::time_point now;
    std::unique_ptr<TransferStateManager> manager;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("repomove_state_manager_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        log = std::make_shared<FakeTreeLog>();
        now = TransferStateManager::Clock::now();
        manager = make_manager();
    }

    void TearDown() override {
        manager.reset();
        fs::remove_all(test_dir);
    }

    std::unique_ptr<TransferStateManager> make_manager() {
        TransferStateManager::Options options;
        options.snapshot_save_interval = 10min;
        options.clock = [this] { return now; };
        return std::make_unique<TransferStateManager>(
            TransferPaths{test_dir}, std::make_shared<FakeTreeFactory>(log), options);
    }

    void activate(const std::string& repo_key) {
        ASSERT_TRUE(manager->set_repo_state(repo_key, 1000, 10, false).is_ok());
        ASSERT_TRUE(manager->init_repo_snapshot().is_ok());
    }
};

// ── Uninitialized snapshot ──────────────────────────────────

TEST_F(StateManagerTest, SnapshotOperationsFailWhenNeverInitialized) {
    EXPECT_FALSE(manager->is_repo_transfer_snapshot_enabled());

    auto node = manager->look_up_node("a");
    ASSERT_TRUE(node.is_err());
    EXPECT_EQ(node.code, ErrorCode::Uninitialized);

    auto loaded = manager->was_snapshot_loaded();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.code, ErrorCode::Uninitialized);

    auto lru = manager->get_directory_snapshot_node_with_lru("a");
    ASSERT_TRUE(lru.is_err());
    EXPECT_EQ(lru.code, ErrorCode::Uninitialized);

    bool ran = false;
    auto applied = manager->apply_to_snapshot([&](RepoTransferSnapshot&) {
        ran = true;
        return Result<void>::Ok();
    });
    EXPECT_EQ(applied.code, ErrorCode::Uninitialized);
    EXPECT_FALSE(ran);
}

TEST_F(StateManagerTest, SnapshotOperationsFailAfterDisable) {
    activate("libs-release");
    EXPECT_TRUE(manager->is_repo_transfer_snapshot_enabled());

    manager->disable_repo_transfer_snapshot();
    EXPECT_FALSE(manager->is_repo_transfer_snapshot_enabled());
    EXPECT_EQ(manager->look_up_node("").code, ErrorCode::Uninitialized);
    EXPECT_EQ(manager->was_snapshot_loaded().code, ErrorCode::Uninitialized);
    EXPECT_EQ(manager->get_directory_snapshot_node_with_lru("x").code, ErrorCode::Uninitialized);
    EXPECT_FALSE(manager->last_snapshot_save_time().has_value());
}

// ── Loaded flag ─────────────────────────────────────────────

TEST_F(StateManagerTest, FreshSnapshotIsNotLoaded) {
    activate("libs-release");
    auto loaded = manager->was_snapshot_loaded();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value);
}

TEST_F(StateManagerTest, PersistedSnapshotIsLoaded) {
    log->persisted_keys["libs-release"] = true;
    activate("libs-release");
    auto loaded = manager->was_snapshot_loaded();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value);
}

// ── Checkpointing ───────────────────────────────────────────

TEST_F(StateManagerTest, NoCheckpointWithinInterval) {
    activate("libs-release");

    ASSERT_TRUE(manager->get_directory_snapshot_node_with_lru("a").is_ok());
    now += 5min;
    ASSERT_TRUE(manager->look_up_node("a").is_ok());
    EXPECT_EQ(log->persist_count, 0);
}

TEST_F(StateManagerTest, TwoCallsPastIntervalWriteOnce) {
    activate("libs-release");

    now += 11min;
    ASSERT_TRUE(manager->get_directory_snapshot_node_with_lru("a").is_ok());
    ASSERT_TRUE(manager->look_up_node("a").is_ok());
    EXPECT_EQ(log->persist_count, 1);
}

TEST_F(StateManagerTest, EndToEndCheckpoint) {
    activate("libs-release");
    auto initial = manager->last_snapshot_save_time();
    ASSERT_TRUE(initial.has_value());

    ASSERT_TRUE(manager->get_directory_snapshot_node_with_lru("docs").is_ok());
    EXPECT_EQ(log->persist_count, 0);

    now += 10min + 1s;
    ASSERT_TRUE(manager->look_up_node("docs").is_ok());
    EXPECT_EQ(log->persist_count, 1);
    ASSERT_TRUE(manager->last_snapshot_save_time().has_value());
    EXPECT_GT(*manager->last_snapshot_save_time(), *initial);
    EXPECT_EQ(*manager->last_snapshot_save_time(), now);

    // The checkpoint also wrote the aggregate state.
    TransferStateStore store(TransferPaths{test_dir});
    auto repo = store.load_repo_state("libs-release");
    ASSERT_TRUE(repo.is_ok());
    EXPECT_TRUE(repo.value.has_value());
}

TEST_F(StateManagerTest, CheckpointSkippedWhileAnotherHoldsSaveLock) {
    activate("libs-release");
    now += 11min;

    {
        std::unique_lock<TryLock> held(snapshot_save_lock(), std::try_to_lock);
        ASSERT_TRUE(held.owns_lock());

        auto result = manager->look_up_node("");
        EXPECT_TRUE(result.is_ok());
        EXPECT_EQ(log->persist_count, 0);
    }

    // Released: the next call performs the checkpoint.
    ASSERT_TRUE(manager->look_up_node("").is_ok());
    EXPECT_EQ(log->persist_count, 1);
}

TEST_F(StateManagerTest, ConcurrentCallersCheckpointOnce) {
    activate("libs-release");
    now += 11min;

    std::atomic<int> errors{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 16; i++) {
        workers.emplace_back([&] {
            for (int j = 0; j < 50; j++) {
                if (manager->look_up_node("").is_err()) errors++;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(log->persist_count, 1);
    EXPECT_EQ(*manager->last_snapshot_save_time(), now);
}

TEST_F(StateManagerTest, FailedActionDoesNotCheckpoint) {
    activate("libs-release");
    now += 11min;

    auto result = manager->look_up_node("missing");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.code, ErrorCode::NotFound);
    EXPECT_EQ(log->persist_count, 0);
}

TEST_F(StateManagerTest, PersistErrorReachesCaller) {
    activate("libs-release");
    log->fail_persist = true;
    now += 11min;

    auto result = manager->get_directory_snapshot_node_with_lru("a");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.code, ErrorCode::Io);

    // The save lock was released on the failure path.
    std::unique_lock<TryLock> probe(snapshot_save_lock(), std::try_to_lock);
    EXPECT_TRUE(probe.owns_lock());
}

TEST_F(StateManagerTest, SaveTimestampNeverMovesBack) {
    activate("libs-release");
    now += 11min;
    ASSERT_TRUE(manager->look_up_node("").is_ok());
    auto saved = *manager->last_snapshot_save_time();

    now -= 1h;
    ASSERT_TRUE(manager->look_up_node("").is_ok());
    EXPECT_EQ(*manager->last_snapshot_save_time(), saved);
    EXPECT_EQ(log->persist_count, 1);
}

// ── Repository state ────────────────────────────────────────

TEST_F(StateManagerTest, SetRepoStateRequiresKey) {
    auto result = manager->set_repo_state("", 0, 0, false);
    EXPECT_EQ(result.code, ErrorCode::InvalidArgument);
}

TEST_F(StateManagerTest, SwitchingRepositoryDisablesSnapshot) {
    activate("libs-release");
    ASSERT_TRUE(manager->set_repo_state("libs-snapshot", 10, 1, false).is_ok());
    EXPECT_FALSE(manager->is_repo_transfer_snapshot_enabled());
    EXPECT_EQ(manager->run_status().current_repo_key, "libs-snapshot");
}

TEST_F(StateManagerTest, HeldNodeOutlivesRepositorySwitch) {
    activate("libs-release");
    auto node = manager->get_directory_snapshot_node_with_lru("docs");
    ASSERT_TRUE(node.is_ok());

    ASSERT_TRUE(manager->set_repo_state("libs-snapshot", 10, 1, false).is_ok());
    EXPECT_FALSE(manager->is_repo_transfer_snapshot_enabled());

    // The worker finishes with its node; new lookups are refused.
    node.value->increment_files_count(5);
    EXPECT_EQ(node.value->files_count(), 1);
    EXPECT_EQ(node.value->total_files_size(), 5);
    EXPECT_EQ(manager->look_up_node("docs").code, ErrorCode::Uninitialized);
}

TEST_F(StateManagerTest, HeldNodeOutlivesFinishRun) {
    ASSERT_TRUE(manager->start_run().is_ok());
    activate("libs-release");
    auto node = manager->look_up_node("");
    ASSERT_TRUE(node.is_ok());

    ASSERT_TRUE(manager->finish_run().is_ok());
    node.value->mark_done_exploring();
    EXPECT_TRUE(node.value->check_completed());
}

TEST_F(StateManagerTest, PhaseNeverGoesBack) {
    activate("libs-release");
    ASSERT_TRUE(manager->set_repo_phase(TransferPhase::Phase2).is_ok());
    EXPECT_EQ(manager->run_status().current_repo_phase, TransferPhase::Phase2);

    auto back = manager->set_repo_phase(TransferPhase::Phase1);
    EXPECT_EQ(back.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(manager->repo_state().phase, TransferPhase::Phase2);
}

TEST_F(StateManagerTest, CountersAccumulatePerPhase) {
    activate("libs-release");
    manager->set_total_repositories(4, 5000);

    ASSERT_TRUE(manager->inc_transferred_size_and_files(TransferPhase::Phase1, 2, 300).is_ok());
    ASSERT_TRUE(manager->inc_transferred_size_and_files(TransferPhase::Phase2, 1, 50).is_ok());
    ASSERT_TRUE(manager->set_repo_phase(TransferPhase::Phase3).is_ok());
    ASSERT_TRUE(manager->inc_transferred_size_and_files(TransferPhase::Phase3, 1, 20).is_ok());
    manager->inc_repositories_transferred();

    auto repo = manager->repo_state();
    EXPECT_EQ(repo.phase1.transferred_units, 2);
    EXPECT_EQ(repo.phase1.transferred_size_bytes, 300);
    EXPECT_EQ(repo.phase1.total_units, 10);
    EXPECT_EQ(repo.phase1.total_size_bytes, 1000);
    EXPECT_EQ(repo.phase3.transferred_units, 1);
    EXPECT_EQ(repo.phase3.transferred_size_bytes, 20);

    auto run = manager->run_status();
    EXPECT_EQ(run.total_transferred_bytes, 370);
    EXPECT_EQ(run.total_bytes, 5000);
    EXPECT_EQ(run.transferred_repositories, 1);
    EXPECT_EQ(run.total_repositories, 4);
}

TEST_F(StateManagerTest, NegativeIncrementRejected) {
    activate("libs-release");
    auto result = manager->inc_transferred_size_and_files(TransferPhase::Phase1, -1, 0);
    EXPECT_EQ(result.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(manager->repo_state().phase1.transferred_units, 0);
}

TEST_F(StateManagerTest, FailureCountClampsAtZero) {
    manager->change_transfer_failure_count_by(3);
    EXPECT_EQ(manager->transfer_failures(), 3u);
    manager->change_transfer_failure_count_by(-5);
    EXPECT_EQ(manager->transfer_failures(), 0u);
}

TEST_F(StateManagerTest, WorkingThreads) {
    manager->set_working_threads(8);
    EXPECT_EQ(manager->working_threads(), 8);
    manager->set_working_threads(-1);
    EXPECT_EQ(manager->working_threads(), 0);
}

TEST_F(StateManagerTest, SpeedNotAvailableWithoutSamples) {
    EXPECT_EQ(manager->run_status().speed, "Not available yet");
    EXPECT_EQ(manager->run_status().estimated_remaining, "Not available yet");
}

TEST_F(StateManagerTest, ResumesPersistedRepositoryState) {
    activate("libs-release");
    ASSERT_TRUE(manager->inc_transferred_size_and_files(TransferPhase::Phase1, 3, 400).is_ok());
    ASSERT_TRUE(manager->persist_transfer_state().is_ok());

    // A new process picks the repository up where it stopped.
    manager = make_manager();
    ASSERT_TRUE(manager->set_repo_state("libs-release", 1000, 10, false).is_ok());
    EXPECT_EQ(manager->repo_state().phase1.transferred_units, 3);
    EXPECT_EQ(manager->repo_state().phase1.transferred_size_bytes, 400);

    ASSERT_TRUE(manager->set_repo_state("libs-release", 1000, 10, true).is_ok());
    EXPECT_EQ(manager->repo_state().phase1.transferred_units, 0);
}

// ── Run lifecycle ───────────────────────────────────────────

TEST_F(StateManagerTest, RunLockMarksRunning) {
    TransferPaths paths{test_dir};
    EXPECT_FALSE(get_running_time(paths).running);

    ASSERT_TRUE(manager->start_run().is_ok());
    EXPECT_TRUE(manager->is_run_started());
    auto running = get_running_time(paths);
    EXPECT_TRUE(running.running);
    EXPECT_FALSE(running.duration.empty());

    // Second manager on the same directory cannot start.
    auto other = make_manager();
    EXPECT_TRUE(other->start_run().is_err());

    ASSERT_TRUE(manager->finish_run().is_ok());
    EXPECT_FALSE(manager->is_run_started());
    EXPECT_FALSE(get_running_time(paths).running);
}

TEST_F(StateManagerTest, StartRunContinuesPersistedCounters) {
    ASSERT_TRUE(manager->start_run().is_ok());
    manager->set_total_repositories(3, 900);
    manager->inc_repositories_transferred();
    ASSERT_TRUE(manager->finish_run().is_ok());

    manager = make_manager();
    ASSERT_TRUE(manager->start_run().is_ok());
    auto run = manager->run_status();
    EXPECT_EQ(run.transferred_repositories, 1);
    EXPECT_EQ(run.total_repositories, 3);
    EXPECT_EQ(run.total_bytes, 900);
    EXPECT_TRUE(run.current_repo_key.empty());
    ASSERT_TRUE(manager->finish_run().is_ok());
}

// ── Construction from config ────────────────────────────────

class ConfiguredStateManagerTest : public StateManagerTest {
protected:
    std::unique_ptr<TransferStateManager> configured(const std::string& transfer_block) {
        auto config = Config::parse("transfer:\n  state_dir: " + (test_dir / "state").string() +
                                    "\n" + transfer_block, test_dir);
        EXPECT_TRUE(config.is_ok()) << config.error;
        return make_transfer_state_manager(config.value, [this] { return now; });
    }
};

TEST_F(ConfiguredStateManagerTest, ConfiguredIntervalDrivesCheckpoint) {
    auto m = configured("  snapshot_save_interval_minutes: 1\n");
    ASSERT_TRUE(m->set_repo_state("libs-release", 1000, 10, false).is_ok());
    ASSERT_TRUE(m->init_repo_snapshot().is_ok());
    ASSERT_TRUE(m->get_directory_snapshot_node_with_lru("docs").is_ok());

    fs::path snapshot = TransferPaths{test_dir / "state"}.repo_snapshot_file("libs-release");

    now += 59s;
    ASSERT_TRUE(m->look_up_node("docs").is_ok());
    EXPECT_FALSE(fs::exists(snapshot));

    now += 2s;
    ASSERT_TRUE(m->look_up_node("docs").is_ok());
    EXPECT_TRUE(fs::exists(snapshot));
    EXPECT_EQ(*m->last_snapshot_save_time(), now);
}

TEST_F(ConfiguredStateManagerTest, DefaultIntervalIsTenMinutes) {
    auto m = configured("");
    ASSERT_TRUE(m->set_repo_state("libs-release", 1000, 10, false).is_ok());
    ASSERT_TRUE(m->init_repo_snapshot().is_ok());

    now += 61s;
    ASSERT_TRUE(m->look_up_node("").is_ok());
    EXPECT_FALSE(fs::exists(TransferPaths{test_dir / "state"}.repo_snapshot_file("libs-release")));
}

TEST_F(ConfiguredStateManagerTest, YamlNodeOutlivesRepositorySwitch) {
    auto m = configured("  lru_capacity: 2\n");
    ASSERT_TRUE(m->set_repo_state("a", 0, 0, false).is_ok());
    ASSERT_TRUE(m->init_repo_snapshot().is_ok());
    auto node = m->get_directory_snapshot_node_with_lru("x/y");
    ASSERT_TRUE(node.is_ok());

    ASSERT_TRUE(m->set_repo_state("b", 0, 0, false).is_ok());
    node.value->increment_files_count(5);
    EXPECT_EQ(node.value->files_count(), 1);
    EXPECT_EQ(node.value->relative_path(), "x/y");
}

TEST(TransferStateManagerOptions, FromSettings) {
    TransferSettings settings;
    settings.snapshot_save_interval_minutes = 3;
    settings.speed_window_seconds = 30;
    auto options = TransferStateManager::options_from(settings);
    EXPECT_EQ(options.snapshot_save_interval, std::chrono::seconds(180));
    EXPECT_EQ(options.speed_window, std::chrono::seconds(30));
    EXPECT_FALSE(options.clock);
}
