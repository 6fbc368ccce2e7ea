#include <gtest/gtest.h>
#include <managers/transfer_estimator.hpp>
#include <managers/state_persister.hpp>
#include <managers/transfer_state_manager.hpp>
#include <platform/platform.hpp>
#include <filesystem>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(TransferEstimator, NotAvailableWithFewSamples) {
    TransferEstimator estimator(120s);
    auto t = TransferEstimator::Clock::now();
    estimator.add_chunk(1000000, t);
    estimator.add_chunk(1000000, t + 1s);

    EXPECT_EQ(estimator.speed_string(t + 2s), "Not available yet");
    EXPECT_EQ(estimator.remaining_time_string(5000000, t + 2s), "Not available yet");
}

TEST(TransferEstimator, AverageOverWindow) {
    TransferEstimator estimator(120s);
    auto t = TransferEstimator::Clock::now();
    estimator.add_chunk(1000000, t);
    estimator.add_chunk(1000000, t + 1s);
    estimator.add_chunk(1000000, t + 2s);

    // 3 MB over 2 seconds
    EXPECT_DOUBLE_EQ(estimator.speed_bytes_per_sec(t + 2s), 1500000.0);
    EXPECT_EQ(estimator.speed_string(t + 2s), "1.500 MB/s");
    EXPECT_EQ(estimator.remaining_time_string(90000000, t + 2s), "About 1 minute");
}

TEST(TransferEstimator, OldSamplesExpire) {
    TransferEstimator estimator(60s);
    auto t = TransferEstimator::Clock::now();
    estimator.add_chunk(1000, t);
    estimator.add_chunk(1000, t + 1s);
    estimator.add_chunk(1000, t + 2s);

    EXPECT_EQ(estimator.speed_string(t + 5min), "Not available yet");
}

TEST(TransferEstimator, EmptyChunksIgnored) {
    TransferEstimator estimator(120s);
    auto t = TransferEstimator::Clock::now();
    estimator.add_chunk(0, t);
    estimator.add_chunk(-5, t);
    estimator.add_chunk(0, t);
    EXPECT_EQ(estimator.speed_bytes_per_sec(t + 1s), 0.0);
}

// ── StatePersister ──────────────────────────────────────────

class StatePersisterTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("repomove_state_persister_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(StatePersisterTest, StopWritesFinalState) {
    TransferStateManager manager(TransferPaths{test_dir},
                                 std::make_shared<YamlSnapshotTreeFactory>(100),
                                 TransferStateManager::Options{});
    manager.set_total_repositories(2, 100);

    StatePersister persister(manager, 60s);
    ASSERT_TRUE(persister.start());
    EXPECT_TRUE(persister.running());
    persister.stop();
    EXPECT_FALSE(persister.running());

    TransferStateStore store(TransferPaths{test_dir});
    auto run = store.load_run_status();
    ASSERT_TRUE(run.is_ok());
    ASSERT_TRUE(run.value.has_value());
    EXPECT_EQ(run.value->total_repositories, 2);
}

TEST_F(StatePersisterTest, IntervalFromSettings) {
    TransferStateManager manager(TransferPaths{test_dir},
                                 std::make_shared<YamlSnapshotTreeFactory>(100),
                                 TransferStateManager::Options{});
    TransferSettings settings;
    settings.state_persist_interval_seconds = 1;

    StatePersister persister(manager, settings);
    ASSERT_TRUE(persister.start());
    // Written by the loop well before stop(), which would also write it.
    for (int i = 0; i < 50 && !fs::exists(test_dir / "run-status.yaml"); i++) {
        platform::sleep_ms(100);
    }
    EXPECT_TRUE(fs::exists(test_dir / "run-status.yaml"));
    persister.stop();
}
