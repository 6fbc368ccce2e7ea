#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include "state_store.hpp"
#include "snapshot_tree.hpp"
#include "repo_transfer_snapshot.hpp"
#include "transfer_estimator.hpp"

class RunLock;

// Non-blocking lock. try_lock() takes it or reports it busy; there is no
// blocking acquire. Satisfies std::unique_lock with std::try_to_lock/defer_lock.
class TryLock {
public:
    bool try_lock() noexcept { return !flag_.test_and_set(std::memory_order_acquire); }
    void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// Process-wide lock coalescing snapshot checkpoints: whoever holds it writes,
// everyone else skips.
TryLock& snapshot_save_lock();

// Process-wide guard around writing the aggregate state files.
std::mutex& state_save_mutex();

// Liveness of a transfer, as seen from any process.
struct RunningTime {
    bool running = false;
    std::string duration;       // e.g. "2h35m"; "" when not running
};

RunningTime get_running_time(const TransferPaths& paths);

// Authoritative progress of a transfer run: aggregate counters, the current
// repository's state, and its tree snapshot. All snapshot access goes through
// apply_to_snapshot(), which also checkpoints state to disk periodically.
// Safe to call from many worker threads.
class TransferStateManager {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using SnapshotAction = std::function<Result<void>(RepoTransferSnapshot&)>;

    struct Options {
        std::chrono::seconds snapshot_save_interval{std::chrono::minutes(SNAPSHOT_SAVE_INTERVAL_MIN)};
        std::chrono::seconds speed_window{SPEED_WINDOW_SECS};
        ClockFn clock;          // system clock when empty
    };

    static Options options_from(const TransferSettings& settings, ClockFn clock = {});

    TransferStateManager(TransferPaths paths,
                         std::shared_ptr<SnapshotTreeFactory> factory,
                         Options options);
    ~TransferStateManager();

    TransferStateManager(const TransferStateManager&) = delete;
    TransferStateManager& operator=(const TransferStateManager&) = delete;

    // ── Run lifecycle ───────────────────────────────────────
    // Marks the run as running (run lock) and continues the aggregate
    // counters of a previous run if one was persisted.
    Result<void> start_run();
    // Persists the final state and releases the run lock.
    Result<void> finish_run();
    bool is_run_started() const;

    // ── Repository lifecycle ────────────────────────────────
    // Make repo_key the current repository. Unless reset, resumes the
    // repository's persisted state. Always drops the previous repository's
    // snapshot; call init_repo_snapshot() to enable one for repo_key.
    Result<void> set_repo_state(const std::string& repo_key, int64_t total_size_bytes,
                                int64_t total_files, bool reset);
    Result<void> set_repo_phase(TransferPhase phase);
    Result<void> set_phase_totals(TransferPhase phase, int64_t total_units,
                                  int64_t total_size_bytes);
    void set_repo_full_transfer_started();
    void set_repo_full_transfer_completed();

    // ── Counters ────────────────────────────────────────────
    void set_total_repositories(int64_t count, int64_t total_bytes);
    void inc_repositories_transferred();
    Result<void> inc_transferred_size_and_files(TransferPhase phase, int64_t units, int64_t bytes);
    void set_working_threads(int threads);
    int working_threads() const;
    // Failures are retried later, so the count may also go down. Never below zero.
    void change_transfer_failure_count_by(int64_t delta);
    uint32_t transfer_failures() const;

    TransferRunStatus run_status() const;
    RepoTransferState repo_state() const;

    // ── Tree snapshot ───────────────────────────────────────
    // Load the current repository's persisted snapshot, or create a fresh one.
    Result<void> init_repo_snapshot();
    void disable_repo_transfer_snapshot();
    bool is_repo_transfer_snapshot_enabled() const;

    // Nodes stay usable after the snapshot is disabled or the repository
    // changes; later calls through the manager fail with Uninitialized.
    Result<SnapshotNodeRef> look_up_node(const std::string& relative_path);
    Result<bool> was_snapshot_loaded();
    Result<SnapshotNodeRef> get_directory_snapshot_node_with_lru(const std::string& relative_path);

    // The single serialization point for snapshot access:
    //  1. Uninitialized error if no snapshot is active.
    //  2. Runs action; its error is returned and nothing is persisted.
    //  3. Within the save interval since the last checkpoint: done.
    //  4. Checkpoint lock busy: done, the running checkpoint covers this one.
    //  5. Otherwise stamps the checkpoint time, then writes the tree and the state.
    //  6. Write errors are returned even though the action succeeded.
    Result<void> apply_to_snapshot(const SnapshotAction& action);

    // Checkpoint time of the active snapshot.
    std::optional<Clock::time_point> last_snapshot_save_time() const;

    // ── Persistence ─────────────────────────────────────────
    // Write the current repository state, then the run status.
    Result<void> persist_transfer_state();

    const TransferPaths& paths() const { return paths_; }

private:
    Clock::time_point now() const { return clock_(); }
    void refresh_estimates_locked(TransferRunStatus& out) const;

    TransferPaths paths_;
    TransferStateStore store_;
    std::shared_ptr<SnapshotTreeFactory> factory_;
    std::chrono::seconds save_interval_;
    ClockFn clock_;

    // Counters
    mutable std::mutex state_mutex_;
    TransferRunStatus run_;
    RepoTransferState repo_;
    mutable TransferEstimator estimator_;

    // Serialization gate of the active snapshot
    mutable std::mutex snapshot_mutex_;
    std::optional<RepoTransferSnapshot> repo_snapshot_;

    std::unique_ptr<RunLock> run_lock_;
};

// Manager for the state directory, checkpoint interval, speed window and
// lookup-cache capacity configured in config.yaml, backed by YAML snapshot trees.
std::unique_ptr<TransferStateManager>
make_transfer_state_manager(const Config& config, TransferStateManager::ClockFn clock = {});
