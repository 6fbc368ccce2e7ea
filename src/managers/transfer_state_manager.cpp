#include "transfer_state_manager.hpp"
#include "transfer_log.hpp"
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <platform/run_lock.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

TryLock& snapshot_save_lock() {
    static TryLock lock;
    return lock;
}

std::mutex& state_save_mutex() {
    static std::mutex mutex;
    return mutex;
}

RunningTime get_running_time(const TransferPaths& paths) {
    RunningTime result;
    auto probe = RunLock::probe(paths.run_lock_file().string());
    if (!probe.running) return result;
    result.running = true;
    result.duration = format_duration(probe.start_time);
    return result;
}

// ── Construction ────────────────────────────────────────────

TransferStateManager::Options TransferStateManager::options_from(const TransferSettings& settings,
                                                                 ClockFn clock) {
    Options options;
    options.snapshot_save_interval = std::chrono::minutes(settings.snapshot_save_interval_minutes);
    options.speed_window = std::chrono::seconds(settings.speed_window_seconds);
    options.clock = std::move(clock);
    return options;
}

std::unique_ptr<TransferStateManager>
make_transfer_state_manager(const Config& config, TransferStateManager::ClockFn clock) {
    const auto& settings = config.transfer();
    return std::make_unique<TransferStateManager>(
        TransferPaths{settings.state_dir},
        std::make_shared<YamlSnapshotTreeFactory>(settings.lru_capacity),
        TransferStateManager::options_from(settings, std::move(clock)));
}

TransferStateManager::TransferStateManager(TransferPaths paths,
                                           std::shared_ptr<SnapshotTreeFactory> factory,
                                           Options options)
    : paths_(std::move(paths)),
      store_(paths_),
      factory_(std::move(factory)),
      save_interval_(options.snapshot_save_interval),
      clock_(options.clock ? std::move(options.clock) : ClockFn([] { return Clock::now(); })),
      estimator_(options.speed_window) {}

TransferStateManager::~TransferStateManager() = default;

// ── Run lifecycle ───────────────────────────────────────────

Result<void> TransferStateManager::start_run() {
    if (run_lock_) {
        return Result<void>::Err("transfer run already started", ErrorCode::InvalidArgument);
    }

    try {
        ensure_transfer_directory_structure(paths_);
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("failed to create state directory: ") + e.what(),
                                 ErrorCode::Io);
    }

    std::string start = to_iso(now());
    auto lock = std::make_unique<RunLock>(paths_.run_lock_file().string(), start);
    if (!lock->held()) {
        return Result<void>::Err(
            fmt::format("another transfer is already running on {}", paths_.state_dir.string()),
            ErrorCode::Io);
    }

    auto previous = store_.load_run_status();
    if (previous.is_err()) return Result<void>::Err(previous.error, previous.code);

    {
        std::lock_guard<std::mutex> lock_state(state_mutex_);
        if (previous.value) {
            // Continue the totals; per-process fields start over.
            run_ = *previous.value;
            run_.working_threads = 0;
            run_.speed.clear();
            run_.estimated_remaining.clear();
            run_.current_repo_key.clear();
            run_.current_repo_phase = TransferPhase::Phase1;
        } else {
            run_ = TransferRunStatus{};
        }
        run_.start_time = start;
        repo_ = RepoTransferState{};
    }
    run_lock_ = std::move(lock);

    repomove_log(fmt::format("run started at {} ({})", start,
                             previous.value ? "resumed counters" : "fresh counters"));
    return persist_transfer_state();
}

Result<void> TransferStateManager::finish_run() {
    if (!run_lock_) {
        return Result<void>::Err("transfer run was not started", ErrorCode::InvalidArgument);
    }

    disable_repo_transfer_snapshot();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run_.working_threads = 0;
        run_.current_repo_key.clear();
        repo_ = RepoTransferState{};
    }
    auto persisted = persist_transfer_state();
    run_lock_.reset();
    repomove_log("run finished");
    return persisted;
}

bool TransferStateManager::is_run_started() const {
    return run_lock_ != nullptr;
}

// ── Repository lifecycle ────────────────────────────────────

Result<void> TransferStateManager::set_repo_state(const std::string& repo_key,
                                                  int64_t total_size_bytes,
                                                  int64_t total_files, bool reset) {
    if (repo_key.empty()) {
        return Result<void>::Err("repository key must not be empty", ErrorCode::InvalidArgument);
    }
    if (total_size_bytes < 0 || total_files < 0) {
        return Result<void>::Err("repository totals must not be negative",
                                 ErrorCode::InvalidArgument);
    }

    // A new repository never inherits the previous one's snapshot.
    disable_repo_transfer_snapshot();

    RepoTransferState state;
    state.repo_key = repo_key;
    if (!reset) {
        auto persisted = store_.load_repo_state(repo_key);
        if (persisted.is_err()) return Result<void>::Err(persisted.error, persisted.code);
        if (persisted.value) state = *persisted.value;
    }
    state.phase1.total_units = total_files;
    state.phase1.total_size_bytes = total_size_bytes;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        repo_ = state;
        run_.current_repo_key = repo_key;
        run_.current_repo_phase = state.phase;
    }

    repomove_log(fmt::format("current repository: {} ({}, {} files, {} bytes)", repo_key,
                             phase_name(state.phase), total_files, total_size_bytes));

    // The repository state must be on disk before the run status points at it.
    return persist_transfer_state();
}

Result<void> TransferStateManager::set_repo_phase(TransferPhase phase) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (repo_.repo_key.empty()) {
        return Result<void>::Err("no current repository", ErrorCode::InvalidArgument);
    }
    if (static_cast<int>(phase) < static_cast<int>(repo_.phase)) {
        return Result<void>::Err(
            fmt::format("repository '{}' cannot go back from {} to {}", repo_.repo_key,
                        phase_name(repo_.phase), phase_name(phase)),
            ErrorCode::InvalidArgument);
    }
    repo_.phase = phase;
    run_.current_repo_phase = phase;
    return Result<void>::Ok();
}

Result<void> TransferStateManager::set_phase_totals(TransferPhase phase, int64_t total_units,
                                                    int64_t total_size_bytes) {
    if (total_units < 0 || total_size_bytes < 0) {
        return Result<void>::Err("phase totals must not be negative", ErrorCode::InvalidArgument);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (repo_.repo_key.empty()) {
        return Result<void>::Err("no current repository", ErrorCode::InvalidArgument);
    }
    switch (phase) {
        case TransferPhase::Phase1:
            repo_.phase1.total_units = total_units;
            repo_.phase1.total_size_bytes = total_size_bytes;
            break;
        case TransferPhase::Phase3:
            repo_.phase3.total_units = total_units;
            repo_.phase3.total_size_bytes = total_size_bytes;
            break;
        case TransferPhase::Phase2:
            return Result<void>::Err("phase 2 has no totals", ErrorCode::InvalidArgument);
    }
    return Result<void>::Ok();
}

void TransferStateManager::set_repo_full_transfer_started() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    repo_.full_transfer_started = to_iso(now());
}

void TransferStateManager::set_repo_full_transfer_completed() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    repo_.full_transfer_ended = to_iso(now());
}

// ── Counters ────────────────────────────────────────────────

void TransferStateManager::set_total_repositories(int64_t count, int64_t total_bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    run_.total_repositories = std::max<int64_t>(count, 0);
    run_.total_bytes = std::max<int64_t>(total_bytes, 0);
}

void TransferStateManager::inc_repositories_transferred() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    run_.transferred_repositories++;
}

Result<void> TransferStateManager::inc_transferred_size_and_files(TransferPhase phase,
                                                                  int64_t units, int64_t bytes) {
    if (units < 0 || bytes < 0) {
        return Result<void>::Err("transferred counters only grow", ErrorCode::InvalidArgument);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (phase) {
        case TransferPhase::Phase1:
            repo_.phase1.transferred_units += units;
            repo_.phase1.transferred_size_bytes += bytes;
            break;
        case TransferPhase::Phase3:
            repo_.phase3.transferred_units += units;
            repo_.phase3.transferred_size_bytes += bytes;
            break;
        case TransferPhase::Phase2:
            break;
    }
    run_.total_transferred_bytes += bytes;
    estimator_.add_chunk(bytes, now());
    return Result<void>::Ok();
}

void TransferStateManager::set_working_threads(int threads) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    run_.working_threads = std::max(threads, 0);
}

int TransferStateManager::working_threads() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return run_.working_threads;
}

void TransferStateManager::change_transfer_failure_count_by(int64_t delta) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    int64_t updated = static_cast<int64_t>(run_.transfer_failures) + delta;
    updated = std::clamp<int64_t>(updated, 0, std::numeric_limits<uint32_t>::max());
    run_.transfer_failures = static_cast<uint32_t>(updated);
}

uint32_t TransferStateManager::transfer_failures() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return run_.transfer_failures;
}

void TransferStateManager::refresh_estimates_locked(TransferRunStatus& out) const {
    auto t = now();
    out.speed = estimator_.speed_string(t);
    out.estimated_remaining = estimator_.remaining_time_string(
        out.total_bytes - out.total_transferred_bytes, t);
}

TransferRunStatus TransferStateManager::run_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    TransferRunStatus copy = run_;
    refresh_estimates_locked(copy);
    return copy;
}

RepoTransferState TransferStateManager::repo_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return repo_;
}

// ── Tree snapshot ───────────────────────────────────────────

Result<void> TransferStateManager::init_repo_snapshot() {
    std::string repo_key;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        repo_key = repo_.repo_key;
    }
    if (repo_key.empty()) {
        return Result<void>::Err("no current repository to snapshot", ErrorCode::InvalidArgument);
    }

    auto snapshot_file = paths_.repo_snapshot_file(repo_key);
    auto loaded = RepoTransferSnapshot::load(*factory_, repo_key, snapshot_file, now());
    if (loaded.is_err()) return Result<void>::Err(loaded.error, loaded.code);

    bool resumed = loaded.value.has_value();
    {
        std::lock_guard<std::mutex> gate(snapshot_mutex_);
        if (resumed) {
            repo_snapshot_ = std::move(loaded.value);
        } else {
            repo_snapshot_ = RepoTransferSnapshot::create(*factory_, repo_key, snapshot_file, now());
        }
    }

    repomove_log(fmt::format("snapshot of {}: {}", repo_key,
                             resumed ? "loaded from " + snapshot_file.string() : "created"));
    return Result<void>::Ok();
}

void TransferStateManager::disable_repo_transfer_snapshot() {
    std::lock_guard<std::mutex> gate(snapshot_mutex_);
    repo_snapshot_.reset();
}

bool TransferStateManager::is_repo_transfer_snapshot_enabled() const {
    std::lock_guard<std::mutex> gate(snapshot_mutex_);
    return repo_snapshot_.has_value();
}

Result<SnapshotNodeRef> TransferStateManager::look_up_node(const std::string& relative_path) {
    SnapshotNodeRef node;
    auto result = apply_to_snapshot([&](RepoTransferSnapshot& rts) -> Result<void> {
        auto found = rts.look_up_node(relative_path);
        if (found.is_err()) return Result<void>::Err(found.error, found.code);
        node = std::move(found.value);
        return Result<void>::Ok();
    });
    if (result.is_err()) return Result<SnapshotNodeRef>::Err(result.error, result.code);
    return Result<SnapshotNodeRef>::Ok(std::move(node));
}

Result<bool> TransferStateManager::was_snapshot_loaded() {
    bool loaded = false;
    auto result = apply_to_snapshot([&](RepoTransferSnapshot& rts) -> Result<void> {
        loaded = rts.was_snapshot_loaded();
        return Result<void>::Ok();
    });
    if (result.is_err()) return Result<bool>::Err(result.error, result.code);
    return Result<bool>::Ok(loaded);
}

Result<SnapshotNodeRef>
TransferStateManager::get_directory_snapshot_node_with_lru(const std::string& relative_path) {
    SnapshotNodeRef node;
    auto result = apply_to_snapshot([&](RepoTransferSnapshot& rts) -> Result<void> {
        auto found = rts.get_directory_node_with_lru(relative_path);
        if (found.is_err()) return Result<void>::Err(found.error, found.code);
        node = std::move(found.value);
        return Result<void>::Ok();
    });
    if (result.is_err()) return Result<SnapshotNodeRef>::Err(result.error, result.code);
    return Result<SnapshotNodeRef>::Ok(std::move(node));
}

Result<void> TransferStateManager::apply_to_snapshot(const SnapshotAction& action) {
    // Declared first so it is released last, after the writes below.
    std::unique_lock<TryLock> save_guard(snapshot_save_lock(), std::defer_lock);
    std::shared_ptr<SnapshotTree> tree;
    std::string repo_key;

    {
        std::lock_guard<std::mutex> gate(snapshot_mutex_);
        if (!repo_snapshot_) {
            return Result<void>::Err("invalid call to snapshot manager before it was initialized",
                                     ErrorCode::Uninitialized);
        }

        auto result = action(*repo_snapshot_);
        if (result.is_err()) return result;

        auto t = now();
        if (t - repo_snapshot_->last_save_time() < save_interval_) {
            return Result<void>::Ok();
        }

        if (!save_guard.try_lock()) {
            repomove_log("checkpoint skipped, another one is in progress");
            return Result<void>::Ok();
        }

        // Stamp before writing so callers arriving during the write skip it.
        repo_snapshot_->mark_saved(t);
        tree = repo_snapshot_->tree();
        repo_key = repo_snapshot_->repo_key();
    }

    // The gate is open again: other callers proceed while this checkpoint writes.
    auto persisted = tree->persist();
    if (persisted.is_err()) {
        repomove_log(fmt::format("checkpoint of {} failed: {}", repo_key, persisted.error));
        return persisted;
    }

    // Tree first: it is the authoritative resume source. A failure below leaves
    // a state file at most one interval older than the tree.
    auto state = persist_transfer_state();
    if (state.is_err()) {
        repomove_log(fmt::format("checkpoint of {}: tree saved, state failed: {}",
                                 repo_key, state.error));
        return state;
    }

    repomove_log(fmt::format("checkpoint of {} saved", repo_key));
    return Result<void>::Ok();
}

std::optional<TransferStateManager::Clock::time_point>
TransferStateManager::last_snapshot_save_time() const {
    std::lock_guard<std::mutex> gate(snapshot_mutex_);
    if (!repo_snapshot_) return std::nullopt;
    return repo_snapshot_->last_save_time();
}

// ── Persistence ─────────────────────────────────────────────

Result<void> TransferStateManager::persist_transfer_state() {
    std::lock_guard<std::mutex> guard(state_save_mutex());

    TransferRunStatus run;
    RepoTransferState repo;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run = run_;
        repo = repo_;
        refresh_estimates_locked(run);
    }

    if (!repo.repo_key.empty()) {
        auto saved = store_.save_repo_state(repo);
        if (saved.is_err()) return saved;
    }
    return store_.save_run_status(run);
}
