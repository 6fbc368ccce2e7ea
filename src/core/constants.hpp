#pragma once

#include <cstdint>

constexpr const char* REPOMOVE_VERSION       = "0.1.0";

// ── Checkpointing ───────────────────────────────────────────
constexpr int SNAPSHOT_SAVE_INTERVAL_MIN     = 10;    // Tree snapshot + state checkpoint interval
constexpr int STATE_PERSIST_INTERVAL_SECS    = 10;    // Background run-status persistence
constexpr int STATE_PERSISTER_TICK_MS        = 200;   // Persister wake-up granularity

// ── Snapshot tree ───────────────────────────────────────────
constexpr int64_t DEFAULT_LRU_CAPACITY       = 10000; // Directory nodes kept in the lookup cache

// ── Speed estimation ────────────────────────────────────────
constexpr int SPEED_WINDOW_SECS              = 120;   // Sliding window for the average speed
constexpr int MIN_SPEED_SAMPLES              = 3;     // Samples needed before an ETA is shown

// ── Files ───────────────────────────────────────────────────
constexpr const char* RUN_STATUS_FILE        = "run-status.yaml";
constexpr const char* REPO_STATE_FILE        = "state.yaml";
constexpr const char* REPO_SNAPSHOT_FILE     = "snapshot.yaml";
constexpr const char* RUN_LOCK_FILE          = "running.lock";
constexpr const char* REPOS_DIR              = "repos";

// ── Status report ───────────────────────────────────────────
constexpr const char* RETRY_FAILURE_NOTE =
    "In Phase 3 and in subsequent executions, we'll retry transferring the failed files";
