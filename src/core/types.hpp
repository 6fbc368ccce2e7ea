#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Error categories carried by Result. Callers branch on these; the message is for humans.
enum class ErrorCode {
    None,
    Generic,
    Uninitialized,      // snapshot operation with no active repository snapshot
    NotFound,           // path unknown to the tree snapshot
    MissingStateFile,   // expected persisted state is gone (corrupted run directory)
    Io,                 // read/write/create of a state or snapshot file
    Parse,              // persisted file exists but cannot be decoded
    InvalidArgument,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::Generic) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::Generic) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Phase tracking ──────────────────────────────────────────
// Each repository goes through the phases strictly in order.
enum class TransferPhase {
    Phase1 = 1,     // full scan and transfer of the whole tree
    Phase2 = 2,     // delta: items created or modified since Phase 1 began
    Phase3 = 3,     // retry of failures from Phase 1/3
};

// "phase1", "phase2", "phase3"; used in persisted files.
const char* phase_name(TransferPhase phase);

// Inverse of phase_name(). Empty optional on unknown input.
std::optional<TransferPhase> parse_phase(const std::string& name);

// Human description used by the status report, e.g. "Retrying transfer failures (3/3)".
const char* phase_description(TransferPhase phase);

// Counter shape shared by Phase 1 and Phase 3. Phase 2 has no fixed total.
struct PhaseProgress {
    int64_t transferred_units = 0;
    int64_t total_units = 0;
    int64_t transferred_size_bytes = 0;
    int64_t total_size_bytes = 0;
};

// Per-repository progress. Exists only while the repository is current.
struct RepoTransferState {
    std::string repo_key;
    TransferPhase phase = TransferPhase::Phase1;
    PhaseProgress phase1;
    PhaseProgress phase3;
    std::string full_transfer_started;   // ISO timestamp, "" until Phase 1 starts
    std::string full_transfer_ended;     // ISO timestamp, "" until Phase 1 completes
};

// Aggregate counters for the whole run.
struct TransferRunStatus {
    std::string start_time;              // ISO timestamp of the run start
    int64_t total_transferred_bytes = 0;
    int64_t total_bytes = 0;
    int64_t transferred_repositories = 0;
    int64_t total_repositories = 0;
    int working_threads = 0;
    uint32_t transfer_failures = 0;
    std::string speed;                   // rendered by TransferEstimator
    std::string estimated_remaining;     // rendered by TransferEstimator
    std::string current_repo_key;        // "" when no repository is active
    TransferPhase current_repo_phase = TransferPhase::Phase1;
};
