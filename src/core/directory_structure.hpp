#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Layout of a transfer state directory:
//   <state_dir>/run-status.yaml
//   <state_dir>/running.lock
//   <state_dir>/repos/<repo_key>/state.yaml
//   <state_dir>/repos/<repo_key>/snapshot.yaml
struct TransferPaths {
    fs::path state_dir;

    fs::path run_status_file() const;
    fs::path run_lock_file() const;
    fs::path repo_dir(const std::string& repo_key) const;
    fs::path repo_state_file(const std::string& repo_key) const;
    fs::path repo_snapshot_file(const std::string& repo_key) const;
};

// Ensures the state directory and its repos/ subdirectory exist.
// Creates directories as needed but does not overwrite files
void ensure_transfer_directory_structure(const TransferPaths& paths);
