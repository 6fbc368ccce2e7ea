#include "directory_structure.hpp"
#include "constants.hpp"

fs::path TransferPaths::run_status_file() const {
    return state_dir / RUN_STATUS_FILE;
}

fs::path TransferPaths::run_lock_file() const {
    return state_dir / RUN_LOCK_FILE;
}

fs::path TransferPaths::repo_dir(const std::string& repo_key) const {
    return state_dir / REPOS_DIR / repo_key;
}

fs::path TransferPaths::repo_state_file(const std::string& repo_key) const {
    return repo_dir(repo_key) / REPO_STATE_FILE;
}

fs::path TransferPaths::repo_snapshot_file(const std::string& repo_key) const {
    return repo_dir(repo_key) / REPO_SNAPSHOT_FILE;
}

void ensure_transfer_directory_structure(const TransferPaths& paths) {
    fs::create_directories(paths.state_dir);
    fs::create_directories(paths.state_dir / REPOS_DIR);
}

