#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include <core/directory_structure.hpp>

// YAML persistence of the run status and of per-repository transfer states.
// Loads distinguish "never written" (empty optional) from unreadable files (error).
class TransferStateStore {
public:
    explicit TransferStateStore(TransferPaths paths);

    Result<std::optional<TransferRunStatus>> load_run_status() const;
    Result<void> save_run_status(const TransferRunStatus& status) const;

    Result<std::optional<RepoTransferState>> load_repo_state(const std::string& repo_key) const;
    Result<void> save_repo_state(const RepoTransferState& state) const;

    const TransferPaths& paths() const { return paths_; }

private:
    TransferPaths paths_;
};

// Serialization helpers, exposed for tests.
std::string run_status_to_yaml(const TransferRunStatus& status);
Result<TransferRunStatus> run_status_from_yaml(const std::string& yaml);
std::string repo_state_to_yaml(const RepoTransferState& state);
Result<RepoTransferState> repo_state_from_yaml(const std::string& yaml);
