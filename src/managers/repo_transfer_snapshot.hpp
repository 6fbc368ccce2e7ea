#pragma once

#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <filesystem>
#include <core/types.hpp>
#include "snapshot_tree.hpp"

namespace fs = std::filesystem;

// Tree snapshot of the repository currently being transferred, plus the
// bookkeeping needed to checkpoint it periodically.
class RepoTransferSnapshot {
public:
    using Clock = std::chrono::system_clock;

    // Fresh snapshot around a newly created tree. last_save_time starts at now.
    static RepoTransferSnapshot create(SnapshotTreeFactory& factory,
                                       const std::string& repo_key,
                                       const fs::path& snapshot_file,
                                       Clock::time_point now);

    // Snapshot persisted by a previous run. Empty optional when none exists;
    // read and parse failures are errors.
    static Result<std::optional<RepoTransferSnapshot>> load(SnapshotTreeFactory& factory,
                                                            const std::string& repo_key,
                                                            const fs::path& snapshot_file,
                                                            Clock::time_point now);

    // Returned nodes keep the tree alive after this snapshot is replaced or dropped.
    Result<SnapshotNodeRef> look_up_node(const std::string& relative_path);
    Result<SnapshotNodeRef> get_directory_node_with_lru(const std::string& relative_path);

    // True iff this run resumed from a persisted snapshot. On a fresh run every
    // node is new, so callers can skip existence checks.
    bool was_snapshot_loaded() const { return loaded_from_snapshot_; }

    const std::string& repo_key() const { return tree_->repo_key(); }
    Clock::time_point last_save_time() const { return last_save_time_; }

    // Advance the checkpoint timestamp. Never moves it backwards.
    void mark_saved(Clock::time_point when);

    // Shared so a checkpoint can finish writing even if the snapshot is
    // replaced or disabled meanwhile.
    std::shared_ptr<SnapshotTree> tree() const { return tree_; }

private:
    RepoTransferSnapshot(std::shared_ptr<SnapshotTree> tree, Clock::time_point last_save,
                         bool loaded);

    Result<SnapshotNodeRef> share(Result<SnapshotNode*> found) const;

    std::shared_ptr<SnapshotTree> tree_;
    Clock::time_point last_save_time_{};
    bool loaded_from_snapshot_ = false;
};
