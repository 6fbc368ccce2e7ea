#include "repo_transfer_snapshot.hpp"

RepoTransferSnapshot::RepoTransferSnapshot(std::shared_ptr<SnapshotTree> tree,
                                           Clock::time_point last_save, bool loaded)
    : tree_(std::move(tree)), last_save_time_(last_save), loaded_from_snapshot_(loaded) {}

RepoTransferSnapshot RepoTransferSnapshot::create(SnapshotTreeFactory& factory,
                                                  const std::string& repo_key,
                                                  const fs::path& snapshot_file,
                                                  Clock::time_point now) {
    return RepoTransferSnapshot(factory.create(repo_key, snapshot_file), now, false);
}

Result<std::optional<RepoTransferSnapshot>>
RepoTransferSnapshot::load(SnapshotTreeFactory& factory, const std::string& repo_key,
                           const fs::path& snapshot_file, Clock::time_point now) {
    using R = Result<std::optional<RepoTransferSnapshot>>;

    auto loaded = factory.load(repo_key, snapshot_file);
    if (loaded.is_err()) return R::Err(loaded.error, loaded.code);
    if (!loaded.value) return R::Ok(std::nullopt);

    return R::Ok(RepoTransferSnapshot(std::move(loaded.value), now, true));
}

Result<SnapshotNodeRef> RepoTransferSnapshot::share(Result<SnapshotNode*> found) const {
    if (found.is_err()) return Result<SnapshotNodeRef>::Err(found.error, found.code);
    // Aliasing constructor: points at the node, owns the tree.
    return Result<SnapshotNodeRef>::Ok(SnapshotNodeRef(tree_, found.value));
}

Result<SnapshotNodeRef> RepoTransferSnapshot::look_up_node(const std::string& relative_path) {
    return share(tree_->look_up_node(relative_path));
}

Result<SnapshotNodeRef> RepoTransferSnapshot::get_directory_node_with_lru(const std::string& relative_path) {
    return share(tree_->get_directory_node_with_lru(relative_path));
}

void RepoTransferSnapshot::mark_saved(Clock::time_point when) {
    if (when > last_save_time_) last_save_time_ = when;
}
