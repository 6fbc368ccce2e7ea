#pragma once

#include <string>
#include <vector>
#include <map>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

// A directory of the remote repository tree. Owned by its tree: raw pointers
// stay valid for the lifetime of the tree only. Code outside the tree holds a
// SnapshotNodeRef, which keeps the whole tree alive.
// Every node guards its own fields; parents are locked before children.
class SnapshotNode {
public:
    SnapshotNode(std::string name, SnapshotNode* parent);

    SnapshotNode(const SnapshotNode&) = delete;
    SnapshotNode& operator=(const SnapshotNode&) = delete;

    const std::string& name() const { return name_; }
    SnapshotNode* parent() const { return parent_; }

    // Path relative to the repository root ("" for the root itself).
    std::string relative_path() const;

    // Files discovered in this directory that are not handled yet.
    void increment_files_count(int64_t file_size);
    Result<void> decrement_files_count();
    int64_t files_count() const;
    int64_t total_files_size() const;

    // The walker listed every entry of this directory.
    void mark_done_exploring();
    bool done_exploring() const;

    // A node completes once it is done exploring, has no pending files and all
    // its children are completed. Completion propagates to the parent.
    bool is_completed() const;
    bool check_completed();

    SnapshotNode* child(const std::string& name) const;
    SnapshotNode* get_or_add_child(const std::string& name);
    std::vector<std::string> child_names() const;

    // Restore persisted fields. Used by tree loaders only.
    void restore(int64_t files_count, int64_t total_files_size,
                 bool done_exploring, bool completed);

private:
    const std::string name_;
    SnapshotNode* const parent_;

    mutable std::mutex mutex_;
    int64_t files_count_ = 0;
    int64_t total_files_size_ = 0;
    bool done_exploring_ = false;
    bool completed_ = false;
    std::map<std::string, std::unique_ptr<SnapshotNode>> children_;
};

// Node handle sharing ownership of its tree.
using SnapshotNodeRef = std::shared_ptr<SnapshotNode>;

// Capability interface over the directory-tree snapshot of one repository.
// Implementations are independently thread-safe.
class SnapshotTree {
public:
    virtual ~SnapshotTree() = default;

    virtual const std::string& repo_key() const = 0;

    // Resolve a known path. NotFound error if the tree has no such node.
    virtual Result<SnapshotNode*> look_up_node(const std::string& relative_path) = 0;

    // Resolve a path, creating missing nodes, through the lookup cache.
    virtual Result<SnapshotNode*> get_directory_node_with_lru(const std::string& relative_path) = 0;

    // Write the whole tree to its snapshot file.
    virtual Result<void> persist() = 0;
};

// Creates or loads trees. load() yields a null pointer when no snapshot was persisted.
class SnapshotTreeFactory {
public:
    virtual ~SnapshotTreeFactory() = default;

    virtual std::unique_ptr<SnapshotTree> create(const std::string& repo_key,
                                                 const fs::path& snapshot_file) = 0;
    virtual Result<std::unique_ptr<SnapshotTree>> load(const std::string& repo_key,
                                                       const fs::path& snapshot_file) = 0;
};

// Split "a/b//c/" into {"a", "b", "c"}. "", "/" and "." denote the root.
std::vector<std::string> split_relative_path(const std::string& relative_path);

// ── YAML-backed implementation ─────────────────────────────

class YamlSnapshotTree : public SnapshotTree {
public:
    YamlSnapshotTree(std::string repo_key, fs::path snapshot_file, int64_t lru_capacity);

    const std::string& repo_key() const override { return repo_key_; }
    Result<SnapshotNode*> look_up_node(const std::string& relative_path) override;
    Result<SnapshotNode*> get_directory_node_with_lru(const std::string& relative_path) override;
    Result<void> persist() override;

    SnapshotNode& root() { return *root_; }
    size_t lru_size() const;

    static Result<std::unique_ptr<YamlSnapshotTree>> load(const std::string& repo_key,
                                                          const fs::path& snapshot_file,
                                                          int64_t lru_capacity);

private:
    void lru_touch(const std::string& key, SnapshotNode* node);

    const std::string repo_key_;
    const fs::path snapshot_file_;
    const size_t lru_capacity_;

    mutable std::mutex mutex_;
    std::unique_ptr<SnapshotNode> root_;
    std::list<std::string> lru_order_;   // most recent first
    std::unordered_map<std::string,
                       std::pair<SnapshotNode*, std::list<std::string>::iterator>> lru_;
};

class YamlSnapshotTreeFactory : public SnapshotTreeFactory {
public:
    explicit YamlSnapshotTreeFactory(int64_t lru_capacity) : lru_capacity_(lru_capacity) {}

    std::unique_ptr<SnapshotTree> create(const std::string& repo_key,
                                         const fs::path& snapshot_file) override;
    Result<std::unique_ptr<SnapshotTree>> load(const std::string& repo_key,
                                               const fs::path& snapshot_file) override;

private:
    int64_t lru_capacity_;
};
