#include "snapshot_tree.hpp"
#include <core/file_io.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <sstream>
#include <stdexcept>

// ── SnapshotNode ────────────────────────────────────────────

SnapshotNode::SnapshotNode(std::string name, SnapshotNode* parent)
    : name_(std::move(name)), parent_(parent) {}

std::string SnapshotNode::relative_path() const {
    if (!parent_) return "";
    std::string parent_path = parent_->relative_path();
    return parent_path.empty() ? name_ : parent_path + "/" + name_;
}

void SnapshotNode::increment_files_count(int64_t file_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_count_++;
    total_files_size_ += file_size;
}

Result<void> SnapshotNode::decrement_files_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (files_count_ == 0) {
        return Result<void>::Err(
            fmt::format("files count of '{}' is already zero", name_), ErrorCode::InvalidArgument);
    }
    files_count_--;
    return Result<void>::Ok();
}

int64_t SnapshotNode::files_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_count_;
}

int64_t SnapshotNode::total_files_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_files_size_;
}

void SnapshotNode::mark_done_exploring() {
    std::lock_guard<std::mutex> lock(mutex_);
    done_exploring_ = true;
}

bool SnapshotNode::done_exploring() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_exploring_;
}

bool SnapshotNode::is_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool SnapshotNode::check_completed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) return true;
        if (!done_exploring_ || files_count_ > 0) return false;
        for (const auto& [name, c] : children_) {
            if (!c->is_completed()) return false;
        }
        completed_ = true;
    }
    // Own lock released before walking up; locks are only ever taken parent first.
    if (parent_) parent_->check_completed();
    return true;
}

SnapshotNode* SnapshotNode::child(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(name);
    return it == children_.end() ? nullptr : it->second.get();
}

SnapshotNode* SnapshotNode::get_or_add_child(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = children_[name];
    if (!slot) {
        slot = std::make_unique<SnapshotNode>(name, this);
    }
    return slot.get();
}

std::vector<std::string> SnapshotNode::child_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(children_.size());
    for (const auto& [name, c] : children_) names.push_back(name);
    return names;
}

void SnapshotNode::restore(int64_t files_count, int64_t total_files_size,
                           bool done_exploring, bool completed) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_count_ = files_count;
    total_files_size_ = total_files_size;
    done_exploring_ = done_exploring;
    completed_ = completed;
}

// ── Paths ───────────────────────────────────────────────────

std::vector<std::string> split_relative_path(const std::string& relative_path) {
    std::vector<std::string> parts;
    std::istringstream ss(relative_path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == ".") continue;
        parts.push_back(part);
    }
    return parts;
}

static std::string join_parts(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "/";
        out += p;
    }
    return out;
}

// ── YamlSnapshotTree ────────────────────────────────────────

YamlSnapshotTree::YamlSnapshotTree(std::string repo_key, fs::path snapshot_file,
                                   int64_t lru_capacity)
    : repo_key_(std::move(repo_key)),
      snapshot_file_(std::move(snapshot_file)),
      lru_capacity_(lru_capacity > 0 ? static_cast<size_t>(lru_capacity) : 1),
      root_(std::make_unique<SnapshotNode>("", nullptr)) {}

size_t YamlSnapshotTree::lru_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

void YamlSnapshotTree::lru_touch(const std::string& key, SnapshotNode* node) {
    auto it = lru_.find(key);
    if (it != lru_.end()) {
        lru_order_.erase(it->second.second);
        lru_order_.push_front(key);
        it->second.second = lru_order_.begin();
        return;
    }

    lru_order_.push_front(key);
    lru_.emplace(key, std::make_pair(node, lru_order_.begin()));
    while (lru_.size() > lru_capacity_) {
        lru_.erase(lru_order_.back());
        lru_order_.pop_back();
    }
}

Result<SnapshotNode*> YamlSnapshotTree::look_up_node(const std::string& relative_path) {
    auto parts = split_relative_path(relative_path);
    std::string key = join_parts(parts);

    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = lru_.find(key);
    if (cached != lru_.end()) {
        return Result<SnapshotNode*>::Ok(cached->second.first);
    }

    SnapshotNode* node = root_.get();
    for (const auto& part : parts) {
        node = node->child(part);
        if (!node) {
            return Result<SnapshotNode*>::Err(
                fmt::format("repository '{}' has no snapshot node for path '{}'", repo_key_, key),
                ErrorCode::NotFound);
        }
    }
    return Result<SnapshotNode*>::Ok(node);
}

Result<SnapshotNode*> YamlSnapshotTree::get_directory_node_with_lru(const std::string& relative_path) {
    auto parts = split_relative_path(relative_path);
    std::string key = join_parts(parts);

    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = lru_.find(key);
    if (cached != lru_.end()) {
        SnapshotNode* node = cached->second.first;
        lru_touch(key, node);
        return Result<SnapshotNode*>::Ok(node);
    }

    SnapshotNode* node = root_.get();
    for (const auto& part : parts) {
        node = node->get_or_add_child(part);
    }
    lru_touch(key, node);
    return Result<SnapshotNode*>::Ok(node);
}

static void emit_node(YAML::Emitter& out, const SnapshotNode& node) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << node.name();
    out << YAML::Key << "files_count" << YAML::Value << node.files_count();
    out << YAML::Key << "total_files_size" << YAML::Value << node.total_files_size();
    out << YAML::Key << "done_exploring" << YAML::Value << node.done_exploring();
    out << YAML::Key << "completed" << YAML::Value << node.is_completed();

    auto names = node.child_names();
    if (!names.empty()) {
        out << YAML::Key << "children" << YAML::Value << YAML::BeginSeq;
        for (const auto& name : names) {
            if (const SnapshotNode* c = node.child(name)) emit_node(out, *c);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

static void parse_node(const YAML::Node& n, SnapshotNode& node) {
    node.restore(n["files_count"].as<int64_t>(0),
                 n["total_files_size"].as<int64_t>(0),
                 n["done_exploring"].as<bool>(false),
                 n["completed"].as<bool>(false));

    const YAML::Node children = n["children"];
    if (!children) return;
    if (!children.IsSequence()) {
        throw std::runtime_error("children of '" + node.name() + "' must be a sequence");
    }
    for (const auto& c : children) {
        std::string name = c["name"].as<std::string>("");
        if (name.empty()) {
            throw std::runtime_error("unnamed child under '" + node.name() + "'");
        }
        parse_node(c, *node.get_or_add_child(name));
    }
}

Result<void> YamlSnapshotTree::persist() {
    std::string content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "repo_key" << YAML::Value << repo_key_;
        out << YAML::Key << "root" << YAML::Value;
        emit_node(out, *root_);
        out << YAML::EndMap;
        if (!out.good()) {
            return Result<void>::Err("failed to encode snapshot of '" + repo_key_ + "': " +
                                     out.GetLastError(), ErrorCode::Generic);
        }
        content = std::string(out.c_str()) + "\n";
    }
    return write_file_atomic(snapshot_file_, content);
}

Result<std::unique_ptr<YamlSnapshotTree>> YamlSnapshotTree::load(const std::string& repo_key,
                                                                  const fs::path& snapshot_file,
                                                                  int64_t lru_capacity) {
    using R = Result<std::unique_ptr<YamlSnapshotTree>>;

    auto content = read_file_if_exists(snapshot_file);
    if (content.is_err()) return R::Err(content.error, content.code);
    if (!content.value) return R::Ok(nullptr);

    try {
        const YAML::Node doc = YAML::Load(*content.value);
        if (!doc.IsMap() || !doc["root"] || !doc["root"].IsMap()) {
            return R::Err(snapshot_file.string() + ": snapshot has no root node", ErrorCode::Parse);
        }
        std::string stored_key = doc["repo_key"].as<std::string>("");
        if (stored_key != repo_key) {
            return R::Err(fmt::format("{}: snapshot belongs to repository '{}', expected '{}'",
                                      snapshot_file.string(), stored_key, repo_key),
                          ErrorCode::Parse);
        }

        auto tree = std::make_unique<YamlSnapshotTree>(repo_key, snapshot_file, lru_capacity);
        parse_node(doc["root"], *tree->root_);
        return R::Ok(std::move(tree));
    } catch (const std::exception& e) {
        return R::Err(fmt::format("{}: malformed snapshot: {}", snapshot_file.string(), e.what()),
                      ErrorCode::Parse);
    }
}

// ── Factory ─────────────────────────────────────────────────

std::unique_ptr<SnapshotTree> YamlSnapshotTreeFactory::create(const std::string& repo_key,
                                                              const fs::path& snapshot_file) {
    return std::make_unique<YamlSnapshotTree>(repo_key, snapshot_file, lru_capacity_);
}

Result<std::unique_ptr<SnapshotTree>>
YamlSnapshotTreeFactory::load(const std::string& repo_key, const fs::path& snapshot_file) {
    using R = Result<std::unique_ptr<SnapshotTree>>;

    auto loaded = YamlSnapshotTree::load(repo_key, snapshot_file, lru_capacity_);
    if (loaded.is_err()) return R::Err(loaded.error, loaded.code);
    return R::Ok(std::unique_ptr<SnapshotTree>(std::move(loaded.value)));
}
