#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Settings of the transfer state subsystem (`transfer:` block of config.yaml).
struct TransferSettings {
    fs::path state_dir;                      // default <root>/transfer
    int snapshot_save_interval_minutes = 10;
    int state_persist_interval_seconds = 10;
    int64_t lru_capacity = 10000;
    int speed_window_seconds = 120;
};

class Config {
public:
    // Load config from <root>/config.yaml. A missing file yields defaults.
    static Result<Config> load(const fs::path& root = get_repomove_root());

    // Parse config from YAML text. state_dir defaults relative to root.
    static Result<Config> parse(const std::string& yaml, const fs::path& root);

    const TransferSettings& transfer() const { return transfer_; }
    const fs::path& root() const { return root_; }

    Config() = default;

    // Root of all repomove files: $REPOMOVE_HOME, else ~/.repomove
    static fs::path get_repomove_root();

private:
    TransferSettings transfer_;
    fs::path root_;
};

fs::path get_config_path(const fs::path& root = Config::get_repomove_root());

// Create default config if none exists. Does not overwrite.
Result<void> create_default_config(const fs::path& root = Config::get_repomove_root());
