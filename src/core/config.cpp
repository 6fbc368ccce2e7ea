#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path Config::get_repomove_root() {
    const char* env_root = std::getenv("REPOMOVE_HOME");
    if (env_root && *env_root) return fs::path(env_root);
    return platform::home_dir() / ".repomove";
}

fs::path get_config_path(const fs::path& root) {
    return root / "config.yaml";
}

Result<void> create_default_config(const fs::path& root) {
    fs::path config_path = get_config_path(root);

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# repomove configuration

transfer:
  # Directory holding run status, repository states and tree snapshots.
  # Empty means <root>/transfer.
  state_dir: ""
  # Minimum time between two checkpoints of the tree snapshot.
  snapshot_save_interval_minutes: 10
  # How often the running transfer publishes its counters for `repomove status`.
  state_persist_interval_seconds: 10
  # Directory nodes kept in the snapshot lookup cache.
  lru_capacity: 10000
  # Sliding window used for the transfer speed.
  speed_window_seconds: 120
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string(),
                                     ErrorCode::Io);
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()),
                                 ErrorCode::Io);
    }
}

// Missing keys fall back; present keys of the wrong type throw.
template <typename T>
static T value_or(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node v = node[key];
    if (!v || v.IsNull()) return fallback;
    return v.as<T>();
}

static Result<TransferSettings> parse_transfer_settings(const YAML::Node& node,
                                                        const fs::path& root) {
    TransferSettings s;
    s.state_dir = root / "transfer";
    if (!node || node.IsNull()) return Result<TransferSettings>::Ok(s);
    if (!node.IsMap()) {
        return Result<TransferSettings>::Err("'transfer' must be a map", ErrorCode::Parse);
    }

    std::string state_dir = value_or<std::string>(node, "state_dir", "");
    if (!state_dir.empty()) {
        fs::path p(state_dir);
        s.state_dir = p.is_absolute() ? p : root / p;
    }
    s.snapshot_save_interval_minutes =
        value_or<int>(node, "snapshot_save_interval_minutes", SNAPSHOT_SAVE_INTERVAL_MIN);
    s.state_persist_interval_seconds =
        value_or<int>(node, "state_persist_interval_seconds", STATE_PERSIST_INTERVAL_SECS);
    s.lru_capacity = value_or<int64_t>(node, "lru_capacity", DEFAULT_LRU_CAPACITY);
    s.speed_window_seconds = value_or<int>(node, "speed_window_seconds", SPEED_WINDOW_SECS);

    if (s.snapshot_save_interval_minutes < 0) {
        return Result<TransferSettings>::Err(
            fmt::format("snapshot_save_interval_minutes must not be negative (got {})",
                        s.snapshot_save_interval_minutes),
            ErrorCode::InvalidArgument);
    }
    if (s.state_persist_interval_seconds <= 0) {
        return Result<TransferSettings>::Err(
            fmt::format("state_persist_interval_seconds must be positive (got {})",
                        s.state_persist_interval_seconds),
            ErrorCode::InvalidArgument);
    }
    if (s.lru_capacity <= 0) {
        return Result<TransferSettings>::Err(
            fmt::format("lru_capacity must be positive (got {})", s.lru_capacity),
            ErrorCode::InvalidArgument);
    }
    if (s.speed_window_seconds <= 0) {
        return Result<TransferSettings>::Err(
            fmt::format("speed_window_seconds must be positive (got {})", s.speed_window_seconds),
            ErrorCode::InvalidArgument);
    }
    return Result<TransferSettings>::Ok(s);
}

Result<Config> Config::parse(const std::string& yaml, const fs::path& root) {
    try {
        const YAML::Node doc = YAML::Load(yaml);

        Config config;
        config.root_ = root;

        auto transfer = parse_transfer_settings(doc["transfer"], root);
        if (transfer.is_err()) {
            return Result<Config>::Err("Invalid config: " + transfer.error, transfer.code);
        }
        config.transfer_ = transfer.value;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorCode::Parse);
    }
}

Result<Config> Config::load(const fs::path& root) {
    fs::path path = get_config_path(root);
    if (!fs::exists(path)) {
        return parse("", root);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to read config file " + path.string(), ErrorCode::Io);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), root);
}
