#include "state_store.hpp"
#include <core/file_io.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

TransferStateStore::TransferStateStore(TransferPaths paths)
    : paths_(std::move(paths)) {}

// ── Encoding ────────────────────────────────────────────────

static void emit_progress(YAML::Emitter& out, const char* key, const PhaseProgress& p) {
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "transferred_units" << YAML::Value << p.transferred_units;
    out << YAML::Key << "total_units" << YAML::Value << p.total_units;
    out << YAML::Key << "transferred_size_bytes" << YAML::Value << p.transferred_size_bytes;
    out << YAML::Key << "total_size_bytes" << YAML::Value << p.total_size_bytes;
    out << YAML::EndMap;
}

static PhaseProgress parse_progress(const YAML::Node& n) {
    PhaseProgress p;
    if (!n || !n.IsMap()) return p;
    p.transferred_units = n["transferred_units"].as<int64_t>(0);
    p.total_units = n["total_units"].as<int64_t>(0);
    p.transferred_size_bytes = n["transferred_size_bytes"].as<int64_t>(0);
    p.total_size_bytes = n["total_size_bytes"].as<int64_t>(0);
    return p;
}

std::string run_status_to_yaml(const TransferRunStatus& s) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "start_time" << YAML::Value << s.start_time;
    out << YAML::Key << "total_transferred_bytes" << YAML::Value << s.total_transferred_bytes;
    out << YAML::Key << "total_bytes" << YAML::Value << s.total_bytes;
    out << YAML::Key << "transferred_repositories" << YAML::Value << s.transferred_repositories;
    out << YAML::Key << "total_repositories" << YAML::Value << s.total_repositories;
    out << YAML::Key << "working_threads" << YAML::Value << s.working_threads;
    out << YAML::Key << "transfer_failures" << YAML::Value << s.transfer_failures;
    out << YAML::Key << "speed" << YAML::Value << s.speed;
    out << YAML::Key << "estimated_remaining" << YAML::Value << s.estimated_remaining;
    out << YAML::Key << "current_repo_key" << YAML::Value << s.current_repo_key;
    out << YAML::Key << "current_repo_phase" << YAML::Value << phase_name(s.current_repo_phase);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<TransferRunStatus> run_status_from_yaml(const std::string& yaml) {
    try {
        const YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            return Result<TransferRunStatus>::Err("run status is not a YAML map", ErrorCode::Parse);
        }

        TransferRunStatus s;
        s.start_time = root["start_time"].as<std::string>("");
        s.total_transferred_bytes = root["total_transferred_bytes"].as<int64_t>(0);
        s.total_bytes = root["total_bytes"].as<int64_t>(0);
        s.transferred_repositories = root["transferred_repositories"].as<int64_t>(0);
        s.total_repositories = root["total_repositories"].as<int64_t>(0);
        s.working_threads = root["working_threads"].as<int>(0);
        s.transfer_failures = root["transfer_failures"].as<uint32_t>(0);
        s.speed = root["speed"].as<std::string>("");
        s.estimated_remaining = root["estimated_remaining"].as<std::string>("");
        s.current_repo_key = root["current_repo_key"].as<std::string>("");

        std::string phase = root["current_repo_phase"].as<std::string>("phase1");
        auto parsed = parse_phase(phase);
        if (!parsed) {
            return Result<TransferRunStatus>::Err("unknown phase '" + phase + "'", ErrorCode::Parse);
        }
        s.current_repo_phase = *parsed;
        return Result<TransferRunStatus>::Ok(s);
    } catch (const std::exception& e) {
        return Result<TransferRunStatus>::Err(std::string("malformed run status: ") + e.what(),
                                              ErrorCode::Parse);
    }
}

std::string repo_state_to_yaml(const RepoTransferState& s) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "repo_key" << YAML::Value << s.repo_key;
    out << YAML::Key << "phase" << YAML::Value << phase_name(s.phase);
    emit_progress(out, "phase1", s.phase1);
    emit_progress(out, "phase3", s.phase3);
    out << YAML::Key << "full_transfer_started" << YAML::Value << s.full_transfer_started;
    out << YAML::Key << "full_transfer_ended" << YAML::Value << s.full_transfer_ended;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<RepoTransferState> repo_state_from_yaml(const std::string& yaml) {
    try {
        const YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            return Result<RepoTransferState>::Err("repository state is not a YAML map",
                                                  ErrorCode::Parse);
        }

        RepoTransferState s;
        s.repo_key = root["repo_key"].as<std::string>("");

        std::string phase = root["phase"].as<std::string>("phase1");
        auto parsed = parse_phase(phase);
        if (!parsed) {
            return Result<RepoTransferState>::Err("unknown phase '" + phase + "'", ErrorCode::Parse);
        }
        s.phase = *parsed;
        s.phase1 = parse_progress(root["phase1"]);
        s.phase3 = parse_progress(root["phase3"]);
        s.full_transfer_started = root["full_transfer_started"].as<std::string>("");
        s.full_transfer_ended = root["full_transfer_ended"].as<std::string>("");
        return Result<RepoTransferState>::Ok(s);
    } catch (const std::exception& e) {
        return Result<RepoTransferState>::Err(std::string("malformed repository state: ") + e.what(),
                                              ErrorCode::Parse);
    }
}

// ── Files ───────────────────────────────────────────────────

Result<std::optional<TransferRunStatus>> TransferStateStore::load_run_status() const {
    using R = Result<std::optional<TransferRunStatus>>;

    auto content = read_file_if_exists(paths_.run_status_file());
    if (content.is_err()) return R::Err(content.error, content.code);
    if (!content.value) return R::Ok(std::nullopt);

    auto parsed = run_status_from_yaml(*content.value);
    if (parsed.is_err()) {
        return R::Err(fmt::format("{}: {}", paths_.run_status_file().string(), parsed.error),
                      parsed.code);
    }
    return R::Ok(parsed.value);
}

Result<void> TransferStateStore::save_run_status(const TransferRunStatus& status) const {
    return write_file_atomic(paths_.run_status_file(), run_status_to_yaml(status));
}

Result<std::optional<RepoTransferState>>
TransferStateStore::load_repo_state(const std::string& repo_key) const {
    using R = Result<std::optional<RepoTransferState>>;

    auto path = paths_.repo_state_file(repo_key);
    auto content = read_file_if_exists(path);
    if (content.is_err()) return R::Err(content.error, content.code);
    if (!content.value) return R::Ok(std::nullopt);

    auto parsed = repo_state_from_yaml(*content.value);
    if (parsed.is_err()) {
        return R::Err(fmt::format("{}: {}", path.string(), parsed.error), parsed.code);
    }
    if (parsed.value.repo_key != repo_key) {
        return R::Err(fmt::format("{} belongs to repository '{}', expected '{}'",
                                  path.string(), parsed.value.repo_key, repo_key),
                      ErrorCode::Parse);
    }
    return R::Ok(parsed.value);
}

Result<void> TransferStateStore::save_repo_state(const RepoTransferState& state) const {
    if (state.repo_key.empty()) {
        return Result<void>::Err("cannot save the state of a repository without a key",
                                 ErrorCode::InvalidArgument);
    }
    return write_file_atomic(paths_.repo_state_file(state.repo_key), repo_state_to_yaml(state));
}
