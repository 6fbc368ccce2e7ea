#include "transfer_status.hpp"
#include "state_store.hpp"
#include "transfer_state_manager.hpp"
#include <core/constants.hpp>
#include <cli/theme.hpp>
#include <fmt/format.h>

static constexpr const char* SIZE_UNITS = "KMGTPE";
static constexpr int KEY_WIDTH = 28;

std::string size_to_string(int64_t bytes) {
    if (bytes < 0) bytes = 0;
    int64_t divider = 1024;
    int index = 0;
    // divider << 10 tops out at 2^60 for EiB, still within int64_t
    while (index < 5 && bytes >= (divider << 10)) {
        divider <<= 10;
        index++;
    }
    return fmt::format("{:.1f} {}iB", static_cast<double>(bytes) / static_cast<double>(divider),
                       SIZE_UNITS[index]);
}

std::string calc_percentage(int64_t transferred, int64_t total) {
    if (transferred == 0 || total == 0) return "";
    return fmt::format(" ({:.1f}%)",
                       static_cast<double>(transferred) / static_cast<double>(total) * 100.0);
}

static std::string ratio(int64_t transferred, int64_t total) {
    return fmt::format("{} / {}", transferred, total) + calc_percentage(transferred, total);
}

static std::string size_ratio(int64_t transferred, int64_t total) {
    return size_to_string(transferred) + " / " + size_to_string(total) +
           calc_percentage(transferred, total);
}

static std::string row(const std::string& key, const std::string& value) {
    return theme::kv(key + ":", value, KEY_WIDTH);
}

static void render_overall(std::string& out, const TransferRunStatus& run,
                           const std::string& running_for) {
    out += theme::section("Overall Transfer Status");
    out += row("Status", theme::green("Running"));
    out += row("Running for", running_for);
    out += row("Storage", size_ratio(run.total_transferred_bytes, run.total_bytes));
    out += row("Repositories", ratio(run.transferred_repositories, run.total_repositories));
    out += row("Working threads", std::to_string(run.working_threads));
    out += row("Transfer speed", run.speed.empty() ? "Not available yet" : run.speed);
    out += row("Estimated time remaining",
               run.estimated_remaining.empty() ? "Not available yet" : run.estimated_remaining);

    std::string failures = std::to_string(run.transfer_failures);
    if (run.transfer_failures > 0) {
        failures += fmt::format(" ({})", RETRY_FAILURE_NOTE);
    }
    out += row("Transfer failures", failures);
}

static void render_repository(std::string& out, const RepoTransferState& repo) {
    out += theme::section("Current Repository Status");
    out += row("Name", repo.repo_key);
    out += row("Phase", phase_description(repo.phase));

    switch (repo.phase) {
        case TransferPhase::Phase1:
        case TransferPhase::Phase3: {
            // Phase 3 shows its own retry counters, not the Phase 1 totals.
            const PhaseProgress& p =
                repo.phase == TransferPhase::Phase1 ? repo.phase1 : repo.phase3;
            out += row("Storage", size_ratio(p.transferred_size_bytes, p.total_size_bytes));
            out += row("Files", ratio(p.transferred_units, p.total_units));
            break;
        }
        case TransferPhase::Phase2:
            // No fixed total in the delta phase
            out += row("Progress", "In progress");
            break;
    }
}

Result<std::string> render_transfer_status(const TransferPaths& paths) {
    auto running = get_running_time(paths);
    if (!running.running) {
        return Result<std::string>::Ok(row("Status", theme::red("Not running")));
    }

    TransferStateStore store(paths);
    auto loaded = store.load_run_status();
    if (loaded.is_err()) return Result<std::string>::Err(loaded.error, loaded.code);
    TransferRunStatus run = loaded.value ? *loaded.value : TransferRunStatus{};

    std::string out;
    render_overall(out, run, running.duration);

    if (!run.current_repo_key.empty()) {
        auto repo = store.load_repo_state(run.current_repo_key);
        if (repo.is_err()) return Result<std::string>::Err(repo.error, repo.code);
        if (!repo.value) {
            return Result<std::string>::Err(
                fmt::format("could not find the state file of repository '{}'. Aborting",
                            run.current_repo_key),
                ErrorCode::MissingStateFile);
        }
        render_repository(out, *repo.value);
    }

    return Result<std::string>::Ok(out);
}
