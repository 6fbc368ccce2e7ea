#include <iostream>
#include <string>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/directory_structure.hpp"
#include "managers/transfer_status.hpp"

static void print_usage() {
    std::cout << theme::banner(REPOMOVE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    repomove status"
              << theme::color::RESET << theme::color::DIM
              << "       Show the progress of the running transfer" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    repomove config"
              << theme::color::RESET << theme::color::DIM
              << "       Create the default config and show settings" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    repomove --version     Show version\n"
              << "    repomove --help        Show this help"
              << theme::color::RESET << "\n\n";
}

static int run_status(const Config& config) {
    TransferPaths paths{config.transfer().state_dir};
    auto report = render_transfer_status(paths);
    if (report.is_err()) {
        std::cout << theme::fail(report.error);
        return 1;
    }
    std::cout << report.value;
    return 0;
}

static int run_config() {
    auto root = Config::get_repomove_root();
    bool existed = fs::exists(get_config_path(root));
    auto created = create_default_config(root);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    if (!existed) {
        std::cout << theme::ok("Wrote default config to " + get_config_path(root).string());
    }

    auto config = Config::load(root);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }

    const auto& t = config.value.transfer();
    std::cout << theme::section("Configuration");
    std::cout << theme::kv("File", get_config_path(root).string(), 16);
    std::cout << theme::kv("State dir", t.state_dir.string(), 16);
    std::cout << theme::kv("Checkpoint", std::to_string(t.snapshot_save_interval_minutes) + " min", 16);
    std::cout << theme::kv("Publish", std::to_string(t.state_persist_interval_seconds) + " s", 16);
    std::cout << theme::kv("LRU capacity", std::to_string(t.lru_capacity), 16);
    std::cout << theme::kv("Speed window", std::to_string(t.speed_window_seconds) + " s", 16);
    std::cout << "\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "repomove"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << REPOMOVE_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "config") {
            return run_config();
        } else if (cmd == "status") {
            auto config = Config::load();
            if (config.is_err()) {
                std::cout << theme::fail(config.error);
                return 1;
            }
            return run_status(config.value);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
