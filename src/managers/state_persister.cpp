#include "state_persister.hpp"
#include "transfer_state_manager.hpp"
#include "transfer_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

StatePersister::StatePersister(TransferStateManager& manager, std::chrono::seconds interval)
    : manager_(manager),
      interval_(interval.count() > 0 ? interval : std::chrono::seconds(STATE_PERSIST_INTERVAL_SECS)) {}

StatePersister::StatePersister(TransferStateManager& manager, const TransferSettings& settings)
    : StatePersister(manager, std::chrono::seconds(settings.state_persist_interval_seconds)) {}

StatePersister::~StatePersister() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool StatePersister::start() {
    if (running_) return true;

    running_ = true;
    thread_ = std::thread(&StatePersister::persister_loop, this);
    repomove_log(fmt::format("state_persister: started, every {}s", interval_.count()));
    return true;
}

void StatePersister::stop() {
    if (!running_) return;

    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }

    // Final write so the last counters are not lost.
    auto result = manager_.persist_transfer_state();
    if (result.is_err()) {
        repomove_log("state_persister: final write failed: " + result.error);
    }
    repomove_log("state_persister: stopped");
}

// ── Loop ────────────────────────────────────────────────────

void StatePersister::persister_loop() {
    auto next = std::chrono::steady_clock::now() + interval_;
    while (running_) {
        // Short ticks keep stop() responsive.
        platform::sleep_ms(STATE_PERSISTER_TICK_MS);
        if (std::chrono::steady_clock::now() < next) continue;
        next = std::chrono::steady_clock::now() + interval_;

        auto result = manager_.persist_transfer_state();
        if (result.is_err()) {
            repomove_log("state_persister: write failed: " + result.error);
        }
    }
}
