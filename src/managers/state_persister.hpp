#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include <core/config.hpp>

class TransferStateManager;

// Writes the manager's state to disk every interval, so `repomove status`
// in another process sees fresh counters between checkpoints.
class StatePersister {
public:
    StatePersister(TransferStateManager& manager, std::chrono::seconds interval);
    // Interval from state_persist_interval_seconds.
    StatePersister(TransferStateManager& manager, const TransferSettings& settings);
    ~StatePersister();

    bool start();
    void stop();
    bool running() const { return running_; }

private:
    void persister_loop();

    TransferStateManager& manager_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
