#pragma once
#include <string>

// RAII run marker. Ensures only one transfer runs against a state directory
// and lets other processes (e.g. `repomove status`) see that one is running.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash).
// While held, the file contains the ISO start time of the run.
class RunLock {
public:
    // Attempts to acquire the lock and records start_time. Check held() after construction.
    RunLock(const std::string& lock_path, const std::string& start_time);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    struct Probe {
        bool running = false;
        std::string start_time;     // "" when not running
    };

    // Check, without taking it, whether some process holds the lock at lock_path.
    // A missing lock file means nothing is running.
    static Probe probe(const std::string& lock_path);

private:
    int fd_ = -1;
};
