#pragma once

#include <string>
#include <deque>
#include <chrono>
#include <cstdint>

// Average transfer speed over a sliding window, and the remaining time it implies.
// Not thread-safe; TransferStateManager guards it with its state mutex.
class TransferEstimator {
public:
    using Clock = std::chrono::system_clock;

    explicit TransferEstimator(std::chrono::seconds window);

    // Record bytes that finished transferring at `now`.
    void add_chunk(int64_t bytes, Clock::time_point now);

    // Bytes per second over the window, 0 until enough samples exist.
    double speed_bytes_per_sec(Clock::time_point now);

    // "12.345 MB/s", or "Not available yet"
    std::string speed_string(Clock::time_point now);

    // "About 3 hours", or "Not available yet"
    std::string remaining_time_string(int64_t remaining_bytes, Clock::time_point now);

private:
    void drop_expired(Clock::time_point now);

    struct Sample {
        Clock::time_point at;
        int64_t bytes;
    };

    std::chrono::seconds window_;
    std::deque<Sample> samples_;
    int64_t window_bytes_ = 0;
};
