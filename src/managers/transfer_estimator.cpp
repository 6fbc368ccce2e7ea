#include "transfer_estimator.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

static constexpr const char* NOT_AVAILABLE = "Not available yet";

TransferEstimator::TransferEstimator(std::chrono::seconds window)
    : window_(window.count() > 0 ? window : std::chrono::seconds(SPEED_WINDOW_SECS)) {}

void TransferEstimator::add_chunk(int64_t bytes, Clock::time_point now) {
    if (bytes <= 0) return;
    samples_.push_back({now, bytes});
    window_bytes_ += bytes;
    drop_expired(now);
}

void TransferEstimator::drop_expired(Clock::time_point now) {
    while (!samples_.empty() && now - samples_.front().at > window_) {
        window_bytes_ -= samples_.front().bytes;
        samples_.pop_front();
    }
}

double TransferEstimator::speed_bytes_per_sec(Clock::time_point now) {
    drop_expired(now);
    if (samples_.size() < static_cast<size_t>(MIN_SPEED_SAMPLES)) return 0.0;

    // Measure from the oldest sample still in the window, at least one second.
    auto span = std::chrono::duration_cast<std::chrono::milliseconds>(now - samples_.front().at);
    double secs = std::max(1.0, span.count() / 1000.0);
    return static_cast<double>(window_bytes_) / secs;
}

std::string TransferEstimator::speed_string(Clock::time_point now) {
    double speed = speed_bytes_per_sec(now);
    if (speed <= 0.0) return NOT_AVAILABLE;
    return fmt::format("{:.3f} MB/s", speed / 1e6);
}

std::string TransferEstimator::remaining_time_string(int64_t remaining_bytes,
                                                      Clock::time_point now) {
    double speed = speed_bytes_per_sec(now);
    if (speed <= 0.0 || remaining_bytes < 0) return NOT_AVAILABLE;
    auto seconds = static_cast<int64_t>(std::ceil(static_cast<double>(remaining_bytes) / speed));
    return format_seconds_literal(seconds);
}
