#pragma once

#include <string>
#include <cstdint>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Literal form of a remaining-time estimate:
// "Less than a minute", "About 1 minute", "About 12 minutes", "About 3 hours", "About 2 days".
std::string format_seconds_literal(int64_t seconds);
