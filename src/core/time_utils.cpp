#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

static bool parse_iso(const char* s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time.c_str(), &start_tm)) {
        return "?";
    }
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time.c_str(), &end_tm)) {
            return "?";
        }
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_seconds_literal(int64_t seconds) {
    if (seconds < 60) return "Less than a minute";

    int64_t mins = seconds / 60;
    if (mins < 60) {
        return mins == 1 ? "About 1 minute" : fmt::format("About {} minutes", mins);
    }

    int64_t hours = mins / 60;
    if (hours < 24) {
        return hours == 1 ? "About 1 hour" : fmt::format("About {} hours", hours);
    }

    int64_t days = hours / 24;
    return days == 1 ? "About 1 day" : fmt::format("About {} days", days);
}
