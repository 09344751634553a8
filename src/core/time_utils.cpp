#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    long long ms = elapsed.count();
    if (ms < 0) ms = 0;

    if (ms < 60 * 1000) {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }

    long long seconds = ms / 1000;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{:02}m", hours, mins);
    }
    return fmt::format("{}m{:02}s", mins, secs);
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, int attempt) {
    if (attempt <= 0 || base.count() <= 0) return std::chrono::milliseconds(0);
    // Doubling stops once the delay reaches MAX_BACKOFF
    if (base >= MAX_BACKOFF) return MAX_BACKOFF;
    std::chrono::milliseconds delay = base;
    for (int i = 1; i < attempt; ++i) {
        if (delay >= MAX_BACKOFF / 2) return MAX_BACKOFF;
        delay *= 2;
    }
    return delay;
}
