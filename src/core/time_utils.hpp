#pragma once

#include <string>
#include <chrono>

// Format an elapsed wall-clock duration for the sync summary.
// Under a minute: one decimal of seconds ("0.4s", "12.3s").
// Otherwise "2m05s" or "1h02m".
std::string format_elapsed(std::chrono::milliseconds elapsed);

// Upper bound for a single retry delay
constexpr std::chrono::milliseconds MAX_BACKOFF{60LL * 60 * 1000};

// Backoff delay before the given zero-based attempt: base * 2^(attempt-1),
// capped at MAX_BACKOFF. Attempt 0 has no delay.
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, int attempt);
