#pragma once

namespace platform {

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read (or is at EOF).
bool poll_stdin(int timeout_ms);

} // namespace platform
