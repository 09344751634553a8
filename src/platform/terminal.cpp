#include "terminal.hpp"

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#else
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    if (GetFileType(h) != FILE_TYPE_CHAR) {
        // Pipes and files are always "ready"; the read itself reports EOF
        return true;
    }
    DWORD result = WaitForSingleObject(h, timeout_ms);
    if (result == WAIT_OBJECT_0) {
        // Check that there's actual input (not just a window event)
        INPUT_RECORD rec;
        DWORD count;
        while (PeekConsoleInputW(h, &rec, 1, &count) && count > 0) {
            if (rec.EventType == KEY_EVENT && rec.Event.KeyEvent.bKeyDown)
                return true;
            // Consume non-key events
            ReadConsoleInputW(h, &rec, 1, &count);
        }
        return false;
    }
    return false;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
#endif
}

} // namespace platform
