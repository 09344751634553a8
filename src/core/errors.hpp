#pragma once

#include <stdexcept>
#include <string>

// Thrown by blocking setup steps (hashing) once the run's cancellation token
// fires. Not a failure: callers map it to the user-cancelled exit code.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what = "Operation cancelled by user")
        : std::runtime_error(what) {}
};
