#pragma once

#include <string>

class CancellationToken;

enum class ConfirmResult { Yes, No, Interrupted };

// Only "yes" (any case, surrounding whitespace ignored) approves
bool is_affirmative(const std::string& answer);

// Ask before mutating the remote store. Polls stdin so an interrupt
// delivered while waiting is noticed; EOF counts as "no".
ConfirmResult confirm_sync(const CancellationToken& token);
