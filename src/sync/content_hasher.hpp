#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <filesystem>
#include <core/types.hpp>

class CancellationToken;

// Streaming SHA-256 of a file's bytes as lowercase hex.
// Reads in fixed-size chunks; the token is polled between chunks.
// Throws CancelledError on cancellation, std::runtime_error on I/O failure.
std::string sha256_file(const std::filesystem::path& path, const CancellationToken& token);

// Hash every file. Keyed by LocalFile::absolute_path.
// Stops at the first error or cancellation (propagated as an exception).
std::unordered_map<std::string, std::string> compute_hashes(
    const std::vector<LocalFile>& files,
    const CancellationToken& token,
    const StatusCallback& callback = nullptr);
